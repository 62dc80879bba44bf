#pragma once

#include <memory>
#include <sheetscape/artifact.hpp>
#include <sheetscape/config.hpp>
#include <sheetscape/pose.hpp>

#include "viewport_partitioner.hpp"

namespace sheetscape
{

// Board extent and placement of the active artifact, shared by every variant.
struct ActiveBoardMetrics
{
    static constexpr double WIDTH           = 7.0;
    static constexpr double HEIGHT          = 5.0;
    static constexpr double EXPANDED_WIDTH  = 11.0;
    static constexpr double EXPANDED_HEIGHT = 9.0;
    static constexpr double EXPANDED_Z      = 2.0;
    static constexpr float  HOVER_SCALE     = 1.1f;
};

Pose active_pose(const LayoutBox& stage, bool expanded);

// Maps an artifact's activation state and inactive rank to a target pose.
// The active case is handled here; subclasses only place inactive boards.
class PlacementStrategy
{
   public:
    virtual ~PlacementStrategy() = default;

    Pose pose(const Artifact&  artifact,
              bool             is_active,
              int              inactive_rank,
              const LayoutBox& stage,
              const LayoutBox& grid,
              bool             hovered,
              bool             expanded = false) const;

    virtual VisualizationStrategy kind() const = 0;

   protected:
    // Unhovered pose; pose() applies the hover scale on top.
    virtual Pose inactive_pose(const Artifact&  artifact,
                               int              rank,
                               const LayoutBox& stage,
                               const LayoutBox& grid,
                               bool             hovered) const = 0;
};

// Columns of boards to the right of the stage, receding per column.
class SidebarPlacement : public PlacementStrategy
{
   public:
    static constexpr int    ROWS_PER_COLUMN = 5;
    static constexpr double ROW_PITCH       = 1.8;
    static constexpr double COLUMN_PITCH    = 2.4;
    static constexpr double COLUMN_DEPTH    = 1.5;
    static constexpr double RANK_DEPTH      = 0.2;
    static constexpr float  SCALE           = 0.3f;

    VisualizationStrategy kind() const override { return VisualizationStrategy::Sidebar; }

   protected:
    Pose inactive_pose(const Artifact&  artifact,
                       int              rank,
                       const LayoutBox& stage,
                       const LayoutBox& grid,
                       bool             hovered) const override;
};

// Title strips stacked top-down over the grid box, rank 0 on top. Only the
// band above the bottom-anchored spreadsheet is used; when it is full the
// next ranks start a new layer behind.
class TabsPlacement : public PlacementStrategy
{
   public:
    static constexpr double STRIP_WIDTH     = 6.0;
    static constexpr double STRIP_HEIGHT    = 1.5;
    static constexpr double SLOT_PITCH      = 0.7;
    static constexpr double FRONT_Z         = 0.5;
    static constexpr double RANK_DEPTH      = 0.01;
    static constexpr double SURFACE_RESERVE = 6.0;
    static constexpr double LAYER_SHIFT     = 0.3;
    static constexpr double LAYER_DEPTH     = 0.4;
    static constexpr float  SCALE           = 0.4f;

    VisualizationStrategy kind() const override { return VisualizationStrategy::Tabs; }

   protected:
    Pose inactive_pose(const Artifact&  artifact,
                       int              rank,
                       const LayoutBox& stage,
                       const LayoutBox& grid,
                       bool             hovered) const override;
};

// Four category stacks on a concave arc behind the grid and stage.
class GroupingPlacement : public PlacementStrategy
{
   public:
    static constexpr double ARC_FRACTION[4] = {-0.8, -0.27, 0.27, 0.8};
    static constexpr double ARC_Z[4]        = {-2.0, -4.0, -4.0, -2.0};
    static constexpr float  ARC_YAW[4]      = {0.25f, 0.08f, -0.08f, -0.25f};
    static constexpr double TOP_DROP        = 2.7;
    static constexpr double STACK_X         = 0.15;
    static constexpr double STACK_Y         = 0.15;
    static constexpr double STACK_Z         = -0.3;
    static constexpr float  SCALE           = 0.4f;

    VisualizationStrategy kind() const override { return VisualizationStrategy::Grouping; }

   protected:
    Pose inactive_pose(const Artifact&  artifact,
                       int              rank,
                       const LayoutBox& stage,
                       const LayoutBox& grid,
                       bool             hovered) const override;
};

// Boards alternating right (even rank) and left of the stage in rings.
class GalleryPlacement : public PlacementStrategy
{
   public:
    static constexpr double SIDE_INSET  = 0.5;
    static constexpr double RING_SPREAD = 0.8;
    static constexpr double RING_RISE   = 0.3;
    static constexpr double BASE_Z      = -1.5;
    static constexpr double RING_DEPTH  = 1.5;
    static constexpr float  YAW         = 0.35f;
    static constexpr float  SCALE       = 0.35f;

    VisualizationStrategy kind() const override { return VisualizationStrategy::Gallery; }

   protected:
    Pose inactive_pose(const Artifact&  artifact,
                       int              rank,
                       const LayoutBox& stage,
                       const LayoutBox& grid,
                       bool             hovered) const override;
};

std::unique_ptr<PlacementStrategy> make_placement_strategy(VisualizationStrategy kind);

}   // namespace sheetscape
