#pragma once

#include <cstdint>
#include <optional>

namespace sheetscape
{

// Axis-aligned world-space rectangle in the z = 0 plane.
struct LayoutBox
{
    double center_x = 0.0;
    double center_y = 0.0;
    double width    = 0.0;
    double height   = 0.0;

    double left() const { return center_x - width * 0.5; }
    double right() const { return center_x + width * 0.5; }
    double top() const { return center_y + height * 0.5; }
    double bottom() const { return center_y - height * 0.5; }

    bool contains(double x, double y) const
    {
        return x >= left() && x <= right() && y >= bottom() && y <= top();
    }

    bool operator==(const LayoutBox& o) const
    {
        return center_x == o.center_x && center_y == o.center_y && width == o.width
               && height == o.height;
    }
    bool operator!=(const LayoutBox& o) const { return !(*this == o); }
};

// Visible world region at the focus plane plus the pixel width it maps to.
struct ViewportInfo
{
    double center_x          = 0.0;
    double center_y          = 4.0;
    double world_width       = 22.0;
    double world_height      = 12.4;
    float  pixel_width       = 1600.0f;
    float  reserved_panel_px = 0.0f;

    bool operator==(const ViewportInfo& o) const
    {
        return center_x == o.center_x && center_y == o.center_y && world_width == o.world_width
               && world_height == o.world_height && pixel_width == o.pixel_width
               && reserved_panel_px == o.reserved_panel_px;
    }
    bool operator!=(const ViewportInfo& o) const { return !(*this == o); }
};

struct PartitionMargins
{
    double outer        = 0.5;    // left and right edge inset
    double gap          = 0.5;    // between grid and stage
    double top_fraction = 0.08;   // of world height
    double bottom       = 0.5;
    double floor_y      = -2.0;
    double min_height   = 2.0;
    double min_width    = 0.5;
};

struct Partition
{
    LayoutBox grid;
    LayoutBox stage;

    bool operator==(const Partition& o) const { return grid == o.grid && stage == o.stage; }
    bool operator!=(const Partition& o) const { return !(*this == o); }
};

// Pure: splits the viewport into equal grid (left) and stage (right) boxes.
// The reserved side panel is taken off the right edge after converting it
// with world_width / pixel_width. Box height never drops below min_height.
Partition partition_viewport(const ViewportInfo& viewport, const PartitionMargins& margins = {});

// Memoizes partition_viewport on its input tuple.
class ViewportPartitioner
{
   public:
    explicit ViewportPartitioner(PartitionMargins margins = {}) : margins_(margins) {}

    // Returns true when the boxes were recomputed.
    bool update(const ViewportInfo& viewport);

    const Partition&    partition() const { return partition_; }
    const LayoutBox&    grid() const { return partition_.grid; }
    const LayoutBox&    stage() const { return partition_.stage; }
    const ViewportInfo& viewport() const { return viewport_; }
    uint64_t            generation() const { return generation_; }

   private:
    PartitionMargins margins_;
    ViewportInfo     viewport_;
    Partition        partition_;
    bool             valid_      = false;
    uint64_t         generation_ = 0;
};

}   // namespace sheetscape
