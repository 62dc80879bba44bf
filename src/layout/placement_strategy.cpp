#include "placement_strategy.hpp"

#include <algorithm>

namespace sheetscape
{

Pose active_pose(const LayoutBox& stage, bool expanded)
{
    Pose p;
    p.rotation = {0.0, 0.0, 0.0};
    p.scale    = 1.0f;
    p.opacity  = 1.0f;

    if (!expanded)
    {
        p.width    = static_cast<float>(std::min(ActiveBoardMetrics::WIDTH, stage.width));
        p.height   = static_cast<float>(std::min(ActiveBoardMetrics::HEIGHT, stage.height));
        p.position = {stage.center_x, stage.center_y, 0.0};
        return p;
    }

    double w   = std::min(ActiveBoardMetrics::EXPANDED_WIDTH, stage.width);
    double h   = std::min(ActiveBoardMetrics::EXPANDED_HEIGHT, stage.height);
    p.width    = static_cast<float>(w);
    p.height   = static_cast<float>(h);
    p.position = {stage.center_x, stage.top() - h * 0.5, ActiveBoardMetrics::EXPANDED_Z};
    return p;
}

Pose PlacementStrategy::pose(const Artifact&  artifact,
                             bool             is_active,
                             int              inactive_rank,
                             const LayoutBox& stage,
                             const LayoutBox& grid,
                             bool             hovered,
                             bool             expanded) const
{
    if (is_active)
        return active_pose(stage, expanded);

    Pose p = inactive_pose(artifact, std::max(inactive_rank, 0), stage, grid, hovered);
    if (hovered)
        p.scale *= ActiveBoardMetrics::HOVER_SCALE;
    return p;
}

std::unique_ptr<PlacementStrategy> make_placement_strategy(VisualizationStrategy kind)
{
    switch (kind)
    {
        case VisualizationStrategy::Sidebar:
            return std::make_unique<SidebarPlacement>();
        case VisualizationStrategy::Tabs:
            return std::make_unique<TabsPlacement>();
        case VisualizationStrategy::Grouping:
            return std::make_unique<GroupingPlacement>();
        case VisualizationStrategy::Gallery:
            return std::make_unique<GalleryPlacement>();
    }
    return std::make_unique<SidebarPlacement>();
}

}   // namespace sheetscape
