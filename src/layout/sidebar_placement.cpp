#include "placement_strategy.hpp"

namespace sheetscape
{

Pose SidebarPlacement::inactive_pose(const Artifact& /*artifact*/,
                                     int              rank,
                                     const LayoutBox& stage,
                                     const LayoutBox& /*grid*/,
                                     bool             hovered) const
{
    int column = rank / ROWS_PER_COLUMN;
    int row    = rank % ROWS_PER_COLUMN;

    double first_row_y = stage.top() - ActiveBoardMetrics::HEIGHT * SCALE;

    Pose p;
    p.position = {stage.right() + COLUMN_PITCH * 0.5 + column * COLUMN_PITCH,
                  first_row_y - row * ROW_PITCH,
                  -2.0 - column * COLUMN_DEPTH - rank * RANK_DEPTH};
    p.rotation = {0.0, -PI / 6.0, 0.0};
    p.scale    = SCALE;
    p.opacity  = hovered ? 0.9f : 0.5f;
    p.width    = static_cast<float>(ActiveBoardMetrics::WIDTH);
    p.height   = static_cast<float>(ActiveBoardMetrics::HEIGHT);
    return p;
}

}   // namespace sheetscape
