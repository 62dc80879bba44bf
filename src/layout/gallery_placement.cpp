#include "placement_strategy.hpp"

namespace sheetscape
{

Pose GalleryPlacement::inactive_pose(const Artifact& /*artifact*/,
                                     int              rank,
                                     const LayoutBox& stage,
                                     const LayoutBox& /*grid*/,
                                     bool             hovered) const
{
    double side = (rank % 2 == 0) ? 1.0 : -1.0;
    int    ring = rank / 2;

    double board_half = ActiveBoardMetrics::WIDTH * SCALE * 0.5;
    double reach      = stage.width * 0.5 + SIDE_INSET + board_half + ring * RING_SPREAD;

    Pose p;
    p.position = {stage.center_x + side * reach,
                  stage.center_y + ring * RING_RISE,
                  BASE_Z - ring * RING_DEPTH};
    p.rotation = {0.0, side * YAW, 0.0};
    p.scale    = SCALE;
    p.opacity  = hovered ? 0.95f : 0.55f;
    p.width    = static_cast<float>(ActiveBoardMetrics::WIDTH);
    p.height   = static_cast<float>(ActiveBoardMetrics::HEIGHT);
    return p;
}

}   // namespace sheetscape
