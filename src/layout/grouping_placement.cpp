#include "placement_strategy.hpp"

#include <algorithm>

namespace sheetscape
{

Pose GroupingPlacement::inactive_pose(const Artifact&  artifact,
                                      int              rank,
                                      const LayoutBox& stage,
                                      const LayoutBox& grid,
                                      bool             hovered) const
{
    int bucket = category_bucket(artifact, rank);

    double span_left  = std::min(grid.left(), stage.left());
    double span_right = std::max(grid.right(), stage.right());
    double span_cx    = (span_left + span_right) * 0.5;
    double half_span  = (span_right - span_left) * 0.5;
    double top        = std::max(grid.top(), stage.top());

    Pose p;
    p.position = {span_cx + ARC_FRACTION[bucket] * half_span + rank * STACK_X,
                  top - TOP_DROP + rank * STACK_Y,
                  ARC_Z[bucket] + rank * STACK_Z};
    p.rotation = {0.0, ARC_YAW[bucket], 0.0};
    p.scale    = SCALE;
    p.opacity  = hovered ? 1.0f : 0.6f;
    p.width    = static_cast<float>(ActiveBoardMetrics::WIDTH);
    p.height   = static_cast<float>(ActiveBoardMetrics::HEIGHT);
    return p;
}

}   // namespace sheetscape
