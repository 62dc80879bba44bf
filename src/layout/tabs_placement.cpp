#include "placement_strategy.hpp"

#include <algorithm>
#include <cmath>

namespace sheetscape
{

Pose TabsPlacement::inactive_pose(const Artifact& /*artifact*/,
                                  int              rank,
                                  const LayoutBox& /*stage*/,
                                  const LayoutBox& grid,
                                  bool             hovered) const
{
    // Slots fill the band above the spreadsheet; further ranks stack into
    // layers behind the first, each shifted right.
    double band  = grid.height - SURFACE_RESERVE;
    int    slots = std::max(1, static_cast<int>(std::floor(band / SLOT_PITCH)));
    int    layer = rank / slots;
    int    slot  = rank % slots;

    double first_slot_y = grid.top() - SLOT_PITCH * 0.5;

    Pose p;
    p.position = {grid.center_x + layer * LAYER_SHIFT,
                  first_slot_y - slot * SLOT_PITCH,
                  FRONT_Z - layer * LAYER_DEPTH - rank * RANK_DEPTH};
    p.rotation = {0.0, 0.0, 0.0};
    p.scale    = SCALE;
    p.opacity  = hovered ? 1.0f : 0.6f;
    p.width    = static_cast<float>(STRIP_WIDTH);
    p.height   = static_cast<float>(STRIP_HEIGHT);
    return p;
}

}   // namespace sheetscape
