#include "viewport_partitioner.hpp"

#include <algorithm>
#include <sheetscape/logger.hpp>

namespace sheetscape
{

Partition partition_viewport(const ViewportInfo& viewport, const PartitionMargins& margins)
{
    double half_w = viewport.world_width * 0.5;
    double half_h = viewport.world_height * 0.5;

    double px_to_world =
        viewport.pixel_width > 0.0f ? viewport.world_width / viewport.pixel_width : 0.0;
    double reserved = std::max(0.0, static_cast<double>(viewport.reserved_panel_px)) * px_to_world;

    double left      = viewport.center_x - half_w + margins.outer;
    double right     = viewport.center_x + half_w - reserved - margins.outer;
    double available = right - left;
    double box_w     = std::max((available - margins.gap) * 0.5, margins.min_width);

    double top    = viewport.center_y + half_h - margins.top_fraction * viewport.world_height;
    double bottom = std::max(viewport.center_y - half_h + margins.bottom, margins.floor_y);
    if (top - bottom < margins.min_height)
        top = bottom + margins.min_height;

    double height = top - bottom;
    double cy     = bottom + height * 0.5;

    Partition p;
    p.grid  = LayoutBox{left + box_w * 0.5, cy, box_w, height};
    p.stage = LayoutBox{left + box_w + margins.gap + box_w * 0.5, cy, box_w, height};
    return p;
}

bool ViewportPartitioner::update(const ViewportInfo& viewport)
{
    if (valid_ && viewport == viewport_)
        return false;

    viewport_  = viewport;
    partition_ = partition_viewport(viewport, margins_);
    valid_     = true;
    ++generation_;

    SHEETSCAPE_LOG_DEBUG("layout",
                         "partition: grid {}x{} at ({}, {}), stage at ({}, {})",
                         partition_.grid.width,
                         partition_.grid.height,
                         partition_.grid.center_x,
                         partition_.grid.center_y,
                         partition_.stage.center_x,
                         partition_.stage.center_y);
    return true;
}

}   // namespace sheetscape
