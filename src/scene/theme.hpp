#pragma once

#include <sheetscape/color.hpp>

namespace sheetscape
{

// Named colors consumed by the scene builder and the control panel.
struct ThemeColors
{
    // Surfaces
    Color background;
    Color floor;
    Color floor_grid;
    Color container;   // board backplate and grid container
    Color ui_background;
    Color ui_border;
    Color overlay;     // busy overlay over the grid

    // Text
    Color text_data;     // primary text
    Color text_header;   // secondary text and axes
    Color text_inverse;  // text on accent

    // Interactive
    Color accent;
    Color error;

    // Spreadsheet
    Color cell_header;
    Color cell_even;
    Color cell_odd;
    Color handle;
    Color handle_active;
};

// Dark slate palette.
const ThemeColors& default_theme();

}   // namespace sheetscape
