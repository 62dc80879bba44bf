#include "theme.hpp"

namespace sheetscape
{

static ThemeColors make_slate()
{
    ThemeColors t;
    t.background    = hex(0x020617);
    t.floor         = hex(0x0b1120);
    t.floor_grid    = hex(0x1e293b);
    t.container     = hex(0x0f172a);
    t.ui_background = hex(0x1e293b);
    t.ui_border     = hex(0x334155);
    t.overlay       = hex(0x020617, 0.7f);

    t.text_data    = hex(0xf8fafc);
    t.text_header  = hex(0x94a3b8);
    t.text_inverse = hex(0xffffff);

    t.accent = hex(0x3b82f6);
    t.error  = hex(0xf87171);

    t.cell_header   = hex(0x334155);
    t.cell_even     = hex(0x0f172a);
    t.cell_odd      = hex(0x1e293b);
    t.handle        = hex(0x475569);
    t.handle_active = hex(0x60a5fa);
    return t;
}

const ThemeColors& default_theme()
{
    static const ThemeColors theme = make_slate();
    return theme;
}

}   // namespace sheetscape
