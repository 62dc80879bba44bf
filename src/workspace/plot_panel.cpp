#include "plot_panel.hpp"

#include <algorithm>
#include <cmath>

namespace sheetscape
{

void PlotPanel::sync(size_t plot_count)
{
    bool arrived = plot_count_ == 0 && plot_count > 0;
    plot_count_  = plot_count;

    if (arrived)
    {
        focused_            = 0;
        expanded_selection_ = 0;
        page_               = 0;
    }
}

bool PlotPanel::select(int index)
{
    if (index < 0 || static_cast<size_t>(index) >= plot_count_)
        return false;

    if (expanded_)
        expanded_selection_ = index;
    else
        focused_ = index;
    return true;
}

void PlotPanel::set_expanded(bool expanded)
{
    if (expanded_ == expanded)
        return;
    expanded_ = expanded;
    page_     = 0;
}

int PlotPanel::collapsed_capacity(double strip_width)
{
    double usable = strip_width - 2.0 * STRIP_PADDING - EXPAND_BUTTON_SIZE;
    if (usable < TAB_WIDTH)
        return 1;
    return static_cast<int>(std::floor((usable - TAB_WIDTH) / TAB_PITCH)) + 1;
}

int PlotPanel::page_capacity() const
{
    return expanded_ ? EXPANDED_CAPACITY : collapsed_capacity(strip_width_);
}

int PlotPanel::page_count() const
{
    int cap   = page_capacity();
    int count = static_cast<int>((plot_count_ + static_cast<size_t>(cap) - 1) / static_cast<size_t>(cap));
    return std::max(1, count);
}

int PlotPanel::page() const
{
    return std::clamp(page_, 0, page_count() - 1);
}

bool PlotPanel::set_page(int page)
{
    int clamped = std::clamp(page, 0, page_count() - 1);
    if (clamped == this->page())
        return false;
    page_ = clamped;
    return true;
}

bool PlotPanel::next_page()
{
    return set_page(page() + 1);
}

bool PlotPanel::prev_page()
{
    return set_page(page() - 1);
}

std::pair<size_t, size_t> PlotPanel::visible_range() const
{
    size_t cap   = static_cast<size_t>(page_capacity());
    size_t first = std::min(plot_count_, static_cast<size_t>(page()) * cap);
    size_t last  = std::min(plot_count_, first + cap);
    return {first, last};
}

std::string PlotPanel::page_label() const
{
    return "Page " + std::to_string(page() + 1) + " of " + std::to_string(page_count());
}

}   // namespace sheetscape
