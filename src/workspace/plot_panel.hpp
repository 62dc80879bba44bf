#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace sheetscape
{

// Per-artifact plot navigation: which plot is focused in the single view,
// whether the 2x2 grid view is open, and the page over the plot collection.
// Focus and the grid-view selection are independent.
class PlotPanel
{
   public:
    static constexpr int    EXPANDED_COLUMNS   = 2;
    static constexpr int    EXPANDED_ROWS      = 2;
    static constexpr int    EXPANDED_CAPACITY  = EXPANDED_COLUMNS * EXPANDED_ROWS;
    static constexpr double TAB_WIDTH          = 1.0;
    static constexpr double TAB_PITCH          = 1.05;
    static constexpr double STRIP_PADDING      = 0.1;
    static constexpr double EXPAND_BUTTON_SIZE = 1.3;   // button plus its margin

    // Call whenever the owning artifact's plot list may have changed. Focus
    // and page reset only on the empty -> non-empty transition.
    void   sync(size_t plot_count);
    size_t plot_count() const { return plot_count_; }

    // Board-relative width available to the collapsed tab strip.
    void   set_strip_width(double width) { strip_width_ = width; }
    double strip_width() const { return strip_width_; }

    // Collapsed: moves the focus. Expanded: moves the grid selection only.
    bool select(int index);
    int  focused() const { return focused_; }
    int  expanded_selection() const { return expanded_selection_; }

    bool expanded() const { return expanded_; }
    void set_expanded(bool expanded);
    void toggle_expanded() { set_expanded(!expanded_); }

    int page_capacity() const;
    int page_count() const;
    // Stored page clamped to the current page count.
    int  page() const;
    bool set_page(int page);
    bool next_page();
    bool prev_page();

    // Half-open [first, last) range of plot indices on the displayed page.
    std::pair<size_t, size_t> visible_range() const;

    std::string page_label() const;

    static int collapsed_capacity(double strip_width);

   private:
    size_t plot_count_         = 0;
    double strip_width_        = 6.8;
    int    focused_            = 0;
    int    expanded_selection_ = 0;
    bool   expanded_           = false;
    int    page_               = 0;
};

}   // namespace sheetscape
