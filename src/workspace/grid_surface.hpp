#pragma once

#include <cstdint>
#include <optional>
#include <sheetscape/config.hpp>
#include <sheetscape/math3d.hpp>
#include <string>
#include <vector>

#include "drag_plane.hpp"
#include "layout/viewport_partitioner.hpp"

namespace sheetscape
{

enum class GridMode
{
    Resize,   // drag changes row/column counts
    Clip,     // drag changes the visible window, counts stay
};

enum class GridGesture
{
    None,
    Drag,
    Resize,
};

enum class CellAlign
{
    Center,
    Right,
};

struct GridCell
{
    int         row = 0;
    int         col = 0;
    vec3        center;   // relative to the surface center
    std::string text;
    bool        header = false;
    CellAlign   align  = CellAlign::Right;
};

// The spreadsheet panel. Position is base + offset; the offset is what the
// gestures edit, and every size change compensates it by half the size delta
// so the top-left corner stays put.
class GridSurface
{
   public:
    static constexpr int    DEFAULT_COLS  = 21;   // header column included
    static constexpr int    DEFAULT_ROWS  = 61;   // header row included
    static constexpr int    MIN_COLS      = 2;
    static constexpr int    MIN_ROWS      = 2;
    static constexpr double CELL_WIDTH    = 0.25;
    static constexpr double CELL_HEIGHT   = 0.08;
    static constexpr double CELL_DEPTH    = 0.02;
    static constexpr double CELL_GAP      = 0.01;
    static constexpr double HANDLE_STRIP  = 0.4;
    static constexpr double BORDER        = 0.1;
    static constexpr double DEPTH         = 0.1;
    static constexpr double RESIZE_HANDLE = 0.15;
    static constexpr int    DATA_ROWS     = 200;
    static constexpr int    DATA_COLS     = 100;

    explicit GridSurface(uint32_t seed = 7);

    // ── placement ──
    void        set_base_position(const vec3& base) { base_ = base; }
    const vec3& base_position() const { return base_; }
    const vec3& offset() const { return offset_; }
    vec3        world_center() const { return base_ + offset_; }

    // Places the base so an unmodified surface sits in the bottom-left corner
    // of the box. The drag offset is kept.
    void anchor_to(const LayoutBox& grid_box);

    // ── extent ──
    int    cols() const { return cols_; }
    int    rows() const { return rows_; }
    double content_width() const;
    double content_height() const;
    double visible_width() const;
    double visible_height() const;
    double container_width() const { return visible_width() + BORDER; }
    double container_height() const { return visible_height() + BORDER + HANDLE_STRIP; }

    GridMode              mode() const { return mode_; }
    void                  set_mode(GridMode mode);
    std::optional<double> clip_width() const { return clip_width_; }
    std::optional<double> clip_height() const { return clip_height_; }

    // ── picking (rays are intersected with the front face) ──
    std::optional<vec3> front_hit(const Ray& ray) const;
    bool                hits_body(const Ray& ray) const;
    bool                hits_handle(const Ray& ray) const;
    bool                hits_resize_handle(const Ray& ray) const;

    // ── gestures ──
    bool        begin_drag(const Ray& ray);
    bool        begin_resize(const Ray& ray);
    void        pointer_move(const Ray& ray);
    void        pointer_up();
    GridGesture gesture() const { return gesture_; }

    void set_handle_hovered(bool hovered) { handle_hovered_ = hovered; }
    void set_resize_hovered(bool hovered) { resize_hovered_ = hovered; }
    bool handle_hovered() const { return handle_hovered_; }
    bool resize_hovered() const { return resize_hovered_; }

    // ── cells ──
    // Cells inside the visible window, row-major. The top-left header cell
    // is always present because the window never shrinks below one pitch.
    std::vector<GridCell> visible_cells() const;
    const std::string&    cell_value(int row, int col) const;
    static std::string    column_label(int col);

    // ── context menu ──
    void set_interaction(InteractionStrategy interaction) { interaction_ = interaction; }
    InteractionStrategy interaction() const { return interaction_; }

    void set_processing(bool processing);
    bool processing() const { return processing_; }

    // Shows the busy overlay; only the fixed-delay policy asks for it.
    void set_processing_overlay(bool visible) { processing_overlay_ = visible; }
    bool processing_overlay_visible() const { return processing_ && processing_overlay_; }

    // Contextual-menu interaction only, never while processing.
    bool open_context_menu(const vec3& world_point);
    void close_context_menu() { menu_open_ = false; }
    bool context_menu_open() const { return menu_open_ && !processing_; }
    const vec3& context_menu_anchor() const { return menu_anchor_; }

    // Closes the menu and returns the analysis name to run.
    std::optional<std::string>             select_menu_entry(size_t index);
    static const std::vector<std::string>& menu_entries();

   private:
    static constexpr double PITCH_X = CELL_WIDTH + CELL_GAP;
    static constexpr double PITCH_Y = CELL_HEIGHT + CELL_GAP;

    bool begin_gesture(GridGesture gesture, const Ray& ray);
    vec3 to_local(const vec3& world) const { return world - world_center(); }

    vec3 base_{-4.0, 3.0, 0.0};
    vec3 offset_;

    int                   cols_ = DEFAULT_COLS;
    int                   rows_ = DEFAULT_ROWS;
    GridMode              mode_ = GridMode::Resize;
    std::optional<double> clip_width_;
    std::optional<double> clip_height_;

    DragPlane   plane_;
    GridGesture gesture_ = GridGesture::None;
    vec3        gesture_start_offset_;
    int         gesture_start_cols_   = DEFAULT_COLS;
    int         gesture_start_rows_   = DEFAULT_ROWS;
    double      gesture_start_width_  = 0.0;
    double      gesture_start_height_ = 0.0;
    bool        handle_hovered_       = false;
    bool        resize_hovered_       = false;

    std::vector<std::string> cell_data_;

    InteractionStrategy interaction_        = InteractionStrategy::Overlay;
    bool                processing_         = false;
    bool                processing_overlay_ = false;
    bool                menu_open_          = false;
    vec3                menu_anchor_;
};

}   // namespace sheetscape
