#include "grid_surface.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <random>
#include <sheetscape/logger.hpp>

#include "analysis_backend.hpp"

namespace sheetscape
{

static constexpr double BOUNDS_EPSILON = 1e-3;

static double span(int count, double cell, double gap)
{
    return count * cell + (count - 1) * gap;
}

GridSurface::GridSurface(uint32_t seed)
{
    // Generated once so values survive resize and clip.
    std::mt19937                           rng(seed);
    std::uniform_real_distribution<double> dist(0.0, 10000.0);

    cell_data_.reserve(static_cast<size_t>((DATA_ROWS - 1) * (DATA_COLS - 1)));
    char buf[32];
    for (int r = 1; r < DATA_ROWS; ++r)
    {
        for (int c = 1; c < DATA_COLS; ++c)
        {
            std::snprintf(buf, sizeof(buf), "%.2f", dist(rng));
            cell_data_.emplace_back(buf);
        }
    }
}

void GridSurface::anchor_to(const LayoutBox& grid_box)
{
    double w = span(DEFAULT_COLS, CELL_WIDTH, CELL_GAP) + BORDER;
    double h = span(DEFAULT_ROWS, CELL_HEIGHT, CELL_GAP) + BORDER + HANDLE_STRIP;
    base_    = {grid_box.left() + w * 0.5, grid_box.bottom() + h * 0.5, 0.0};
}

// ─── Extent ──────────────────────────────────────────────────────────────────

double GridSurface::content_width() const
{
    return span(cols_, CELL_WIDTH, CELL_GAP);
}

double GridSurface::content_height() const
{
    return span(rows_, CELL_HEIGHT, CELL_GAP);
}

double GridSurface::visible_width() const
{
    return (mode_ == GridMode::Clip && clip_width_) ? *clip_width_ : content_width();
}

double GridSurface::visible_height() const
{
    return (mode_ == GridMode::Clip && clip_height_) ? *clip_height_ : content_height();
}

void GridSurface::set_mode(GridMode mode)
{
    if (gesture_ != GridGesture::None)
        pointer_up();
    if (mode == mode_)
        return;

    if (mode == GridMode::Clip)
    {
        clip_width_  = content_width();
        clip_height_ = content_height();
        mode_        = mode;
    }
    else
    {
        double old_w = visible_width();
        double old_h = visible_height();
        mode_        = mode;
        clip_width_.reset();
        clip_height_.reset();
        offset_ += vec3{(content_width() - old_w) * 0.5, -(content_height() - old_h) * 0.5, 0.0};
    }
    SHEETSCAPE_LOG_DEBUG("grid", "mode -> {}", mode == GridMode::Clip ? "clip" : "resize");
}

// ─── Picking ─────────────────────────────────────────────────────────────────

std::optional<vec3> GridSurface::front_hit(const Ray& ray) const
{
    vec3 front = world_center() + vec3{0.0, 0.0, DEPTH * 0.5};
    return ray_plane_intersect(ray, Plane{front, {0.0, 0.0, 1.0}});
}

bool GridSurface::hits_body(const Ray& ray) const
{
    auto hit = front_hit(ray);
    if (!hit)
        return false;
    vec3 p = to_local(*hit);
    return std::fabs(p.x) <= container_width() * 0.5 && std::fabs(p.y) <= container_height() * 0.5;
}

bool GridSurface::hits_handle(const Ray& ray) const
{
    auto hit = front_hit(ray);
    if (!hit)
        return false;
    vec3   p    = to_local(*hit);
    double half = container_height() * 0.5;
    return std::fabs(p.x) <= container_width() * 0.5 && p.y <= half && p.y >= half - HANDLE_STRIP;
}

bool GridSurface::hits_resize_handle(const Ray& ray) const
{
    auto hit = front_hit(ray);
    if (!hit)
        return false;
    vec3   p      = to_local(*hit);
    double half_w = container_width() * 0.5;
    double half_h = container_height() * 0.5;
    return p.x <= half_w && p.x >= half_w - RESIZE_HANDLE && p.y >= -half_h
           && p.y <= -half_h + RESIZE_HANDLE;
}

// ─── Gestures ────────────────────────────────────────────────────────────────

bool GridSurface::begin_gesture(GridGesture gesture, const Ray& ray)
{
    if (!plane_.begin(world_center(), ray))
        return false;

    gesture_              = gesture;
    gesture_start_offset_ = offset_;
    gesture_start_cols_   = cols_;
    gesture_start_rows_   = rows_;
    gesture_start_width_  = visible_width();
    gesture_start_height_ = visible_height();
    return true;
}

bool GridSurface::begin_drag(const Ray& ray)
{
    if (gesture_ != GridGesture::None || !hits_handle(ray))
        return false;
    return begin_gesture(GridGesture::Drag, ray);
}

bool GridSurface::begin_resize(const Ray& ray)
{
    if (gesture_ != GridGesture::None || !hits_resize_handle(ray))
        return false;
    return begin_gesture(GridGesture::Resize, ray);
}

void GridSurface::pointer_move(const Ray& ray)
{
    if (gesture_ == GridGesture::None)
        return;
    auto d = plane_.delta(ray);
    if (!d)
        return;

    if (gesture_ == GridGesture::Drag)
    {
        offset_ = gesture_start_offset_ + vec3{d->x, d->y, 0.0};
        return;
    }

    double delta_w = 0.0;
    double delta_h = 0.0;
    if (mode_ == GridMode::Resize)
    {
        int d_cols = static_cast<int>(std::lround(d->x / PITCH_X));
        int d_rows = static_cast<int>(std::lround(-d->y / PITCH_Y));
        cols_      = std::max(MIN_COLS, gesture_start_cols_ + d_cols);
        rows_      = std::max(MIN_ROWS, gesture_start_rows_ + d_rows);
        delta_w    = (cols_ - gesture_start_cols_) * PITCH_X;
        delta_h    = (rows_ - gesture_start_rows_) * PITCH_Y;
    }
    else
    {
        double w     = std::max(PITCH_X, gesture_start_width_ + d->x);
        double h     = std::max(PITCH_Y, gesture_start_height_ - d->y);
        clip_width_  = w;
        clip_height_ = h;
        delta_w      = w - gesture_start_width_;
        delta_h      = h - gesture_start_height_;
    }
    offset_ = gesture_start_offset_ + vec3{delta_w * 0.5, -delta_h * 0.5, 0.0};
}

void GridSurface::pointer_up()
{
    if (gesture_ == GridGesture::Resize)
    {
        SHEETSCAPE_LOG_DEBUG(
            "grid", "resized to {}x{} ({} x {})", cols_, rows_, visible_width(), visible_height());
    }
    gesture_ = GridGesture::None;
    plane_.end();
}

// ─── Cells ───────────────────────────────────────────────────────────────────

const std::string& GridSurface::cell_value(int row, int col) const
{
    static const std::string zero = "0.00";
    if (row < 1 || row >= DATA_ROWS || col < 1 || col >= DATA_COLS)
        return zero;
    return cell_data_[static_cast<size_t>((row - 1) * (DATA_COLS - 1) + (col - 1))];
}

std::string GridSurface::column_label(int col)
{
    std::string label;
    while (col > 0)
    {
        int rem = (col - 1) % 26;
        label.insert(label.begin(), static_cast<char>('A' + rem));
        col = (col - 1) / 26;
    }
    return label;
}

std::vector<GridCell> GridSurface::visible_cells() const
{
    std::vector<GridCell> cells;

    double vis_w       = visible_width();
    double vis_h       = visible_height();
    double left        = -vis_w * 0.5;
    double top         = container_height() * 0.5 - HANDLE_STRIP - BORDER * 0.5;
    double right_limit = left + vis_w + BOUNDS_EPSILON;
    double floor_limit = top - vis_h - BOUNDS_EPSILON;
    double z           = DEPTH * 0.5 + CELL_DEPTH * 0.5;

    for (int r = 0; r < rows_; ++r)
    {
        double y = top - CELL_HEIGHT * 0.5 - r * PITCH_Y;
        if (y - CELL_HEIGHT * 0.5 < floor_limit)
            break;

        for (int c = 0; c < cols_; ++c)
        {
            double x = left + CELL_WIDTH * 0.5 + c * PITCH_X;
            if (x + CELL_WIDTH * 0.5 > right_limit)
                break;

            GridCell cell;
            cell.row    = r;
            cell.col    = c;
            cell.center = {x, y, z};
            cell.header = (r == 0 || c == 0);
            if (r == 0 && c == 0)
            {
                cell.align = CellAlign::Center;
            }
            else if (r == 0)
            {
                cell.text  = column_label(c);
                cell.align = CellAlign::Center;
            }
            else if (c == 0)
            {
                cell.text  = std::to_string(r);
                cell.align = CellAlign::Center;
            }
            else
            {
                cell.text = cell_value(r, c);
            }
            cells.push_back(std::move(cell));
        }
    }
    return cells;
}

// ─── Context menu ────────────────────────────────────────────────────────────

void GridSurface::set_processing(bool processing)
{
    processing_ = processing;
    if (processing_)
        menu_open_ = false;
}

bool GridSurface::open_context_menu(const vec3& world_point)
{
    if (interaction_ != InteractionStrategy::ContextualMenu || processing_)
        return false;
    menu_open_   = true;
    menu_anchor_ = world_point;
    return true;
}

std::optional<std::string> GridSurface::select_menu_entry(size_t index)
{
    if (!context_menu_open())
        return std::nullopt;
    const auto& entries = menu_entries();
    if (index >= entries.size())
        return std::nullopt;
    menu_open_ = false;
    return entries[index];
}

const std::vector<std::string>& GridSurface::menu_entries()
{
    return MockAnalysisBackend::algorithms();
}

}   // namespace sheetscape
