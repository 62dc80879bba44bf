#include "scene_builder.hpp"

#include <algorithm>
#include <cmath>

#include "workspace/grid_surface.hpp"
#include "workspace/plot_panel.hpp"

namespace sheetscape
{

namespace
{

constexpr double FLOOR_WIDTH      = 80.0;
constexpr double FLOOR_LENGTH     = 60.0;
constexpr double FLOOR_CENTER_Z   = -10.0;
constexpr double FLOOR_LINE_STEP  = 2.0;
constexpr double MENU_WIDTH       = 1.8;
constexpr double MENU_ENTRY       = 0.3;
constexpr double MENU_PADDING     = 0.1;
constexpr float  CELL_TEXT_SIZE   = 0.045f;
constexpr double CELL_TEXT_INSET  = 0.015;
constexpr float  HIT_MIN_OPACITY  = 0.05f;

}   // namespace

// ─── Primitives ──────────────────────────────────────────────────────────────

void SceneBuilder::add_box(SceneDescription& scene,
                           const BoardFrame& frame,
                           const vec3&       local,
                           const vec3&       size,
                           const Color&      color) const
{
    scene.boxes.push_back(DrawBox{frame.to_world(local), size * frame.scale, frame.yaw, color});
}

void SceneBuilder::add_text(SceneDescription&  scene,
                            const BoardFrame&  frame,
                            const vec3&        local,
                            const std::string& text,
                            float              size,
                            const Color&       color,
                            TextAlign          align,
                            bool               top,
                            float              max_width) const
{
    DrawText t;
    t.position  = frame.to_world(local);
    t.text      = text;
    t.size      = size * frame.scale;
    t.max_width = max_width * frame.scale;
    t.yaw       = frame.yaw;
    t.align     = align;
    t.top       = top;
    t.color     = color;
    scene.texts.push_back(std::move(t));
}

void SceneBuilder::add_hit(SceneDescription& scene,
                           const BoardFrame& frame,
                           const vec3&       local,
                           double            width,
                           double            height,
                           HitKind           kind,
                           const ArtifactId& artifact,
                           int               index) const
{
    HitRegion r;
    r.kind     = kind;
    r.artifact = artifact;
    r.index    = index;
    r.center   = frame.to_world(local);
    r.width    = width * frame.scale;
    r.height   = height * frame.scale;
    r.yaw      = frame.yaw;
    scene.hits.push_back(std::move(r));
}

// ─── Labels ──────────────────────────────────────────────────────────────────

std::string SceneBuilder::progress_label(double progress)
{
    long pct = std::lround(clampd(progress, 0.0, 1.0) * 100.0);
    return std::to_string(pct) + "% Complete";
}

std::string SceneBuilder::tab_title(const std::string& title)
{
    if (title.size() <= static_cast<size_t>(TAB_TITLE_CHARS))
        return title;
    return title.substr(0, TAB_TITLE_CHARS) + "...";
}

double SceneBuilder::scatter_x(size_t index, size_t count, double width)
{
    if (count <= 1)
        return 0.0;
    return -width * 0.5 + (static_cast<double>(index) / static_cast<double>(count - 1)) * width;
}

// ─── Scene ───────────────────────────────────────────────────────────────────

void SceneBuilder::begin(SceneDescription& scene) const
{
    scene.clear();
    scene.clear_color = theme_.background;
}

void SceneBuilder::add_floor(SceneDescription& scene, double floor_y) const
{
    BoardFrame world{};
    add_box(scene,
            world,
            {0.0, floor_y - 0.01, FLOOR_CENTER_Z},
            {FLOOR_WIDTH, 0.02, FLOOR_LENGTH},
            theme_.floor);

    for (double x = -FLOOR_WIDTH * 0.5; x <= FLOOR_WIDTH * 0.5; x += FLOOR_LINE_STEP)
    {
        add_box(scene,
                world,
                {x, floor_y + 0.001, FLOOR_CENTER_Z},
                {0.02, 0.005, FLOOR_LENGTH},
                theme_.floor_grid);
    }
    for (double z = FLOOR_CENTER_Z - FLOOR_LENGTH * 0.5; z <= FLOOR_CENTER_Z + FLOOR_LENGTH * 0.5;
         z += FLOOR_LINE_STEP)
    {
        add_box(scene, world, {0.0, floor_y + 0.001, z}, {FLOOR_WIDTH, 0.005, 0.02}, theme_.floor_grid);
    }
}

// ─── Boards ──────────────────────────────────────────────────────────────────

void SceneBuilder::add_board(SceneDescription& scene,
                             const Artifact&   artifact,
                             const Pose&       pose,
                             const BoardView&  view) const
{
    float      opacity = clampf(pose.opacity, 0.0f, 1.0f);
    double     w       = pose.width;
    double     h       = pose.height;
    BoardFrame frame{pose.position, static_cast<float>(pose.rotation.y), pose.scale};

    add_box(scene, frame, {0.0, 0.0, 0.0}, {w, h, BACKPLATE_DEPTH}, theme_.container.with_alpha(0.85f * opacity));
    if (!view.active && opacity > HIT_MIN_OPACITY)
    {
        add_hit(scene,
                frame,
                {0.0, 0.0, BACKPLATE_DEPTH * 0.5},
                w,
                h,
                HitKind::ActivateArtifact,
                artifact.id);
    }

    BoardFrame content = frame.child({0.0, 0.0, CONTENT_Z});

    if (artifact.is_pending())
    {
        add_pending(scene, artifact, content, opacity);
        return;
    }

    if (view.tab_strip)
    {
        const Color& c = view.hovered ? theme_.text_data : theme_.text_header;
        add_text(scene, content, {0.0, 0.0, 0.0}, artifact.title, 0.5f, c.with_alpha(opacity));
        return;
    }

    add_text(scene,
             content,
             {-w * 0.5 + 0.3, h * 0.5 - 0.4, 0.0},
             artifact.title,
             0.3f,
             theme_.text_data.with_alpha(opacity),
             TextAlign::Left,
             true);
    add_text(scene,
             content,
             {-w * 0.5 + 0.3, h * 0.5 - 1.1, 0.0},
             artifact.summary,
             0.15f,
             theme_.text_header.with_alpha(opacity),
             TextAlign::Left,
             true,
             2.5f);

    if (!artifact.plots.empty())
        add_plot_viewer(scene, artifact, pose, content, view);
}

void SceneBuilder::add_pending(SceneDescription& scene,
                               const Artifact&   artifact,
                               const BoardFrame& frame,
                               float             opacity) const
{
    double p = clampd(artifact.progress_or_zero(), 0.0, 1.0);

    add_text(scene, frame, {0.0, 0.5, 0.0}, artifact.title, 0.4f, theme_.accent.with_alpha(opacity));
    add_box(scene,
            frame,
            {0.0, -0.5, 0.0},
            {PROGRESS_WIDTH, PROGRESS_HEIGHT, 0.01},
            theme_.ui_border.with_alpha(opacity));
    if (p > 0.0)
    {
        add_box(scene,
                frame,
                {-PROGRESS_WIDTH * 0.5 + PROGRESS_WIDTH * p * 0.5, -0.5, 0.01},
                {PROGRESS_WIDTH * p, PROGRESS_HEIGHT, 0.01},
                theme_.accent.with_alpha(opacity));
    }
    add_text(scene, frame, {0.0, -1.0, 0.0}, progress_label(p), 0.2f, theme_.text_header.with_alpha(opacity));
}

void SceneBuilder::add_plot_viewer(SceneDescription& scene,
                                   const Artifact&   artifact,
                                   const Pose&       pose,
                                   const BoardFrame& frame,
                                   const BoardView&  view) const
{
    float            opacity  = clampf(pose.opacity, 0.0f, 1.0f);
    const PlotPanel* panel    = view.panel;
    bool             expanded = view.active && panel && panel->expanded();
    double           w        = pose.width;
    double           h        = pose.height;

    BoardFrame viewer = frame.child(expanded ? vec3{1.5, 0.5, 0.2} : vec3{1.0, -0.5, 0.2});

    if (expanded)
    {
        auto [first, last] = panel->visible_range();
        for (size_t i = first; i < last && i < artifact.plots.size(); ++i)
        {
            size_t k   = i - first;
            double x   = static_cast<double>(k % PlotPanel::EXPANDED_COLUMNS) * EXPANDED_COL_STEP - 2.0;
            double y   = 1.9 - static_cast<double>(k / PlotPanel::EXPANDED_COLUMNS) * EXPANDED_ROW_STEP;
            float  yaw = static_cast<float>(-x * 0.05);

            BoardFrame cell = viewer.child({x, y, std::fabs(x) * 0.2}, yaw);
            if (static_cast<int>(i) == panel->expanded_selection())
            {
                add_box(scene, cell, {0.0, 1.0, -0.05}, {3.4, 3.2, 0.02}, theme_.accent.with_alpha(0.25f * opacity));
            }
            add_hit(scene, cell, {0.0, 1.0, 0.0}, 3.4, 3.2, HitKind::FocusPlot, artifact.id, static_cast<int>(i));
            add_text(scene, cell, {0.0, 2.2, 0.0}, artifact.plots[i].title, 0.2f, theme_.text_data.with_alpha(opacity));
            add_plot(scene, artifact.plots[i], cell, opacity);
        }
        if (panel->page_count() > 1)
            add_pagination(scene, artifact, *panel, viewer.child({-1.5, -3.5, 0.1}), opacity);
    }
    else
    {
        int focused = panel ? panel->focused() : 0;
        focused     = std::clamp(focused, 0, static_cast<int>(artifact.plots.size()) - 1);

        const PlotData& plot = artifact.plots[static_cast<size_t>(focused)];
        add_text(scene, viewer, {0.0, 2.2, 0.0}, plot.title, 0.2f, theme_.text_data.with_alpha(opacity));
        add_plot(scene, plot, viewer, opacity);
    }

    if (!view.active || !panel)
        return;

    // Plot tabs and the expand toggle along the bottom edge.
    double     pw   = w - 0.2;
    double     ph   = h * 0.1;
    double     py   = -h * 0.5 + ph * 0.5 + 0.1;
    BoardFrame tabs = frame.child({0.0, py, 0.3});

    add_box(scene, tabs, {0.0, 0.0, 0.0}, {pw, ph, 0.05}, theme_.ui_background.with_alpha(0.9f * opacity));

    if (!expanded)
    {
        auto   [first, last] = panel->visible_range();
        double start_x       = -pw * 0.5 + PlotPanel::TAB_WIDTH * 0.5 + PlotPanel::STRIP_PADDING;
        for (size_t i = first; i < last && i < artifact.plots.size(); ++i)
        {
            double x      = start_x + static_cast<double>(i - first) * PlotPanel::TAB_PITCH;
            bool   active = static_cast<int>(i) == panel->focused();
            add_box(scene,
                    tabs,
                    {x, 0.0, 0.03},
                    {PlotPanel::TAB_WIDTH, ph * 0.6, 0.02},
                    (active ? theme_.accent : theme_.container).with_alpha(opacity));
            add_text(scene,
                     tabs,
                     {x, 0.0, 0.05},
                     tab_title(artifact.plots[i].title),
                     0.09f,
                     (active ? theme_.text_inverse : theme_.text_data).with_alpha(opacity));
            add_hit(scene,
                    tabs,
                    {x, 0.0, 0.05},
                    PlotPanel::TAB_WIDTH,
                    ph * 0.6,
                    HitKind::FocusPlot,
                    artifact.id,
                    static_cast<int>(i));
        }
        if (panel->page_count() > 1)
        {
            add_pagination(
                scene, artifact, *panel, frame.child({-w * 0.5 + 1.8, py + ph * 0.5 + 0.4, 0.3}), opacity);
        }
    }

    vec3 button{pw * 0.5 - 0.7, 0.0, 0.03};
    add_box(scene, tabs, button, {1.2, ph * 0.6, 0.02}, theme_.ui_border.with_alpha(opacity));
    add_text(scene,
             tabs,
             button + vec3{0.0, 0.0, 0.02},
             expanded ? "Collapse" : "Expand",
             0.09f,
             theme_.text_data.with_alpha(opacity));
    add_hit(scene, tabs, button + vec3{0.0, 0.0, 0.02}, 1.2, ph * 0.6, HitKind::ToggleExpand, artifact.id);
}

void SceneBuilder::add_pagination(SceneDescription& scene,
                                  const Artifact&   artifact,
                                  const PlotPanel&  panel,
                                  const BoardFrame& frame,
                                  float             opacity) const
{
    int  page     = panel.page();
    bool at_first = page == 0;
    bool at_last  = page == panel.page_count() - 1;

    add_box(scene, frame, {0.0, 0.0, 0.0}, {3.0, 0.6, 0.05}, theme_.ui_background.with_alpha(0.9f * opacity));

    auto arrow = [&](double x, const char* glyph, bool disabled, HitKind kind)
    {
        add_box(scene,
                frame,
                {x, 0.0, 0.03},
                {0.5, 0.5, 0.02},
                (disabled ? theme_.container : theme_.ui_border).with_alpha(opacity));
        add_text(scene,
                 frame,
                 {x, 0.0, 0.05},
                 glyph,
                 0.2f,
                 (disabled ? theme_.text_header : theme_.text_data).with_alpha(opacity));
        if (!disabled)
            add_hit(scene, frame, {x, 0.0, 0.05}, 0.5, 0.5, kind, artifact.id);
    };

    arrow(-1.0, "<", at_first, HitKind::PrevPage);
    add_text(scene, frame, {0.0, 0.0, 0.05}, panel.page_label(), 0.15f, theme_.text_data.with_alpha(opacity));
    arrow(1.0, ">", at_last, HitKind::NextPage);
}

void SceneBuilder::add_plot(SceneDescription& scene,
                            const PlotData&   plot,
                            const BoardFrame& frame,
                            float             opacity) const
{
    size_t n = plot.data.size();
    if (n == 0)
        return;

    double max_val = plot_max_or_one(plot);
    Color  accent  = theme_.accent.with_alpha(opacity);

    if (plot.type == PlotType::Bar)
    {
        double total   = n * BAR_WIDTH + (n - 1) * BAR_GAP;
        double start_x = -total * 0.5 + BAR_WIDTH * 0.5;
        for (size_t i = 0; i < n; ++i)
        {
            double bar_h = std::max(0.0, plot.data[i]) / max_val * PLOT_HEIGHT;
            add_box(scene,
                    frame,
                    {start_x + i * (BAR_WIDTH + BAR_GAP), bar_h * 0.5, 0.0},
                    {BAR_WIDTH, bar_h, BAR_WIDTH},
                    accent);
        }
        return;
    }

    Color axis = theme_.text_header.with_alpha(opacity);
    add_box(scene, frame, {0.0, 0.0, 0.0}, {SCATTER_WIDTH + 0.2, 0.02, 0.02}, axis);
    add_box(scene,
            frame,
            {-SCATTER_WIDTH * 0.5, PLOT_HEIGHT * 0.5, 0.0},
            {0.02, PLOT_HEIGHT + 0.2, 0.02},
            axis);

    for (size_t i = 0; i < n; ++i)
    {
        double x = scatter_x(i, n, SCATTER_WIDTH);
        double y = plot.data[i] / max_val * PLOT_HEIGHT;
        scene.spheres.push_back(DrawSphere{frame.to_world({x, y, 0.0}), POINT_RADIUS * frame.scale, accent});
    }
}

// ─── Grid ────────────────────────────────────────────────────────────────────

void SceneBuilder::add_grid(SceneDescription& scene, const GridSurface& grid) const
{
    BoardFrame frame{grid.world_center()};
    double     cw    = grid.container_width();
    double     ch    = grid.container_height();
    double     front = GridSurface::DEPTH * 0.5;

    add_box(scene, frame, {0.0, 0.0, 0.0}, {cw, ch, GridSurface::DEPTH}, theme_.container);

    add_box(scene,
            frame,
            {0.0, ch * 0.5 - GridSurface::HANDLE_STRIP * 0.5, front + 0.01},
            {cw - 0.1, GridSurface::HANDLE_STRIP - 0.1, 0.02},
            grid.handle_hovered() ? theme_.handle_active : theme_.handle);

    double r = GridSurface::RESIZE_HANDLE;
    add_box(scene,
            frame,
            {cw * 0.5 - r * 0.5, -ch * 0.5 + r * 0.5, front + 0.02},
            {r, r, 0.02},
            grid.resize_hovered() ? theme_.handle_active : theme_.handle);

    for (const auto& cell : grid.visible_cells())
    {
        const Color& fill = cell.header          ? theme_.cell_header
                            : (cell.row % 2 == 0) ? theme_.cell_even
                                                  : theme_.cell_odd;
        add_box(scene,
                frame,
                cell.center,
                {GridSurface::CELL_WIDTH, GridSurface::CELL_HEIGHT, GridSurface::CELL_DEPTH},
                fill);
        if (cell.text.empty())
            continue;

        vec3 at = cell.center + vec3{0.0, 0.0, GridSurface::CELL_DEPTH * 0.5 + 0.001};
        if (cell.align == CellAlign::Right)
        {
            at.x += GridSurface::CELL_WIDTH * 0.5 - CELL_TEXT_INSET;
            add_text(scene, frame, at, cell.text, CELL_TEXT_SIZE, theme_.text_data, TextAlign::Right);
        }
        else
        {
            add_text(scene, frame, at, cell.text, CELL_TEXT_SIZE, theme_.text_header);
        }
    }

    if (grid.processing_overlay_visible())
    {
        add_box(scene, frame, {0.0, 0.0, front + 0.05}, {cw, ch, 0.02}, theme_.overlay);
        add_text(scene, frame, {0.0, 0.0, front + 0.07}, "Processing...", 0.3f, theme_.accent);
    }

    if (grid.context_menu_open())
    {
        const auto& entries = GridSurface::menu_entries();
        double      mh      = entries.size() * MENU_ENTRY + MENU_PADDING * 2.0;
        BoardFrame  menu{grid.context_menu_anchor() + vec3{MENU_WIDTH * 0.5, -mh * 0.5, 0.3}};

        add_box(scene, menu, {0.0, 0.0, 0.0}, {MENU_WIDTH, mh, 0.02}, theme_.ui_background.with_alpha(0.95f));
        for (size_t i = 0; i < entries.size(); ++i)
        {
            double y = mh * 0.5 - MENU_PADDING - MENU_ENTRY * 0.5 - i * MENU_ENTRY;
            add_text(scene,
                     menu,
                     {-MENU_WIDTH * 0.5 + MENU_PADDING, y, 0.02},
                     entries[i],
                     0.12f,
                     theme_.text_data,
                     TextAlign::Left);
            add_hit(scene,
                    menu,
                    {0.0, y, 0.02},
                    MENU_WIDTH - MENU_PADDING,
                    MENU_ENTRY - 0.02,
                    HitKind::MenuEntry,
                    ArtifactId{},
                    static_cast<int>(i));
        }
    }
}

}   // namespace sheetscape
