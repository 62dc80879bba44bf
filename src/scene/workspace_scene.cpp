#include "workspace_scene.hpp"

#include <sheetscape/logger.hpp>
#include <vector>

namespace sheetscape
{

static LifecycleTiming timing_from(const WorkspaceConfig& config)
{
    LifecycleTiming t;
    t.fixed_delay_sec     = config.fixed_delay_sec;
    t.stream_interval_sec = config.stream_interval_sec;
    t.stream_step         = config.stream_step;
    return t;
}

WorkspaceScene::WorkspaceScene(const WorkspaceConfig& config, std::unique_ptr<AnalysisBackend> backend)
    : config_(config),
      backend_(backend ? std::move(backend) : std::make_unique<MockAnalysisBackend>(config.seed)),
      manager_(timers_, *backend_),
      placement_(make_placement_strategy(config.visualization)),
      animator_(config.animation_rate),
      grid_(config.seed)
{
    manager_.set_policy(config_.progress);
    manager_.set_timing(timing_from(config_));
    grid_.set_interaction(config_.interaction);
    viewport_.reserved_panel_px = config_.reserved_panel_px;
}

WorkspaceScene::~WorkspaceScene() = default;

// ─── Control surface ─────────────────────────────────────────────────────────

void WorkspaceScene::set_visualization(VisualizationStrategy strategy)
{
    if (strategy == placement_->kind())
        return;
    config_.visualization = strategy;
    placement_            = make_placement_strategy(strategy);
    hovered_.reset();
    SHEETSCAPE_LOG_INFO("workspace", "visualization -> {}", to_string(strategy));
}

void WorkspaceScene::set_interaction(InteractionStrategy strategy)
{
    config_.interaction = strategy;
    grid_.set_interaction(strategy);
    grid_.close_context_menu();
    SHEETSCAPE_LOG_INFO("workspace", "interaction -> {}", to_string(strategy));
}

void WorkspaceScene::set_progress(ProgressStrategy strategy)
{
    config_.progress = strategy;
    manager_.set_policy(strategy);
    SHEETSCAPE_LOG_INFO("workspace", "progress -> {}", to_string(strategy));
}

bool WorkspaceScene::request_run(AnalysisRequest request)
{
    if (!request.panel_count && config_.panel_count > 0)
        request.panel_count = config_.panel_count;
    bool started = manager_.request_run(request);
    grid_.set_processing(manager_.is_processing());
    return started;
}

bool WorkspaceScene::activate(const ArtifactId& id)
{
    if (!manager_.activate(id))
        return false;
    if (hovered_ && *hovered_ == id)
        hovered_.reset();
    return true;
}

void WorkspaceScene::set_window_size(float width_px, float height_px)
{
    ViewportInfo vp      = camera_.visible_region(width_px, height_px);
    vp.reserved_panel_px = config_.reserved_panel_px;
    viewport_            = vp;
}

// ─── Frame ───────────────────────────────────────────────────────────────────

void WorkspaceScene::update(float dt)
{
    if (dt > 0.0f)
        timers_.advance(dt);

    if (partitioner_.update(viewport_))
    {
        grid_.anchor_to(partitioner_.grid());
        SHEETSCAPE_LOG_DEBUG("workspace",
                             "partition {}: stage {}x{}",
                             partitioner_.generation(),
                             partitioner_.stage().width,
                             partitioner_.stage().height);
    }

    grid_.set_processing(manager_.is_processing());
    grid_.set_processing_overlay(manager_.policy() == ProgressStrategy::FixedDelay);

    sync_panels();
    place_boards();
    animator_.advance(dt);
}

void WorkspaceScene::sync_panels()
{
    double strip = active_pose(partitioner_.stage(), false).width - 2.0 * PlotPanel::STRIP_PADDING;

    for (const auto& a : manager_.artifacts())
    {
        PlotPanel& p = panels_[a.id];
        p.set_strip_width(strip);
        p.sync(a.plots.size());
    }

    for (auto it = panels_.begin(); it != panels_.end();)
    {
        if (!manager_.find(it->first))
            it = panels_.erase(it);
        else
            ++it;
    }
}

void WorkspaceScene::place_boards()
{
    const auto&             list  = manager_.artifacts();
    std::vector<int>        ranks = manager_.inactive_ranks();
    std::vector<ArtifactId> ids;
    ids.reserve(list.size());

    for (size_t i = 0; i < list.size(); ++i)
    {
        const Artifact& a         = list[i];
        bool            is_active = ranks[i] < 0;
        bool            hovered   = !is_active && hovered_ && *hovered_ == a.id;
        Pose            target    = placement_->pose(a,
                                           is_active,
                                           ranks[i],
                                           partitioner_.stage(),
                                           partitioner_.grid(),
                                           hovered,
                                           is_active && expanded(a.id));
        animator_.set_target(a.id, target);
        ids.push_back(a.id);
    }
    animator_.retain(ids);

    if (hovered_ && !manager_.find(*hovered_))
        hovered_.reset();
}

const SceneDescription& WorkspaceScene::build_scene()
{
    builder_.begin(scene_);
    builder_.add_floor(scene_, FLOOR_Y);
    builder_.add_grid(scene_, grid_);

    const auto& active_id = manager_.active_id();
    bool        tabs      = placement_->kind() == VisualizationStrategy::Tabs;
    for (const auto& a : manager_.artifacts())
    {
        const Pose* pose = animator_.current(a.id);
        if (!pose)
            continue;

        BoardView view;
        view.active    = active_id && *active_id == a.id;
        view.hovered   = hovered_ && *hovered_ == a.id;
        view.tab_strip = tabs && !view.active;
        view.panel     = panel(a.id);
        builder_.add_board(scene_, a, *pose, view);
    }

    scene_built_ = true;
    return scene_;
}

// ─── Pointer ─────────────────────────────────────────────────────────────────

std::optional<PickResult> WorkspaceScene::pick(const Ray& ray) const
{
    if (!scene_built_)
        return std::nullopt;

    auto hit = scene_.pick(ray);
    if (!hit)
        return std::nullopt;

    // The context menu floats above the grid.
    if (hit->region->kind == HitKind::MenuEntry)
        return hit;

    if (grid_.hits_body(ray))
    {
        auto grid_hit = grid_.front_hit(ray);
        if (grid_hit && vec3_length(*grid_hit - ray.origin) < hit->distance)
            return std::nullopt;
    }
    return hit;
}

bool WorkspaceScene::handle_hit(const HitRegion& region)
{
    switch (region.kind)
    {
        case HitKind::ActivateArtifact:
            return activate(region.artifact);
        case HitKind::MenuEntry:
        {
            auto name = grid_.select_menu_entry(static_cast<size_t>(region.index));
            if (!name)
                return false;
            AnalysisRequest request;
            request.algorithm = *name;
            request_run(request);
            return true;
        }
        default:
            break;
    }

    PlotPanel* p = panel(region.artifact);
    if (!p)
        return false;

    switch (region.kind)
    {
        case HitKind::FocusPlot:
            return p->select(region.index);
        case HitKind::ToggleExpand:
            p->toggle_expanded();
            SHEETSCAPE_LOG_DEBUG("workspace", "{} expanded={}", region.artifact, p->expanded());
            return true;
        case HitKind::PrevPage:
            return p->prev_page();
        case HitKind::NextPage:
            return p->next_page();
        default:
            return false;
    }
}

bool WorkspaceScene::pointer_down(const Ray& ray)
{
    auto hit = pick(ray);

    if (grid_.context_menu_open())
    {
        if (hit && hit->region->kind == HitKind::MenuEntry)
            return handle_hit(*hit->region);
        grid_.close_context_menu();
    }

    if (grid_.begin_resize(ray) || grid_.begin_drag(ray))
        return true;

    if (hit && hit->region->kind != HitKind::MenuEntry)
        return handle_hit(*hit->region);

    return grid_.hits_body(ray);
}

void WorkspaceScene::pointer_move(const Ray& ray)
{
    if (grid_.gesture() != GridGesture::None)
    {
        grid_.pointer_move(ray);
        return;
    }

    grid_.set_handle_hovered(grid_.hits_handle(ray));
    grid_.set_resize_hovered(grid_.hits_resize_handle(ray));

    auto hit = pick(ray);
    if (hit && hit->region->kind == HitKind::ActivateArtifact)
        hovered_ = hit->region->artifact;
    else
        hovered_.reset();
}

void WorkspaceScene::pointer_up()
{
    grid_.pointer_up();
}

bool WorkspaceScene::context_click(const Ray& ray)
{
    if (!grid_.hits_body(ray))
    {
        grid_.close_context_menu();
        return false;
    }
    auto point = grid_.front_hit(ray);
    return point && grid_.open_context_menu(*point);
}

// ─── State ───────────────────────────────────────────────────────────────────

const PlotPanel* WorkspaceScene::panel(const ArtifactId& id) const
{
    auto it = panels_.find(id);
    return it != panels_.end() ? &it->second : nullptr;
}

PlotPanel* WorkspaceScene::panel(const ArtifactId& id)
{
    auto it = panels_.find(id);
    return it != panels_.end() ? &it->second : nullptr;
}

bool WorkspaceScene::expanded(const ArtifactId& id) const
{
    const PlotPanel* p = panel(id);
    return p && p->expanded();
}

}   // namespace sheetscape
