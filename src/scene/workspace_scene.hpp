#pragma once

#include <memory>
#include <optional>
#include <sheetscape/camera.hpp>
#include <sheetscape/config.hpp>
#include <unordered_map>

#include "anim/pose_animator.hpp"
#include "anim/timer_queue.hpp"
#include "layout/placement_strategy.hpp"
#include "layout/viewport_partitioner.hpp"
#include "scene_builder.hpp"
#include "scene_description.hpp"
#include "workspace/analysis_backend.hpp"
#include "workspace/artifact_manager.hpp"
#include "workspace/grid_surface.hpp"
#include "workspace/plot_panel.hpp"

namespace sheetscape
{

// Owns the workspace state and runs the per-tick pipeline:
//   timers -> partition -> placement -> pose convergence
// Pointer input arrives as world rays; board hits are resolved against the
// most recent build_scene() output.
class WorkspaceScene
{
   public:
    static constexpr double FLOOR_Y = -2.0;

    explicit WorkspaceScene(const WorkspaceConfig&           config  = {},
                            std::unique_ptr<AnalysisBackend> backend = nullptr);
    ~WorkspaceScene();

    WorkspaceScene(const WorkspaceScene&)            = delete;
    WorkspaceScene& operator=(const WorkspaceScene&) = delete;

    // ── control surface ──
    const WorkspaceConfig& config() const { return config_; }
    void                   set_visualization(VisualizationStrategy strategy);
    void                   set_interaction(InteractionStrategy strategy);
    void                   set_progress(ProgressStrategy strategy);
    void                   set_grid_mode(GridMode mode) { grid_.set_mode(mode); }

    // Uses the configured panel count when the request leaves it open.
    bool request_run(AnalysisRequest request = {});
    bool activate(const ArtifactId& id);

    // ── viewport ──
    void                set_viewport(const ViewportInfo& viewport) { viewport_ = viewport; }
    const ViewportInfo& viewport() const { return viewport_; }
    // Visible region of the camera at z = 0 with the configured side panel.
    void set_window_size(float width_px, float height_px);

    // ── frame ──
    void                    update(float dt);
    const SceneDescription& build_scene();
    const SceneDescription& scene() const { return scene_; }

    // ── pointer ──
    // Left button. Returns true when something consumed the press.
    bool pointer_down(const Ray& ray);
    void pointer_move(const Ray& ray);
    void pointer_up();
    // Right button: opens the analysis menu at the grid hit point.
    bool context_click(const Ray& ray);

    // ── state ──
    const std::optional<ArtifactId>& hovered() const { return hovered_; }
    const PlotPanel*                 panel(const ArtifactId& id) const;
    PlotPanel*                       panel(const ArtifactId& id);
    bool                             expanded(const ArtifactId& id) const;

    Camera&                         camera() { return camera_; }
    const Camera&                   camera() const { return camera_; }
    const ArtifactLifecycleManager& artifacts() const { return manager_; }
    const PoseAnimator&             animator() const { return animator_; }
    PoseAnimator&                   animator() { return animator_; }
    const ViewportPartitioner&      partitioner() const { return partitioner_; }
    const PlacementStrategy&        placement() const { return *placement_; }
    const GridSurface&              grid() const { return grid_; }
    GridSurface&                    grid() { return grid_; }
    const TimerQueue&               timers() const { return timers_; }

   private:
    void sync_panels();
    void place_boards();
    bool handle_hit(const HitRegion& region);

    // Board or menu region under the ray unless the grid body is nearer.
    std::optional<PickResult> pick(const Ray& ray) const;

    WorkspaceConfig                  config_;
    Camera                           camera_;
    TimerQueue                       timers_;
    std::unique_ptr<AnalysisBackend> backend_;
    ArtifactLifecycleManager         manager_;

    ViewportInfo                       viewport_;
    ViewportPartitioner                partitioner_;
    std::unique_ptr<PlacementStrategy> placement_;
    PoseAnimator                       animator_;
    GridSurface                        grid_;

    std::unordered_map<ArtifactId, PlotPanel> panels_;
    std::optional<ArtifactId>                 hovered_;

    SceneBuilder     builder_;
    SceneDescription scene_;
    bool             scene_built_ = false;
};

}   // namespace sheetscape
