// Headless Walkthrough
// Drives the workspace without a window and logs what the boards do.
//
// This example shows:
// - Streaming a run and watching its progress climb
// - A second run pushing the first board into the inactive layout
// - Switching visualization strategies while poses converge
// - Activating an older result by id

#include <sheetscape/config.hpp>
#include <sheetscape/logger.hpp>

#include "anim/frame_scheduler.hpp"
#include "scene/workspace_scene.hpp"

using namespace sheetscape;

static void log_boards(const WorkspaceScene& scene)
{
    for (const auto& a : scene.artifacts().artifacts())
    {
        const Pose* p = scene.animator().current(a.id);
        if (!p)
            continue;
        SHEETSCAPE_LOG_INFO("walkthrough",
                            "  {} '{}' pos=({}, {}, {}) scale={} opacity={}",
                            a.id,
                            a.title,
                            p->position.x,
                            p->position.y,
                            p->position.z,
                            p->scale,
                            p->opacity);
    }
}

static void run_for(WorkspaceScene& scene, FrameScheduler& scheduler, float seconds)
{
    int frames = static_cast<int>(seconds * scheduler.target_fps());
    for (int i = 0; i < frames; ++i)
        scene.update(scheduler.step(1.0f / scheduler.target_fps()).dt);
}

int main()
{
    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().set_level(LogLevel::Info);

    WorkspaceConfig config;
    config.progress = ProgressStrategy::Streaming;

    WorkspaceScene scene(config);
    scene.set_window_size(1600.0f, 900.0f);

    FrameScheduler scheduler(60.0f);
    scheduler.set_fixed_timestep(1.0f / 60.0f);

    AnalysisRequest first;
    first.algorithm = "Linear Regression";
    scene.request_run(first);

    for (int i = 0; i < 4; ++i)
    {
        run_for(scene, scheduler, 0.5f);
        const Artifact* active = scene.artifacts().active();
        if (active)
        {
            SHEETSCAPE_LOG_INFO("walkthrough",
                                "t={}s {} progress={}",
                                scheduler.current_frame().elapsed_sec,
                                active->title,
                                active->progress_or_zero());
        }
    }

    AnalysisRequest second;
    second.algorithm = "Clustering";
    scene.request_run(second);
    run_for(scene, scheduler, 2.5f);

    const VisualizationStrategy strategies[] = {VisualizationStrategy::Sidebar,
                                                VisualizationStrategy::Tabs,
                                                VisualizationStrategy::Grouping,
                                                VisualizationStrategy::Gallery};
    for (auto s : strategies)
    {
        scene.set_visualization(s);
        run_for(scene, scheduler, 1.5f);
        SHEETSCAPE_LOG_INFO("walkthrough", "{}:", to_string(s));
        log_boards(scene);
    }

    const auto& list = scene.artifacts().artifacts();
    if (list.size() > 1)
    {
        scene.activate(list.back().id);
        run_for(scene, scheduler, 1.5f);
        SHEETSCAPE_LOG_INFO("walkthrough", "after activating {}:", list.back().id);
        log_boards(scene);
    }

    const SceneDescription& desc = scene.build_scene();
    SHEETSCAPE_LOG_INFO("walkthrough",
                        "scene: {} boxes, {} texts, {} spheres, {} hit regions",
                        desc.boxes.size(),
                        desc.texts.size(),
                        desc.spheres.size(),
                        desc.hits.size());
    return 0;
}
