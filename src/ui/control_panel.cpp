#ifdef SHEETSCAPE_USE_IMGUI

    #include "control_panel.hpp"

    #include <imgui.h>
    #include <string>

    #include "scene/workspace_scene.hpp"

namespace sheetscape
{

namespace
{

template <typename E>
bool radio(const char* label, E& current, E value)
{
    if (ImGui::RadioButton(label, current == value))
    {
        bool changed = current != value;
        current      = value;
        return changed;
    }
    return false;
}

}   // namespace

bool ControlPanel::draw(WorkspaceScene& scene, float viewport_width)
{
    ImGui::SetNextWindowPos(ImVec2(viewport_width - WIDTH - MARGIN, MARGIN), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(WIDTH, 0.0f), ImGuiCond_Always);
    ImGui::Begin("Analysis Tools",
                 nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse
                     | ImGuiWindowFlags_AlwaysAutoResize);

    const WorkspaceConfig& cfg = scene.config();
    bool                   busy = scene.artifacts().is_processing();

    if (cfg.interaction == InteractionStrategy::Overlay)
    {
        ImGui::BeginDisabled(busy);
        for (const auto& name : MockAnalysisBackend::algorithms())
        {
            std::string label = "Run " + name;
            if (ImGui::Button(label.c_str(), ImVec2(-1.0f, 0.0f)))
            {
                AnalysisRequest request;
                request.algorithm = name;
                scene.request_run(request);
            }
        }
        ImGui::EndDisabled();
        if (busy)
            ImGui::TextDisabled("Processing...");
    }
    else
    {
        ImGui::TextWrapped("Right-click on the spreadsheet to access analysis tools.");
    }

    bool changed = false;

    ImGui::Separator();
    ImGui::TextUnformatted("Interaction Strategy");
    InteractionStrategy interaction = cfg.interaction;
    changed |= radio("UI Overlay", interaction, InteractionStrategy::Overlay);
    changed |= radio("Contextual Menu", interaction, InteractionStrategy::ContextualMenu);
    if (interaction != cfg.interaction)
        scene.set_interaction(interaction);

    ImGui::Separator();
    ImGui::TextUnformatted("Progress Strategy");
    ProgressStrategy progress = cfg.progress;
    changed |= radio("None", progress, ProgressStrategy::None);
    changed |= radio("Spreadsheet Overlay", progress, ProgressStrategy::FixedDelay);
    changed |= radio("Artifact Streaming", progress, ProgressStrategy::Streaming);
    if (progress != cfg.progress)
        scene.set_progress(progress);

    ImGui::Separator();
    ImGui::TextUnformatted("Visualization Strategy");
    VisualizationStrategy vis = cfg.visualization;
    changed |= radio("Spatial Sidebar", vis, VisualizationStrategy::Sidebar);
    changed |= radio("Background Tabs", vis, VisualizationStrategy::Tabs);
    changed |= radio("Spatial Grouping", vis, VisualizationStrategy::Grouping);
    changed |= radio("Gallery", vis, VisualizationStrategy::Gallery);
    if (vis != cfg.visualization)
        scene.set_visualization(vis);

    ImGui::Separator();
    ImGui::TextUnformatted("Spreadsheet");
    GridMode mode = scene.grid().mode();
    radio("Resize", mode, GridMode::Resize);
    radio("Clip", mode, GridMode::Clip);
    if (mode != scene.grid().mode())
        scene.set_grid_mode(mode);

    ImGui::End();
    return changed;
}

}   // namespace sheetscape

#endif   // SHEETSCAPE_USE_IMGUI
