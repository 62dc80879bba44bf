// main.cpp: desktop front-end. GLFW window, Vulkan device, ImGui control
// panel, and the workspace scene drawn through the ImGui background list.

#include <cstdlib>
#include <cstring>
#include <exception>
#include <sheetscape/config.hpp>
#include <sheetscape/logger.hpp>
#include <string>

#define GLFW_INCLUDE_NONE
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <imgui.h>

#include "anim/frame_scheduler.hpp"
#include "render/vulkan/vk_device.hpp"
#include "scene/diagnostic_boundary.hpp"
#include "scene/theme.hpp"
#include "scene/workspace_scene.hpp"
#include "ui/control_panel.hpp"
#include "ui/glfw_adapter.hpp"
#include "ui/imgui_integration.hpp"
#include "ui/imgui_scene_renderer.hpp"

namespace sheetscape
{

struct ViewSize
{
    float width  = 0.0f;
    float height = 0.0f;
};

static int run(WorkspaceConfig& config, const std::string& config_path)
{
    GlfwAdapter window;
    if (!window.init(static_cast<uint32_t>(config.window_width),
                     static_cast<uint32_t>(config.window_height),
                     "SheetScape"))
        return 1;

    WorkspaceScene     scene(config);
    ImGuiIntegration   imgui;
    ViewSize           view;
    vk::DeviceContext  device;
    bool               validation = std::getenv("SHEETSCAPE_VK_VALIDATION") != nullptr;

    window.set_pointer_callback(
        [&](PointerAction action, float x, float y)
        {
            if (view.width <= 0.0f)
                return;
            Ray ray = scene.camera().screen_ray(x, y, view.width, view.height);

            // Releases and moves during a grid gesture reach the scene even
            // over ImGui windows.
            bool gesture = scene.grid().gesture() != GridGesture::None;
            switch (action)
            {
                case PointerAction::Release:
                    scene.pointer_up();
                    break;
                case PointerAction::Move:
                    if (gesture || !imgui.wants_mouse())
                        scene.pointer_move(ray);
                    break;
                case PointerAction::Press:
                    if (!imgui.wants_mouse())
                        scene.pointer_down(ray);
                    break;
                case PointerAction::ContextPress:
                    if (!imgui.wants_mouse())
                        scene.context_click(ray);
                    break;
            }
        });

    uint32_t fb_w = 0, fb_h = 0;
    window.framebuffer_size(fb_w, fb_h);
    try
    {
        device.init(window.handle(), validation);
        imgui.init(window.handle(),
                   device,
                   static_cast<int>(fb_w),
                   static_cast<int>(fb_h));
    }
    catch (const std::exception&)
    {
        imgui.shutdown();
        device.shutdown();
        throw;
    }

    FrameScheduler     scheduler(60.0f);
    DiagnosticBoundary boundary;
    ImGuiSceneRenderer renderer;
    ControlPanel       panel;
    SceneDescription   diagnostic;

    while (!window.should_close())
    {
        scheduler.begin_frame();
        window.poll_events();

        window.framebuffer_size(fb_w, fb_h);
        if (fb_w == 0 || fb_h == 0)
        {
            window.wait_events();
            continue;
        }

        imgui.new_frame(static_cast<int>(fb_w), static_cast<int>(fb_h));
        ImVec2 display = ImGui::GetIO().DisplaySize;
        view.width     = display.x;
        view.height    = display.y;

        const Color* clear = &default_theme().background;
        boundary.run(
            [&]()
            {
                scene.set_window_size(view.width, view.height);
                scene.update(scheduler.dt());
                const SceneDescription& desc = scene.build_scene();
                renderer.render(desc, scene.camera(), {view.width, view.height});
                clear = &desc.clear_color;
            });

        if (boundary.has_error())
        {
            diagnostic.clear();
            diagnostic.clear_color        = default_theme().background;
            diagnostic.diagnostic         = true;
            diagnostic.diagnostic_message = boundary.message();
            renderer.render(diagnostic, scene.camera(), {view.width, view.height});
        }
        else if (panel.draw(scene, view.width))
        {
            config = scene.config();
            if (!config.save(config_path))
                SHEETSCAPE_LOG_WARN("app", "settings not saved to {}", config_path);
        }

        imgui.render(*clear);
        scheduler.end_frame();
    }

    imgui.shutdown();
    device.shutdown();
    window.shutdown();
    return 0;
}

}   // namespace sheetscape

int main(int argc, char** argv)
{
    using namespace sheetscape;

    Logger::instance().add_sink(sinks::console_sink());

    std::string config_path = WorkspaceConfig::default_path();
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc)
            config_path = argv[++i];
    }

    WorkspaceConfig config;
    if (!config.load(config_path))
        SHEETSCAPE_LOG_INFO("app", "no settings at {}, using defaults", config_path);
    Logger::instance().set_level(config.log_level);

    try
    {
        return run(config, config_path);
    }
    catch (const std::exception& e)
    {
        SHEETSCAPE_LOG_CRITICAL("app", "fatal: {}", e.what());
        return 1;
    }
}
