#pragma once

#if defined(SHEETSCAPE_USE_GLFW) && defined(SHEETSCAPE_USE_IMGUI)

    #include <cstdint>
    #include <imgui.h>
    #include <imgui_impl_vulkan.h>
    #include <sheetscape/color.hpp>

    #include "render/vulkan/vk_device.hpp"

struct GLFWwindow;

namespace sheetscape
{

// Dear ImGui on GLFW + Vulkan. Swapchain, render pass and per-frame command
// buffers come from the backend's ImGui_ImplVulkanH_Window helper.
class ImGuiIntegration
{
   public:
    static constexpr uint32_t MIN_IMAGE_COUNT = 2;

    ImGuiIntegration() = default;
    ~ImGuiIntegration();

    ImGuiIntegration(const ImGuiIntegration&)            = delete;
    ImGuiIntegration& operator=(const ImGuiIntegration&) = delete;

    // Throws std::runtime_error when the swapchain cannot be created.
    void init(GLFWwindow* window, vk::DeviceContext& device, int width, int height);
    void shutdown();

    // Recreates the swapchain if the last present reported it out of date.
    void new_frame(int fb_width, int fb_height);
    // Renders the ImGui draw data and presents. Skipped for zero-size frames.
    void render(const Color& clear_color);

    bool wants_mouse() const;

   private:
    void frame_render(ImDrawData* draw_data);
    void frame_present();

    vk::DeviceContext*     device_ = nullptr;
    ImGui_ImplVulkanH_Window window_data_{};
    bool                   swapchain_rebuild_ = false;
    bool                   initialized_       = false;
};

}   // namespace sheetscape

#endif
