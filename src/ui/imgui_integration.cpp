#if defined(SHEETSCAPE_USE_GLFW) && defined(SHEETSCAPE_USE_IMGUI)

    #include "imgui_integration.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <imgui_impl_glfw.h>
    #include <sheetscape/logger.hpp>
    #include <stdexcept>

namespace sheetscape
{

static void check_vk_result(VkResult err)
{
    if (err == VK_SUCCESS)
        return;
    SHEETSCAPE_LOG_ERROR("imgui", "VkResult = {}", static_cast<int>(err));
}

ImGuiIntegration::~ImGuiIntegration()
{
    shutdown();
}

void ImGuiIntegration::init(GLFWwindow* window, vk::DeviceContext& device, int width, int height)
{
    device_ = &device;

    ImGui_ImplVulkanH_Window* wd = &window_data_;
    wd->Surface                  = device.surface;

    const VkFormat requested_formats[] = {VK_FORMAT_B8G8R8A8_UNORM,
                                          VK_FORMAT_R8G8B8A8_UNORM,
                                          VK_FORMAT_B8G8R8_UNORM,
                                          VK_FORMAT_R8G8B8_UNORM};
    wd->SurfaceFormat = ImGui_ImplVulkanH_SelectSurfaceFormat(device.physical_device,
                                                              wd->Surface,
                                                              requested_formats,
                                                              IM_ARRAYSIZE(requested_formats),
                                                              VK_COLORSPACE_SRGB_NONLINEAR_KHR);

    VkPresentModeKHR present_modes[] = {VK_PRESENT_MODE_FIFO_KHR};
    wd->PresentMode                  = ImGui_ImplVulkanH_SelectPresentMode(
        device.physical_device, wd->Surface, present_modes, IM_ARRAYSIZE(present_modes));

    ImGui_ImplVulkanH_CreateOrResizeWindow(device.instance,
                                           device.physical_device,
                                           device.device,
                                           wd,
                                           device.queue_families.graphics.value(),
                                           nullptr,
                                           width,
                                           height,
                                           MIN_IMAGE_COUNT);
    if (wd->Swapchain == VK_NULL_HANDLE)
        throw std::runtime_error("Failed to create swapchain");

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io    = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForVulkan(window, true);

    ImGui_ImplVulkan_InitInfo ii{};
    ii.Instance        = device.instance;
    ii.PhysicalDevice  = device.physical_device;
    ii.Device          = device.device;
    ii.QueueFamily     = device.queue_families.graphics.value();
    ii.Queue           = device.graphics_queue;
    ii.DescriptorPool  = device.descriptor_pool;
    ii.MinImageCount   = MIN_IMAGE_COUNT;
    ii.ImageCount      = wd->ImageCount;
    ii.RenderPass      = wd->RenderPass;
    ii.MSAASamples     = VK_SAMPLE_COUNT_1_BIT;
    ii.CheckVkResultFn = check_vk_result;

    ImGui_ImplVulkan_Init(&ii);
    ImGui_ImplVulkan_CreateFontsTexture();

    initialized_ = true;
    SHEETSCAPE_LOG_INFO("imgui", "initialized ({}x{}, {} images)", width, height, wd->ImageCount);
}

void ImGuiIntegration::shutdown()
{
    if (!initialized_)
        return;

    vkDeviceWaitIdle(device_->device);
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    ImGui_ImplVulkanH_DestroyWindow(device_->instance, device_->device, &window_data_, nullptr);
    device_->surface = VK_NULL_HANDLE;
    initialized_     = false;
}

bool ImGuiIntegration::wants_mouse() const
{
    return initialized_ && ImGui::GetIO().WantCaptureMouse;
}

void ImGuiIntegration::new_frame(int fb_width, int fb_height)
{
    if (swapchain_rebuild_ && fb_width > 0 && fb_height > 0)
    {
        ImGui_ImplVulkan_SetMinImageCount(MIN_IMAGE_COUNT);
        ImGui_ImplVulkanH_CreateOrResizeWindow(device_->instance,
                                               device_->physical_device,
                                               device_->device,
                                               &window_data_,
                                               device_->queue_families.graphics.value(),
                                               nullptr,
                                               fb_width,
                                               fb_height,
                                               MIN_IMAGE_COUNT);
        window_data_.FrameIndex = 0;
        swapchain_rebuild_      = false;
        SHEETSCAPE_LOG_DEBUG("imgui", "swapchain rebuilt {}x{}", fb_width, fb_height);
    }

    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void ImGuiIntegration::render(const Color& clear_color)
{
    ImGui::Render();
    ImDrawData* draw_data = ImGui::GetDrawData();
    if (draw_data->DisplaySize.x <= 0.0f || draw_data->DisplaySize.y <= 0.0f)
        return;

    window_data_.ClearValue.color.float32[0] = clear_color.r;
    window_data_.ClearValue.color.float32[1] = clear_color.g;
    window_data_.ClearValue.color.float32[2] = clear_color.b;
    window_data_.ClearValue.color.float32[3] = clear_color.a;

    frame_render(draw_data);
    frame_present();
}

void ImGuiIntegration::frame_render(ImDrawData* draw_data)
{
    ImGui_ImplVulkanH_Window* wd     = &window_data_;
    VkDevice                  device = device_->device;

    VkSemaphore image_acquired  = wd->FrameSemaphores[wd->SemaphoreIndex].ImageAcquiredSemaphore;
    VkSemaphore render_complete = wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;

    VkResult err =
        vkAcquireNextImageKHR(device, wd->Swapchain, UINT64_MAX, image_acquired, VK_NULL_HANDLE, &wd->FrameIndex);
    if (err == VK_ERROR_OUT_OF_DATE_KHR || err == VK_SUBOPTIMAL_KHR)
    {
        swapchain_rebuild_ = true;
        return;
    }
    check_vk_result(err);

    ImGui_ImplVulkanH_Frame* fd = &wd->Frames[wd->FrameIndex];
    check_vk_result(vkWaitForFences(device, 1, &fd->Fence, VK_TRUE, UINT64_MAX));
    check_vk_result(vkResetFences(device, 1, &fd->Fence));
    check_vk_result(vkResetCommandPool(device, fd->CommandPool, 0));

    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    check_vk_result(vkBeginCommandBuffer(fd->CommandBuffer, &begin));

    VkRenderPassBeginInfo rp{};
    rp.sType                    = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rp.renderPass               = wd->RenderPass;
    rp.framebuffer              = fd->Framebuffer;
    rp.renderArea.extent.width  = static_cast<uint32_t>(wd->Width);
    rp.renderArea.extent.height = static_cast<uint32_t>(wd->Height);
    rp.clearValueCount          = 1;
    rp.pClearValues             = &wd->ClearValue;
    vkCmdBeginRenderPass(fd->CommandBuffer, &rp, VK_SUBPASS_CONTENTS_INLINE);

    ImGui_ImplVulkan_RenderDrawData(draw_data, fd->CommandBuffer);

    vkCmdEndRenderPass(fd->CommandBuffer);
    check_vk_result(vkEndCommandBuffer(fd->CommandBuffer));

    VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    VkSubmitInfo         submit{};
    submit.sType                = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit.waitSemaphoreCount   = 1;
    submit.pWaitSemaphores      = &image_acquired;
    submit.pWaitDstStageMask    = &wait_stage;
    submit.commandBufferCount   = 1;
    submit.pCommandBuffers      = &fd->CommandBuffer;
    submit.signalSemaphoreCount = 1;
    submit.pSignalSemaphores    = &render_complete;
    check_vk_result(vkQueueSubmit(device_->graphics_queue, 1, &submit, fd->Fence));
}

void ImGuiIntegration::frame_present()
{
    if (swapchain_rebuild_)
        return;

    ImGui_ImplVulkanH_Window* wd              = &window_data_;
    VkSemaphore               render_complete = wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;

    VkPresentInfoKHR info{};
    info.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    info.waitSemaphoreCount = 1;
    info.pWaitSemaphores    = &render_complete;
    info.swapchainCount     = 1;
    info.pSwapchains        = &wd->Swapchain;
    info.pImageIndices      = &wd->FrameIndex;

    VkResult err = vkQueuePresentKHR(device_->graphics_queue, &info);
    if (err == VK_ERROR_OUT_OF_DATE_KHR || err == VK_SUBOPTIMAL_KHR)
    {
        swapchain_rebuild_ = true;
        return;
    }
    check_vk_result(err);
    wd->SemaphoreIndex = (wd->SemaphoreIndex + 1) % wd->ImageCount;
}

}   // namespace sheetscape

#endif
