#ifdef SHEETSCAPE_USE_GLFW

    #include "glfw_adapter.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <sheetscape/logger.hpp>

namespace sheetscape
{

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

bool GlfwAdapter::init(uint32_t width, uint32_t height, const std::string& title)
{
    if (!glfwInit())
    {
        SHEETSCAPE_LOG_ERROR("glfw", "glfwInit failed");
        return false;
    }
    if (!glfwVulkanSupported())
    {
        SHEETSCAPE_LOG_ERROR("glfw", "no Vulkan loader found");
        glfwTerminate();
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    window_ = glfwCreateWindow(
        static_cast<int>(width), static_cast<int>(height), title.c_str(), nullptr, nullptr);
    if (!window_)
    {
        SHEETSCAPE_LOG_ERROR("glfw", "cannot create {}x{} window", width, height);
        glfwTerminate();
        return false;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetCursorPosCallback(window_, cursor_pos_callback);
    glfwSetMouseButtonCallback(window_, mouse_button_callback);
    SHEETSCAPE_LOG_DEBUG("glfw", "window {}x{}", width, height);
    return true;
}

void GlfwAdapter::shutdown()
{
    if (!window_)
        return;
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

void GlfwAdapter::wait_events()
{
    glfwWaitEvents();
}

bool GlfwAdapter::should_close() const
{
    return !window_ || glfwWindowShouldClose(window_);
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    int w = 0;
    int h = 0;
    if (window_)
        glfwGetFramebufferSize(window_, &w, &h);
    width  = static_cast<uint32_t>(w);
    height = static_cast<uint32_t>(h);
}

// ─── Callbacks ───────────────────────────────────────────────────────────────

void GlfwAdapter::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* self = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (self && self->on_pointer_)
        self->on_pointer_(PointerAction::Move, static_cast<float>(x), static_cast<float>(y));
}

void GlfwAdapter::mouse_button_callback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    auto* self = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (!self || !self->on_pointer_)
        return;

    PointerAction pointer;
    if (button == GLFW_MOUSE_BUTTON_LEFT)
        pointer = action == GLFW_PRESS ? PointerAction::Press : PointerAction::Release;
    else if (button == GLFW_MOUSE_BUTTON_RIGHT && action == GLFW_PRESS)
        pointer = PointerAction::ContextPress;
    else
        return;

    double x = 0.0;
    double y = 0.0;
    glfwGetCursorPos(window, &x, &y);
    self->on_pointer_(pointer, static_cast<float>(x), static_cast<float>(y));
}

}   // namespace sheetscape

#endif   // SHEETSCAPE_USE_GLFW
