#pragma once

#ifdef SHEETSCAPE_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>

struct GLFWwindow;

namespace sheetscape
{

// Mouse input reduced to what the workspace routes.
enum class PointerAction
{
    Move,
    Press,          // left button down
    Release,        // left button up
    ContextPress,   // right button down
};

// Window for the desktop front-end. The window has no client API; the Vulkan
// surface is created from handle(). Pointer positions are in window pixels,
// origin top-left.
class GlfwAdapter
{
   public:
    using PointerCallback = std::function<void(PointerAction action, float x, float y)>;

    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    bool init(uint32_t width, uint32_t height, const std::string& title);
    void shutdown();

    void poll_events();
    // Blocks until an event arrives (used while minimized).
    void wait_events();

    bool        should_close() const;
    GLFWwindow* handle() const { return window_; }

    void framebuffer_size(uint32_t& width, uint32_t& height) const;

    // Install before the ImGui backend so it can chain to these.
    void set_pointer_callback(PointerCallback cb) { on_pointer_ = std::move(cb); }

   private:
    GLFWwindow*     window_ = nullptr;
    PointerCallback on_pointer_;

    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
};

}   // namespace sheetscape

#endif   // SHEETSCAPE_USE_GLFW
