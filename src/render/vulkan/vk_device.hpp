#pragma once

#ifdef SHEETSCAPE_USE_GLFW

    #include <cstdint>
    #include <optional>
    #include <vector>
    #include <vulkan/vulkan.h>

namespace sheetscape::vk
{

struct QueueFamilyIndices
{
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    bool is_complete() const { return graphics.has_value() && present.has_value(); }
};

// Instance, device and the pools the ImGui backend needs. Bring-up failures
// throw std::runtime_error; main() reports them.
struct DeviceContext
{
    VkInstance               instance        = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debug_messenger = VK_NULL_HANDLE;
    VkSurfaceKHR             surface         = VK_NULL_HANDLE;
    VkPhysicalDevice         physical_device = VK_NULL_HANDLE;
    VkDevice                 device          = VK_NULL_HANDLE;
    VkQueue                  graphics_queue  = VK_NULL_HANDLE;
    VkDescriptorPool         descriptor_pool = VK_NULL_HANDLE;
    QueueFamilyIndices       queue_families;

    // Creates everything for the given GLFW window.
    void init(void* glfw_window, bool enable_validation);
    void shutdown();
};

VkInstance create_instance(bool enable_validation);

VkDebugUtilsMessengerEXT create_debug_messenger(VkInstance instance);
void destroy_debug_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger);

QueueFamilyIndices find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface);
VkPhysicalDevice   pick_physical_device(VkInstance instance, VkSurfaceKHR surface);

// One queue: the graphics family must also present.
VkDevice create_logical_device(VkPhysicalDevice          physical_device,
                               const QueueFamilyIndices& indices,
                               bool                      enable_validation);

VkDescriptorPool create_descriptor_pool(VkDevice device);

bool check_validation_layer_support();

}   // namespace sheetscape::vk

#endif   // SHEETSCAPE_USE_GLFW
