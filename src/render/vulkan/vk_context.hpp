#pragma once

#if defined(KARA_USE_GLFW) && defined(KARA_USE_IMGUI)

    #include <vulkan/vulkan.h>

    #include <cstdint>
    #include <imgui_impl_vulkan.h>
    #include <optional>

struct GLFWwindow;
struct ImDrawData;

namespace kara::vk
{

struct QueueFamilyIndices
{
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    // ImGui's window helpers record and present on one queue.
    bool is_complete() const { return graphics.has_value() && graphics == present; }
};

// Everything needed to present ImGui frames into one GLFW window:
// instance, surface, device, a graphics+present queue, a descriptor pool
// and the swapchain/render pass/framebuffers owned by ImGui's helper window.
// Setup failures throw std::runtime_error.
class VulkanContext
{
   public:
    static constexpr uint32_t MIN_IMAGE_COUNT = 2;

    VulkanContext() = default;
    ~VulkanContext();

    VulkanContext(const VulkanContext&)            = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;

    void init(GLFWwindow* window, bool enable_validation);
    void shutdown();

    // Recreate the swapchain after a resize or an out-of-date present.
    void resize(uint32_t width, uint32_t height);
    bool needs_rebuild() const { return swapchain_rebuild_; }

    // Record `draw_data` into the next swapchain image and queue it.
    void render_frame(ImDrawData* draw_data);
    void present_frame();

    void wait_idle();

    // Fill the ImGui backend init block for this device.
    ImGui_ImplVulkan_InitInfo imgui_init_info() const;

   private:
    VkInstance               instance_        = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debug_messenger_ = VK_NULL_HANDLE;
    VkSurfaceKHR             surface_         = VK_NULL_HANDLE;
    VkPhysicalDevice         physical_device_ = VK_NULL_HANDLE;
    VkDevice                 device_          = VK_NULL_HANDLE;
    VkQueue                  queue_           = VK_NULL_HANDLE;
    VkDescriptorPool         descriptor_pool_ = VK_NULL_HANDLE;
    QueueFamilyIndices       queue_families_;

    ImGui_ImplVulkanH_Window window_data_{};
    bool                     swapchain_rebuild_ = false;
    bool                     initialized_       = false;

    void create_instance(bool enable_validation);
    void pick_physical_device();
    void create_logical_device();
    void create_descriptor_pool();
    void setup_window(uint32_t width, uint32_t height);
};

}   // namespace kara::vk

#endif
