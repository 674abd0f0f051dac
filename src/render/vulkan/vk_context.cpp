#if defined(KARA_USE_GLFW) && defined(KARA_USE_IMGUI)

    #include "vk_context.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <cstring>
    #include <imgui.h>
    #include <iterator>
    #include <kara/logger.hpp>
    #include <stdexcept>
    #include <string>
    #include <vector>

namespace kara::vk
{

namespace
{

const std::vector<const char*> validation_layers = {"VK_LAYER_KHRONOS_validation"};

VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(
    VkDebugUtilsMessageSeverityFlagBitsEXT      severity,
    VkDebugUtilsMessageTypeFlagsEXT /*type*/,
    const VkDebugUtilsMessengerCallbackDataEXT* callback_data,
    void* /*user_data*/)
{
    if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
        KARA_LOG_ERROR("vulkan", "{}", callback_data->pMessage);
    else if (severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
        KARA_LOG_WARN("vulkan", "{}", callback_data->pMessage);
    return VK_FALSE;
}

void check(VkResult result, const char* what)
{
    if (result != VK_SUCCESS)
        throw std::runtime_error(std::string(what) + " (VkResult " + std::to_string(result) + ")");
}

bool check_validation_layer_support()
{
    uint32_t layer_count = 0;
    vkEnumerateInstanceLayerProperties(&layer_count, nullptr);
    std::vector<VkLayerProperties> available(layer_count);
    vkEnumerateInstanceLayerProperties(&layer_count, available.data());

    for (const char* name : validation_layers)
    {
        bool found = std::any_of(available.begin(),
                                 available.end(),
                                 [name](const VkLayerProperties& layer)
                                 { return std::strcmp(name, layer.layerName) == 0; });
        if (!found)
            return false;
    }
    return true;
}

QueueFamilyIndices find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    QueueFamilyIndices indices;

    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, families.data());

    for (uint32_t i = 0; i < count; ++i)
    {
        if (!(families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT))
            continue;

        VkBool32 present_support = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &present_support);
        if (present_support)
        {
            indices.graphics = i;
            indices.present  = i;
            break;
        }
        if (!indices.graphics)
            indices.graphics = i;
    }
    return indices;
}

int rate_device(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(device, &props);

    if (!find_queue_families(device, surface).is_complete())
        return -1;

    int score = 0;
    if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
        score += 1000;
    else if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU)
        score += 100;

    score += static_cast<int>(props.limits.maxImageDimension2D / 1024);
    return score;
}

}   // namespace

VulkanContext::~VulkanContext()
{
    shutdown();
}

// ─── Setup ───────────────────────────────────────────────────────────────────

void VulkanContext::init(GLFWwindow* window, bool enable_validation)
{
    if (initialized_)
        return;
    if (!window)
        throw std::runtime_error("No window for Vulkan surface");

    create_instance(enable_validation);
    check(glfwCreateWindowSurface(instance_, window, nullptr, &surface_),
          "Failed to create window surface");
    pick_physical_device();
    create_logical_device();
    create_descriptor_pool();

    int w = 0, h = 0;
    glfwGetFramebufferSize(window, &w, &h);
    setup_window(static_cast<uint32_t>(w), static_cast<uint32_t>(h));

    initialized_ = true;
}

void VulkanContext::create_instance(bool enable_validation)
{
    VkApplicationInfo app_info{};
    app_info.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName   = "kara";
    app_info.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.pEngineName        = "kara";
    app_info.engineVersion      = VK_MAKE_VERSION(0, 1, 0);
    app_info.apiVersion         = VK_API_VERSION_1_2;

    std::vector<const char*> extensions;
    uint32_t                 glfw_ext_count = 0;
    const char**             glfw_exts      = glfwGetRequiredInstanceExtensions(&glfw_ext_count);
    if (!glfw_exts)
        throw std::runtime_error("GLFW reports no Vulkan surface extensions");
    extensions.assign(glfw_exts, glfw_exts + glfw_ext_count);

    const bool use_validation = enable_validation && check_validation_layer_support();
    if (use_validation)
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    else if (enable_validation)
        KARA_LOG_WARN("vulkan", "validation layers requested but not available");

    VkInstanceCreateInfo create_info{};
    create_info.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    create_info.pApplicationInfo        = &app_info;
    create_info.enabledExtensionCount   = static_cast<uint32_t>(extensions.size());
    create_info.ppEnabledExtensionNames = extensions.data();

    if (use_validation)
    {
        create_info.enabledLayerCount   = static_cast<uint32_t>(validation_layers.size());
        create_info.ppEnabledLayerNames = validation_layers.data();
    }

    check(vkCreateInstance(&create_info, nullptr, &instance_), "Failed to create Vulkan instance");

    if (use_validation)
    {
        auto func = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT"));
        if (func)
        {
            VkDebugUtilsMessengerCreateInfoEXT info{};
            info.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
            info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT
                                   | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
            info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT
                               | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
            info.pfnUserCallback = debug_callback;
            func(instance_, &info, nullptr, &debug_messenger_);
        }
    }
}

void VulkanContext::pick_physical_device()
{
    uint32_t count = 0;
    vkEnumeratePhysicalDevices(instance_, &count, nullptr);
    if (count == 0)
        throw std::runtime_error("No Vulkan-capable GPU found");

    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(instance_, &count, devices.data());

    int best_score = -1;
    for (auto dev : devices)
    {
        int score = rate_device(dev, surface_);
        if (score > best_score)
        {
            best_score       = score;
            physical_device_ = dev;
        }
    }

    if (physical_device_ == VK_NULL_HANDLE)
        throw std::runtime_error("No suitable Vulkan GPU found");

    queue_families_ = find_queue_families(physical_device_, surface_);

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(physical_device_, &props);
    KARA_LOG_INFO("vulkan", "Using GPU: {}", props.deviceName);
}

void VulkanContext::create_logical_device()
{
    float                   priority = 1.0f;
    VkDeviceQueueCreateInfo qi{};
    qi.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qi.queueFamilyIndex = *queue_families_.graphics;
    qi.queueCount       = 1;
    qi.pQueuePriorities = &priority;

    const char* extensions[] = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    VkPhysicalDeviceFeatures features{};

    VkDeviceCreateInfo create_info{};
    create_info.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    create_info.queueCreateInfoCount    = 1;
    create_info.pQueueCreateInfos       = &qi;
    create_info.pEnabledFeatures        = &features;
    create_info.enabledExtensionCount   = 1;
    create_info.ppEnabledExtensionNames = extensions;

    check(vkCreateDevice(physical_device_, &create_info, nullptr, &device_),
          "Failed to create Vulkan logical device");
    vkGetDeviceQueue(device_, *queue_families_.graphics, 0, &queue_);
}

void VulkanContext::create_descriptor_pool()
{
    VkDescriptorPoolSize pool_size{};
    pool_size.type            = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    pool_size.descriptorCount = 1;

    VkDescriptorPoolCreateInfo info{};
    info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    info.flags         = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    info.maxSets       = 1;
    info.poolSizeCount = 1;
    info.pPoolSizes    = &pool_size;

    check(vkCreateDescriptorPool(device_, &info, nullptr, &descriptor_pool_),
          "Failed to create descriptor pool");
}

void VulkanContext::setup_window(uint32_t width, uint32_t height)
{
    window_data_.Surface = surface_;

    VkBool32 supported = VK_FALSE;
    vkGetPhysicalDeviceSurfaceSupportKHR(
        physical_device_, *queue_families_.graphics, surface_, &supported);
    if (supported != VK_TRUE)
        throw std::runtime_error("Selected queue cannot present to the window surface");

    const VkFormat request_formats[] = {VK_FORMAT_B8G8R8A8_UNORM,
                                        VK_FORMAT_R8G8B8A8_UNORM,
                                        VK_FORMAT_B8G8R8_UNORM,
                                        VK_FORMAT_R8G8B8_UNORM};
    window_data_.SurfaceFormat = ImGui_ImplVulkanH_SelectSurfaceFormat(
        physical_device_,
        surface_,
        request_formats,
        static_cast<int>(std::size(request_formats)),
        VK_COLORSPACE_SRGB_NONLINEAR_KHR);

    VkPresentModeKHR present_modes[] = {VK_PRESENT_MODE_FIFO_KHR};
    window_data_.PresentMode =
        ImGui_ImplVulkanH_SelectPresentMode(physical_device_, surface_, present_modes, 1);

    ImGui_ImplVulkanH_CreateOrResizeWindow(instance_,
                                           physical_device_,
                                           device_,
                                           &window_data_,
                                           *queue_families_.graphics,
                                           nullptr,
                                           static_cast<int>(width),
                                           static_cast<int>(height),
                                           MIN_IMAGE_COUNT);
    window_data_.ClearEnable = true;
}

ImGui_ImplVulkan_InitInfo VulkanContext::imgui_init_info() const
{
    ImGui_ImplVulkan_InitInfo ii{};
    ii.Instance        = instance_;
    ii.PhysicalDevice  = physical_device_;
    ii.Device          = device_;
    ii.QueueFamily     = *queue_families_.graphics;
    ii.Queue           = queue_;
    ii.DescriptorPool  = descriptor_pool_;
    ii.MinImageCount   = MIN_IMAGE_COUNT;
    ii.ImageCount      = window_data_.ImageCount;
    ii.RenderPass      = window_data_.RenderPass;
    ii.MSAASamples     = VK_SAMPLE_COUNT_1_BIT;
    return ii;
}

// ─── Frames ──────────────────────────────────────────────────────────────────

void VulkanContext::resize(uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0)
        return;

    ImGui_ImplVulkan_SetMinImageCount(MIN_IMAGE_COUNT);
    ImGui_ImplVulkanH_CreateOrResizeWindow(instance_,
                                           physical_device_,
                                           device_,
                                           &window_data_,
                                           *queue_families_.graphics,
                                           nullptr,
                                           static_cast<int>(width),
                                           static_cast<int>(height),
                                           MIN_IMAGE_COUNT);
    window_data_.FrameIndex = 0;
    swapchain_rebuild_      = false;
}

void VulkanContext::render_frame(ImDrawData* draw_data)
{
    auto* wd = &window_data_;

    VkSemaphore image_acquired = wd->FrameSemaphores[wd->SemaphoreIndex].ImageAcquiredSemaphore;
    VkSemaphore render_complete = wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;

    VkResult err = vkAcquireNextImageKHR(
        device_, wd->Swapchain, UINT64_MAX, image_acquired, VK_NULL_HANDLE, &wd->FrameIndex);
    if (err == VK_ERROR_OUT_OF_DATE_KHR || err == VK_SUBOPTIMAL_KHR)
    {
        swapchain_rebuild_ = true;
        return;
    }
    check(err, "vkAcquireNextImageKHR failed");

    ImGui_ImplVulkanH_Frame* fd = &wd->Frames[wd->FrameIndex];
    check(vkWaitForFences(device_, 1, &fd->Fence, VK_TRUE, UINT64_MAX), "vkWaitForFences failed");
    check(vkResetFences(device_, 1, &fd->Fence), "vkResetFences failed");
    check(vkResetCommandPool(device_, fd->CommandPool, 0), "vkResetCommandPool failed");

    VkCommandBufferBeginInfo begin{};
    begin.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin.flags |= VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    check(vkBeginCommandBuffer(fd->CommandBuffer, &begin), "vkBeginCommandBuffer failed");

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
    check(vkEndCommandBuffer(fd->CommandBuffer), "vkEndCommandBuffer failed");

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
    check(vkQueueSubmit(queue_, 1, &submit, fd->Fence), "vkQueueSubmit failed");
}

void VulkanContext::present_frame()
{
    if (swapchain_rebuild_)
        return;

    auto*       wd              = &window_data_;
    VkSemaphore render_complete = wd->FrameSemaphores[wd->SemaphoreIndex].RenderCompleteSemaphore;

    VkPresentInfoKHR info{};
    info.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    info.waitSemaphoreCount = 1;
    info.pWaitSemaphores    = &render_complete;
    info.swapchainCount     = 1;
    info.pSwapchains        = &wd->Swapchain;
    info.pImageIndices      = &wd->FrameIndex;

    VkResult err = vkQueuePresentKHR(queue_, &info);
    if (err == VK_ERROR_OUT_OF_DATE_KHR || err == VK_SUBOPTIMAL_KHR)
    {
        swapchain_rebuild_ = true;
        return;
    }
    check(err, "vkQueuePresentKHR failed");
    wd->SemaphoreIndex = (wd->SemaphoreIndex + 1) % wd->ImageCount;
}

void VulkanContext::wait_idle()
{
    if (device_ != VK_NULL_HANDLE)
        vkDeviceWaitIdle(device_);
}

// ─── Teardown ────────────────────────────────────────────────────────────────

void VulkanContext::shutdown()
{
    if (instance_ == VK_NULL_HANDLE)
        return;

    wait_idle();

    if (device_ != VK_NULL_HANDLE)
    {
        if (window_data_.Swapchain != VK_NULL_HANDLE)
            ImGui_ImplVulkanH_DestroyWindow(instance_, device_, &window_data_, nullptr);
        else if (surface_ != VK_NULL_HANDLE)
            vkDestroySurfaceKHR(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;

        if (descriptor_pool_ != VK_NULL_HANDLE)
            vkDestroyDescriptorPool(device_, descriptor_pool_, nullptr);
        vkDestroyDevice(device_, nullptr);
    }
    else if (surface_ != VK_NULL_HANDLE)
    {
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
    }

    if (debug_messenger_ != VK_NULL_HANDLE)
    {
        auto func = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (func)
            func(instance_, debug_messenger_, nullptr);
    }
    vkDestroyInstance(instance_, nullptr);

    instance_        = VK_NULL_HANDLE;
    device_          = VK_NULL_HANDLE;
    descriptor_pool_ = VK_NULL_HANDLE;
    debug_messenger_ = VK_NULL_HANDLE;
    initialized_     = false;
}

}   // namespace kara::vk

#endif
