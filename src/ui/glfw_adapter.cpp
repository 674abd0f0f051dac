#ifdef KARA_USE_GLFW

    #include "glfw_adapter.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <kara/logger.hpp>

namespace kara
{

namespace
{

KeyAction translate_action(int action)
{
    switch (action)
    {
        case GLFW_RELEASE:
            return KeyAction::Release;
        case GLFW_REPEAT:
            return KeyAction::Repeat;
        default:
            return KeyAction::Press;
    }
}

KeyMod translate_mods(int mods)
{
    KeyMod out = KeyMod::None;
    if (mods & GLFW_MOD_SHIFT)
        out = out | KeyMod::Shift;
    if (mods & GLFW_MOD_CONTROL)
        out = out | KeyMod::Control;
    if (mods & GLFW_MOD_ALT)
        out = out | KeyMod::Alt;
    if (mods & GLFW_MOD_SUPER)
        out = out | KeyMod::Super;
    return out;
}

GlfwAdapter* adapter_of(GLFWwindow* window)
{
    return static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
}

}   // namespace

GlfwAdapter::~GlfwAdapter()
{
    close();
}

bool GlfwAdapter::open(const WindowConfig& config)
{
    if (glfwInit() != GLFW_TRUE)
    {
        KARA_LOG_ERROR("glfw", "glfwInit failed");
        return false;
    }
    if (glfwVulkanSupported() != GLFW_TRUE)
    {
        KARA_LOG_ERROR("glfw", "no Vulkan loader found");
        glfwTerminate();
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    window_ = glfwCreateWindow(static_cast<int>(config.width),
                               static_cast<int>(config.height),
                               config.title.c_str(),
                               nullptr,
                               nullptr);
    if (window_ == nullptr)
    {
        KARA_LOG_ERROR("glfw", "cannot create a {}x{} window", config.width, config.height);
        glfwTerminate();
        return false;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetKeyCallback(window_, &GlfwAdapter::on_key);
    glfwSetCharCallback(window_, &GlfwAdapter::on_char);
    glfwSetFramebufferSizeCallback(window_, &GlfwAdapter::on_framebuffer_size);

    KARA_LOG_DEBUG("glfw", "window {}x{} created", config.width, config.height);
    return true;
}

void GlfwAdapter::close()
{
    if (window_ == nullptr)
        return;
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

bool GlfwAdapter::pump(double timeout_sec)
{
    if (window_ == nullptr)
        return false;
    glfwWaitEventsTimeout(timeout_sec);
    return glfwWindowShouldClose(window_) == GLFW_FALSE;
}

bool GlfwAdapter::take_resize()
{
    bool was = resized_;
    resized_ = false;
    return was;
}

uint32_t GlfwAdapter::framebuffer_width() const
{
    int w = 0;
    if (window_)
        glfwGetFramebufferSize(window_, &w, nullptr);
    return static_cast<uint32_t>(w);
}

uint32_t GlfwAdapter::framebuffer_height() const
{
    int h = 0;
    if (window_)
        glfwGetFramebufferSize(window_, nullptr, &h);
    return static_cast<uint32_t>(h);
}

double GlfwAdapter::now()
{
    return glfwGetTime();
}

// ─── GLFW callbacks ──────────────────────────────────────────────────────────

void GlfwAdapter::on_key(GLFWwindow* window, int key, int, int action, int mods)
{
    GlfwAdapter* self = adapter_of(window);
    if (self == nullptr || !self->handler_ || key == GLFW_KEY_UNKNOWN)
        return;

    KeyEvent event;
    event.key    = key;
    event.mods   = translate_mods(mods);
    event.action = translate_action(action);
    self->handler_(event);
}

void GlfwAdapter::on_char(GLFWwindow* window, unsigned int codepoint)
{
    GlfwAdapter* self = adapter_of(window);
    if (self && self->handler_)
        self->handler_(KeyEvent::text(static_cast<char32_t>(codepoint)));
}

void GlfwAdapter::on_framebuffer_size(GLFWwindow* window, int, int)
{
    if (GlfwAdapter* self = adapter_of(window))
        self->resized_ = true;
}

}   // namespace kara

#endif   // KARA_USE_GLFW
