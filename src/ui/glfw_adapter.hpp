#pragma once

#ifdef KARA_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>

    #include "ui/keymap.hpp"

struct GLFWwindow;

namespace kara
{

struct WindowConfig
{
    uint32_t    width  = 1100;
    uint32_t    height = 640;
    std::string title  = "kara";
};

// Owns the GLFW window and turns its key and character callbacks into
// KeyEvents. The window has no client API; Vulkan draws into it.
class GlfwAdapter
{
   public:
    using EventHandler = std::function<void(const KeyEvent&)>;

    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    bool open(const WindowConfig& config);
    void close();

    // Receives every translated key press, repeat, release and character.
    void set_event_handler(EventHandler handler) { handler_ = std::move(handler); }

    // Dispatch pending events, waiting at most `timeout_sec` for one.
    // Returns false once the user asked to close the window.
    bool pump(double timeout_sec);

    // True once after the framebuffer changed size.
    bool take_resize();

    uint32_t framebuffer_width() const;
    uint32_t framebuffer_height() const;

    GLFWwindow* handle() const { return window_; }

    static double now();

   private:
    static void on_key(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void on_char(GLFWwindow* window, unsigned int codepoint);
    static void on_framebuffer_size(GLFWwindow* window, int width, int height);

    GLFWwindow*  window_ = nullptr;
    EventHandler handler_;
    bool         resized_ = false;
};

}   // namespace kara

#endif   // KARA_USE_GLFW
