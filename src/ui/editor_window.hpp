#pragma once

#ifdef KARA_USE_IMGUI

    #include <cstddef>
    #include <optional>

struct GLFWwindow;
struct ImDrawData;

namespace kara
{

class EditSession;

namespace vk
{
class VulkanContext;
}

// Dear ImGui front end: owns the ImGui context and its GLFW/Vulkan backends
// and draws the session's list or focus view each frame. Reads the session,
// never mutates it.
class EditorWindow
{
   public:
    EditorWindow() = default;
    ~EditorWindow();

    EditorWindow(const EditorWindow&)            = delete;
    EditorWindow& operator=(const EditorWindow&) = delete;

    // `window` must already carry the application's GLFW callbacks; the
    // ImGui backend chains to them.
    bool init(vk::VulkanContext& context, GLFWwindow* window);
    void shutdown();

    // Build this frame's UI and return the draw data to record.
    ImDrawData* build_frame(const EditSession& session);

   private:
    void draw_header(const EditSession& session);
    void draw_list_view(const EditSession& session);
    void draw_focus_view(const EditSession& session);

    bool                  initialized_ = false;
    std::optional<size_t> last_scroll_;
};

}   // namespace kara

#endif   // KARA_USE_IMGUI
