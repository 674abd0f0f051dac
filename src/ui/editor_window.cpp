#ifdef KARA_USE_IMGUI

    #include "editor_window.hpp"

    #include <algorithm>
    #include <cmath>
    #include <imgui.h>
    #include <imgui_impl_glfw.h>
    #include <imgui_impl_vulkan.h>
    #include <kara/logger.hpp>
    #include <string>
    #include <vector>

    #include "core/utf8.hpp"
    #include "render/vulkan/vk_context.hpp"
    #include "ui/edit_session.hpp"

namespace kara
{

namespace
{

const ImVec4 COLOR_PLAYED   = {1.0f, 1.0f, 1.0f, 1.0f};
const ImVec4 COLOR_IDLE     = {0.45f, 0.45f, 0.45f, 1.0f};
const ImVec4 COLOR_TIME     = {0.65f, 0.65f, 0.65f, 1.0f};
const ImVec4 COLOR_PLAYING  = {0.30f, 0.85f, 0.35f, 1.0f};
const ImVec4 COLOR_SELECTED = {0.35f, 0.55f, 1.0f, 1.0f};
const ImVec4 COLOR_NEAR_KF  = {1.0f, 0.90f, 0.20f, 1.0f};
const ImVec4 COLOR_STATUS   = {0.30f, 0.80f, 0.85f, 1.0f};

ImVec4 rgb(float r, float g, float b)
{
    return {r / 255.0f, g / 255.0f, b / 255.0f, 1.0f};
}

// Color of glyph `i` with the highlight at `target`: played glyphs are white,
// the next ones fade from warm yellow to dim grey over 2.5 characters.
ImVec4 glyph_color(size_t i, float target)
{
    float pos = static_cast<float>(i);
    if (target >= pos)
        return COLOR_PLAYED;
    float intensity = std::clamp(1.0f - (pos - target) / 2.5f, 0.0f, 1.0f);
    return rgb(60.0f + 195.0f * intensity, 60.0f + 195.0f * intensity, 60.0f + 40.0f * (1.0f - intensity));
}

void draw_glyph(const std::string& glyph, const ImVec4& color)
{
    ImGui::SameLine(0.0f, 0.0f);
    ImGui::TextColored(color, "%s", glyph.c_str());
}

void draw_animated_text(const LyricLine& line, float current_time)
{
    float target = line.get_current_index(line.relative_time(current_time));
    auto  glyphs = utf8::split_chars(line.text);
    for (size_t i = 0; i < glyphs.size(); ++i)
        draw_glyph(glyphs[i], glyph_color(i, target));
}

void draw_text_with_cursor(const LyricLine& line, size_t cursor)
{
    auto glyphs = utf8::split_chars(line.text);
    for (size_t i = 0; i < glyphs.size(); ++i)
    {
        if (i == cursor)
            draw_glyph("|", COLOR_SELECTED);
        draw_glyph(glyphs[i], COLOR_PLAYED);
    }
    if (cursor >= glyphs.size())
        draw_glyph("|", COLOR_SELECTED);
}

const char* mode_hint(ViewMode mode)
{
    switch (mode)
    {
        case ViewMode::List:
            return "LIST [Esc] | TEXT EDIT [E] | [Q] Quit | [Space] Play";
        case ViewMode::Focus:
            return "FOCUS [Esc] | [Q] Quit | [Space] Play";
        case ViewMode::TextEdit:
            return "DONE [Esc]";
    }
    return "";
}

}   // namespace

EditorWindow::~EditorWindow()
{
    shutdown();
}

bool EditorWindow::init(vk::VulkanContext& context, GLFWwindow* window)
{
    if (initialized_)
        return true;
    if (!window)
        return false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& io    = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForVulkan(window, true))
    {
        KARA_LOG_ERROR("ui", "ImGui GLFW backend init failed");
        ImGui::DestroyContext();
        return false;
    }

    ImGui_ImplVulkan_InitInfo ii = context.imgui_init_info();
    if (!ImGui_ImplVulkan_Init(&ii))
    {
        KARA_LOG_ERROR("ui", "ImGui Vulkan backend init failed");
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        return false;
    }
    ImGui_ImplVulkan_CreateFontsTexture();

    initialized_ = true;
    return true;
}

void EditorWindow::shutdown()
{
    if (!initialized_)
        return;
    ImGui_ImplVulkan_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    initialized_ = false;
}

ImDrawData* EditorWindow::build_frame(const EditSession& session)
{
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    const ImGuiIO& io = ImGui::GetIO();
    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(io.DisplaySize);
    ImGui::Begin("kara",
                 nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
                     | ImGuiWindowFlags_NoSavedSettings
                     | ImGuiWindowFlags_NoBringToFrontOnFocus);

    draw_header(session);
    ImGui::Separator();

    if (session.view_mode() == ViewMode::Focus)
        draw_focus_view(session);
    else
        draw_list_view(session);

    ImGui::End();
    ImGui::Render();
    return ImGui::GetDrawData();
}

// ─── Header ──────────────────────────────────────────────────────────────────

void EditorWindow::draw_header(const EditSession& session)
{
    float rel_time = 0.0f;
    if (auto idx = session.editor_line_index())
    {
        const auto& line = session.data().lines[*idx];
        rel_time = std::clamp(line.relative_time(session.current_time()), 0.0f, line.duration());
    }

    ImVec4 status = COLOR_SELECTED;
    if (session.view_mode() == ViewMode::Focus)
        status = session.is_playing() ? COLOR_PLAYING : COLOR_NEAR_KF;

    ImGui::TextColored(status,
                       "%s | Time: %.2fs | Relative: %.2fs",
                       mode_hint(session.view_mode()),
                       session.current_time(),
                       rel_time);

    if (session.view_mode() == ViewMode::List && session.manual_scroll())
        ImGui::TextUnformatted("MANUAL SCROLLING (Esc for auto)");
    else if (session.view_mode() == ViewMode::Focus)
        ImGui::TextUnformatted("[N] Next Line | [P] Prev Line");
    else
        ImGui::TextUnformatted("");
}

// ─── List view ───────────────────────────────────────────────────────────────

void EditorWindow::draw_list_view(const EditSession& session)
{
    const auto& lines     = session.data().lines;
    const bool  text_edit = session.view_mode() == ViewMode::TextEdit;
    const auto  playing   = session.playing_line_index();
    const auto  focus     = session.focus_line_index();

    ImGui::BeginChild("lines", ImVec2(0.0f, 0.0f), false);

    size_t scroll_target = session.scroll_offset();
    if (text_edit && focus)
        scroll_target = *focus;

    for (size_t i = 0; i < lines.size(); ++i)
    {
        const auto& line     = lines[i];
        const bool  is_play  = playing && *playing == i;
        const bool  editing  = text_edit && focus && *focus == i;
        const bool  selected = (session.manual_scroll() && i == session.scroll_offset()) || editing;

        ImGui::TextColored(COLOR_TIME, "[%.2f]", line.start);
        ImGui::SameLine();
        ImGui::TextColored(is_play ? COLOR_PLAYING : COLOR_SELECTED,
                           "%s",
                           is_play ? ">> " : (selected ? "-> " : "   "));

        // Glyph runs continue flush after the marker
        if (editing)
            draw_text_with_cursor(line, session.cursor_col());
        else if (is_play)
            draw_animated_text(line, session.current_time());
        else
            draw_glyph(line.text, selected ? COLOR_SELECTED : COLOR_IDLE);

        if (i == scroll_target && last_scroll_ != scroll_target)
        {
            ImGui::SetScrollHereY(0.3f);
            last_scroll_ = scroll_target;
        }
    }

    ImGui::EndChild();
}

// ─── Focus view ──────────────────────────────────────────────────────────────

void EditorWindow::draw_focus_view(const EditSession& session)
{
    last_scroll_.reset();

    auto idx = session.editor_line_index();
    if (!idx)
    {
        ImGui::TextUnformatted("Waiting for next line...");
        return;
    }

    const auto& line     = session.data().lines[*idx];
    const float rel_time = line.relative_time(session.current_time());

    ImGui::Dummy(ImVec2(0.0f, ImGui::GetTextLineHeight() * 3.0f));
    float text_w = ImGui::CalcTextSize(line.text.c_str()).x;
    float avail  = ImGui::GetContentRegionAvail().x;
    ImGui::SetCursorPosX(std::max((avail - text_w) * 0.5f, 0.0f));
    ImGui::TextUnformatted("");
    draw_animated_text(line, session.current_time());

    ImGui::Dummy(ImVec2(0.0f, ImGui::GetTextLineHeight() * 3.0f));
    ImGui::SeparatorText("Editor");

    float length = static_cast<float>(std::max<size_t>(line.length(), 1));
    for (size_t ki = 0; ki < line.keyframes.size(); ++ki)
    {
        const auto& kf      = line.keyframes[ki];
        const bool  is_near = std::fabs(kf.time - rel_time) < 0.1f;
        if (ki > 0)
            ImGui::SameLine();
        ImGui::TextColored(is_near ? COLOR_NEAR_KF : COLOR_IDLE,
                           "[KF%zu: %.2fs|%.0f%%]",
                           ki,
                           kf.time,
                           kf.index / length * 100.0f);
    }

    ImGui::TextColored(COLOR_STATUS,
                       "LINE %zu | EDIT: %s",
                       *idx + 1,
                       session.edit_mode() == EditMode::Time ? "TIME" : "PROGRESS");
    ImGui::TextUnformatted("[T] Toggle Edit Mode | [F] Add | [G/Del] Delete");
    ImGui::TextUnformatted("[J/K] Jump | [Up/Down] Adjust Value");
}

}   // namespace kara

#endif   // KARA_USE_IMGUI
