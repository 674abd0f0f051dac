#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ui/view_mode.hpp"

namespace kara
{

// GLFW key codes, kept here so the session and its tests never include GLFW.
namespace keys
{
constexpr int SPACE         = 32;
constexpr int APOSTROPHE    = 39;
constexpr int COMMA         = 44;
constexpr int MINUS         = 45;
constexpr int PERIOD        = 46;
constexpr int SLASH         = 47;
constexpr int NUM_0         = 48;
constexpr int NUM_9         = 57;
constexpr int SEMICOLON     = 59;
constexpr int EQUAL         = 61;
constexpr int A             = 65;
constexpr int E             = 69;
constexpr int F             = 70;
constexpr int G             = 71;
constexpr int J             = 74;
constexpr int K             = 75;
constexpr int N             = 78;
constexpr int P             = 80;
constexpr int Q             = 81;
constexpr int S             = 83;
constexpr int T             = 84;
constexpr int Z             = 90;
constexpr int LEFT_BRACKET  = 91;
constexpr int BACKSLASH     = 92;
constexpr int RIGHT_BRACKET = 93;
constexpr int GRAVE_ACCENT  = 96;
constexpr int ESCAPE        = 256;
constexpr int ENTER         = 257;
constexpr int TAB           = 258;
constexpr int BACKSPACE     = 259;
constexpr int INSERT        = 260;
constexpr int DELETE        = 261;
constexpr int RIGHT         = 262;
constexpr int LEFT          = 263;
constexpr int DOWN          = 264;
constexpr int UP            = 265;
constexpr int PAGE_UP       = 266;
constexpr int PAGE_DOWN     = 267;
constexpr int HOME          = 268;
constexpr int END           = 269;
constexpr int F1            = 290;
constexpr int F12           = 301;
}   // namespace keys

// Modifier flags (matching GLFW modifier bits)
enum class KeyMod : uint8_t
{
    None    = 0,
    Shift   = 0x01,
    Control = 0x02,
    Alt     = 0x04,
    Super   = 0x08,
};

inline KeyMod operator|(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline KeyMod operator&(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}
inline bool has_mod(KeyMod mods, KeyMod flag)
{
    return (static_cast<uint8_t>(mods) & static_cast<uint8_t>(flag)) != 0;
}

// GLFW action values.
enum class KeyAction : uint8_t
{
    Release = 0,
    Press   = 1,
    Repeat  = 2,
};

// A keyboard shortcut: key + modifiers.
struct Shortcut
{
    int    key  = 0;   // GLFW key code
    KeyMod mods = KeyMod::None;

    bool operator==(const Shortcut& o) const { return key == o.key && mods == o.mods; }
    bool operator!=(const Shortcut& o) const { return !(*this == o); }

    // Human-readable form, e.g. "Ctrl+Shift+Z"
    std::string to_string() const;

    // Parse the human-readable form. Returns an invalid shortcut on failure.
    static Shortcut from_string(const std::string& str);

    bool valid() const { return key != 0; }
};

struct ShortcutHash
{
    size_t operator()(const Shortcut& s) const
    {
        return std::hash<int>()(s.key) ^ (std::hash<uint8_t>()(static_cast<uint8_t>(s.mods)) << 16);
    }
};

// One input event as delivered to the session. A key event carries `key`;
// a text event carries `codepoint` (key 0) and is only meaningful in TextEdit.
struct KeyEvent
{
    int       key       = 0;
    KeyMod    mods      = KeyMod::None;
    KeyAction action    = KeyAction::Press;
    char32_t  codepoint = 0;

    static KeyEvent press(int key, KeyMod mods = KeyMod::None)
    {
        return {key, mods, KeyAction::Press, 0};
    }
    static KeyEvent text(char32_t cp) { return {0, KeyMod::None, KeyAction::Press, cp}; }

    Shortcut shortcut() const { return {key, mods}; }
    bool     is_text() const { return key == 0 && codepoint != 0; }
};

enum class Command : uint8_t
{
    TogglePlay,
    SeekBackward,
    SeekForward,
    EnterTextEdit,
    CycleViewMode,
    Quit,
    ExportPreview,
    Undo,
    Redo,
    NextLine,
    PrevLine,
    SelectPrevLine,
    SelectNextLine,
    ToggleEditMode,
    AddKeyframe,
    RemoveKeyframe,
    AdjustUp,
    AdjustDown,
    NextKeyframe,
    PrevKeyframe,
    CursorLeft,
    CursorRight,
    CursorUp,
    CursorDown,
    MoveLineUp,
    MoveLineDown,
    Backspace,
    SplitLine,
    Count
};

// Stable identifier, e.g. "keyframe.add". Used by the keymap config file.
const char*            command_id(Command command);
std::optional<Command> command_from_id(std::string_view id);

struct KeyBinding
{
    ViewMode mode;
    Shortcut shortcut;
    Command  command;
};

// Per-mode table of shortcut -> command. The same shortcut may mean
// different commands in different modes (Left seeks in List, moves the
// cursor in TextEdit).
class Keymap
{
   public:
    Keymap() = default;

    // Bind a shortcut in one mode. Replaces an existing binding for it.
    void bind(ViewMode mode, Shortcut shortcut, Command command);

    void unbind(ViewMode mode, const Shortcut& shortcut);

    // Unbind every shortcut of `command` in every mode.
    void unbind_command(Command command);

    std::optional<Command> lookup(ViewMode mode, const Shortcut& shortcut) const;

    // Shortcuts of `command` in `mode`, sorted for display.
    std::vector<Shortcut> shortcuts_for(ViewMode mode, Command command) const;

    // Modes in which `command` has at least one binding.
    std::vector<ViewMode> modes_for(Command command) const;

    // All bindings ordered by mode, then command, then shortcut text.
    std::vector<KeyBinding> all_bindings() const;

    // Install the default key layout.
    void register_defaults();

    size_t count() const;
    void   clear();

   private:
    using Table = std::unordered_map<Shortcut, Command, ShortcutHash>;

    Table&       table(ViewMode mode) { return tables_[static_cast<size_t>(mode)]; }
    const Table& table(ViewMode mode) const { return tables_[static_cast<size_t>(mode)]; }

    std::array<Table, VIEW_MODE_COUNT> tables_;
};

}   // namespace kara
