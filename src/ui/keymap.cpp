#include "keymap.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace kara
{

// ─── Shortcut string conversion ──────────────────────────────────────────────

namespace
{

struct KeyName
{
    int              key;
    std::string_view name;
};

// First entry per key is the canonical spelling; later ones are aliases.
constexpr KeyName KEY_NAMES[] = {
    {keys::SPACE, "Space"},         {keys::ESCAPE, "Escape"},     {keys::ESCAPE, "Esc"},
    {keys::ENTER, "Enter"},         {keys::ENTER, "Return"},      {keys::TAB, "Tab"},
    {keys::BACKSPACE, "Backspace"}, {keys::INSERT, "Insert"},     {keys::DELETE, "Delete"},
    {keys::DELETE, "Del"},          {keys::RIGHT, "Right"},       {keys::LEFT, "Left"},
    {keys::DOWN, "Down"},           {keys::UP, "Up"},             {keys::PAGE_UP, "PageUp"},
    {keys::PAGE_DOWN, "PageDown"},  {keys::HOME, "Home"},         {keys::END, "End"},
    {keys::MINUS, "-"},             {keys::EQUAL, "="},           {keys::LEFT_BRACKET, "["},
    {keys::RIGHT_BRACKET, "]"},     {keys::SEMICOLON, ";"},       {keys::APOSTROPHE, "'"},
    {keys::COMMA, ","},             {keys::PERIOD, "."},          {keys::SLASH, "/"},
    {keys::BACKSLASH, "\\"},
};

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size()
           && std::equal(a.begin(),
                         a.end(),
                         b.begin(),
                         [](char x, char y)
                         {
                             return std::tolower(static_cast<unsigned char>(x))
                                    == std::tolower(static_cast<unsigned char>(y));
                         });
}

struct ModName
{
    KeyMod           mod;
    std::string_view name;
};

// Printed in this order.
constexpr ModName MOD_NAMES[] = {
    {KeyMod::Control, "Ctrl"},
    {KeyMod::Shift, "Shift"},
    {KeyMod::Alt, "Alt"},
    {KeyMod::Super, "Super"},
};

constexpr ModName MOD_ALIASES[] = {
    {KeyMod::Control, "Control"},
    {KeyMod::Super, "Meta"},
    {KeyMod::Super, "Cmd"},
};

const ModName* find_mod(std::string_view name)
{
    for (const auto& m : MOD_NAMES)
    {
        if (iequals(m.name, name))
            return &m;
    }
    for (const auto& m : MOD_ALIASES)
    {
        if (iequals(m.name, name))
            return &m;
    }
    return nullptr;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

std::string key_name(int key)
{
    if ((key >= keys::A && key <= keys::Z) || (key >= keys::NUM_0 && key <= keys::NUM_9))
        return std::string(1, static_cast<char>(key));
    if (key >= keys::F1 && key <= keys::F12)
        return "F" + std::to_string(key - keys::F1 + 1);
    for (const auto& entry : KEY_NAMES)
    {
        if (entry.key == key)
            return std::string(entry.name);
    }
    return "Key" + std::to_string(key);
}

int parse_key_name(std::string_view name)
{
    if (name.size() == 1 && std::isalnum(static_cast<unsigned char>(name[0])))
        return std::toupper(static_cast<unsigned char>(name[0]));

    for (const auto& entry : KEY_NAMES)
    {
        if (iequals(entry.name, name))
            return entry.key;
    }

    if (name.size() >= 2 && name.size() <= 3 && (name[0] == 'F' || name[0] == 'f'))
    {
        int n = 0;
        for (char c : name.substr(1))
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return 0;
            n = n * 10 + (c - '0');
        }
        if (n >= 1 && n <= 12)
            return keys::F1 + n - 1;
    }
    return 0;
}

}   // namespace

std::string Shortcut::to_string() const
{
    std::string out;
    for (const auto& m : MOD_NAMES)
    {
        if (has_mod(mods, m.mod))
        {
            out.append(m.name);
            out += '+';
        }
    }
    out += key_name(key);
    return out;
}

Shortcut Shortcut::from_string(const std::string& str)
{
    std::string_view rest = str;
    Shortcut         parsed;

    // Every '+'-separated token but the last names a modifier.
    for (size_t plus = rest.find('+'); plus != std::string_view::npos && plus + 1 < rest.size();
         plus        = rest.find('+'))
    {
        const ModName* match = find_mod(trim(rest.substr(0, plus)));
        if (match == nullptr)
            return {};
        parsed.mods = parsed.mods | match->mod;
        rest.remove_prefix(plus + 1);
    }

    parsed.key = parse_key_name(trim(rest));
    if (!parsed.valid())
        return {};
    return parsed;
}

// ─── Command ids ─────────────────────────────────────────────────────────────

namespace
{

struct CommandEntry
{
    Command     command;
    const char* id;
};

constexpr CommandEntry COMMAND_IDS[] = {
    {Command::TogglePlay, "playback.toggle"},
    {Command::SeekBackward, "playback.seek_backward"},
    {Command::SeekForward, "playback.seek_forward"},
    {Command::EnterTextEdit, "view.text_edit"},
    {Command::CycleViewMode, "view.cycle"},
    {Command::Quit, "session.quit"},
    {Command::ExportPreview, "session.export_preview"},
    {Command::Undo, "session.undo"},
    {Command::Redo, "session.redo"},
    {Command::NextLine, "focus.next_line"},
    {Command::PrevLine, "focus.prev_line"},
    {Command::SelectPrevLine, "list.select_prev"},
    {Command::SelectNextLine, "list.select_next"},
    {Command::ToggleEditMode, "keyframe.toggle_edit_mode"},
    {Command::AddKeyframe, "keyframe.add"},
    {Command::RemoveKeyframe, "keyframe.remove"},
    {Command::AdjustUp, "keyframe.adjust_up"},
    {Command::AdjustDown, "keyframe.adjust_down"},
    {Command::NextKeyframe, "keyframe.next"},
    {Command::PrevKeyframe, "keyframe.prev"},
    {Command::CursorLeft, "text.cursor_left"},
    {Command::CursorRight, "text.cursor_right"},
    {Command::CursorUp, "text.cursor_up"},
    {Command::CursorDown, "text.cursor_down"},
    {Command::MoveLineUp, "text.move_line_up"},
    {Command::MoveLineDown, "text.move_line_down"},
    {Command::Backspace, "text.backspace"},
    {Command::SplitLine, "text.split_line"},
};

static_assert(std::size(COMMAND_IDS) == static_cast<size_t>(Command::Count),
              "every command needs an id");

}   // namespace

const char* command_id(Command command)
{
    for (const auto& entry : COMMAND_IDS)
    {
        if (entry.command == command)
            return entry.id;
    }
    return "";
}

std::optional<Command> command_from_id(std::string_view id)
{
    for (const auto& entry : COMMAND_IDS)
    {
        if (id == entry.id)
            return entry.command;
    }
    return std::nullopt;
}

// ─── Keymap ──────────────────────────────────────────────────────────────────

void Keymap::bind(ViewMode mode, Shortcut shortcut, Command command)
{
    if (!shortcut.valid())
        return;
    table(mode)[shortcut] = command;
}

void Keymap::unbind(ViewMode mode, const Shortcut& shortcut)
{
    table(mode).erase(shortcut);
}

void Keymap::unbind_command(Command command)
{
    for (auto& t : tables_)
        std::erase_if(t, [&](const auto& pair) { return pair.second == command; });
}

std::optional<Command> Keymap::lookup(ViewMode mode, const Shortcut& shortcut) const
{
    const auto& t  = table(mode);
    auto        it = t.find(shortcut);
    if (it == t.end())
        return std::nullopt;
    return it->second;
}

std::vector<Shortcut> Keymap::shortcuts_for(ViewMode mode, Command command) const
{
    std::vector<Shortcut> result;
    for (const auto& [sc, cmd] : table(mode))
    {
        if (cmd == command)
            result.push_back(sc);
    }
    std::sort(result.begin(),
              result.end(),
              [](const Shortcut& a, const Shortcut& b) { return a.to_string() < b.to_string(); });
    return result;
}

std::vector<ViewMode> Keymap::modes_for(Command command) const
{
    std::vector<ViewMode> modes;
    for (ViewMode mode : {ViewMode::List, ViewMode::Focus, ViewMode::TextEdit})
    {
        if (!shortcuts_for(mode, command).empty())
            modes.push_back(mode);
    }
    return modes;
}

std::vector<KeyBinding> Keymap::all_bindings() const
{
    std::vector<KeyBinding> result;
    for (ViewMode mode : {ViewMode::List, ViewMode::Focus, ViewMode::TextEdit})
    {
        for (const auto& [sc, cmd] : table(mode))
            result.push_back({mode, sc, cmd});
    }
    std::sort(result.begin(),
              result.end(),
              [](const KeyBinding& a, const KeyBinding& b)
              {
                  if (a.mode != b.mode)
                      return a.mode < b.mode;
                  if (a.command != b.command)
                      return a.command < b.command;
                  return a.shortcut.to_string() < b.shortcut.to_string();
              });
    return result;
}

void Keymap::register_defaults()
{
    using namespace keys;

    // Shared by the playback views
    for (ViewMode mode : {ViewMode::List, ViewMode::Focus})
    {
        bind(mode, {SPACE, KeyMod::None}, Command::TogglePlay);
        bind(mode, {LEFT, KeyMod::None}, Command::SeekBackward);
        bind(mode, {RIGHT, KeyMod::None}, Command::SeekForward);
        bind(mode, {E, KeyMod::None}, Command::EnterTextEdit);
        bind(mode, {ESCAPE, KeyMod::None}, Command::CycleViewMode);
        bind(mode, {Q, KeyMod::None}, Command::Quit);
        bind(mode, {S, KeyMod::None}, Command::ExportPreview);
    }

    // Undo/redo
    for (ViewMode mode : {ViewMode::List, ViewMode::Focus, ViewMode::TextEdit})
    {
        bind(mode, {Z, KeyMod::Control}, Command::Undo);
        bind(mode, {Z, KeyMod::Control | KeyMod::Shift}, Command::Redo);
    }

    // List
    bind(ViewMode::List, {PAGE_UP, KeyMod::None}, Command::SelectPrevLine);
    bind(ViewMode::List, {PAGE_DOWN, KeyMod::None}, Command::SelectNextLine);

    // Focus: line navigation and keyframe editing
    bind(ViewMode::Focus, {N, KeyMod::None}, Command::NextLine);
    bind(ViewMode::Focus, {P, KeyMod::None}, Command::PrevLine);
    bind(ViewMode::Focus, {T, KeyMod::None}, Command::ToggleEditMode);
    bind(ViewMode::Focus, {F, KeyMod::None}, Command::AddKeyframe);
    bind(ViewMode::Focus, {G, KeyMod::None}, Command::RemoveKeyframe);
    bind(ViewMode::Focus, {DELETE, KeyMod::None}, Command::RemoveKeyframe);
    bind(ViewMode::Focus, {UP, KeyMod::None}, Command::AdjustUp);
    bind(ViewMode::Focus, {DOWN, KeyMod::None}, Command::AdjustDown);
    bind(ViewMode::Focus, {K, KeyMod::None}, Command::NextKeyframe);
    bind(ViewMode::Focus, {J, KeyMod::None}, Command::PrevKeyframe);

    // Text editing
    bind(ViewMode::TextEdit, {LEFT, KeyMod::None}, Command::CursorLeft);
    bind(ViewMode::TextEdit, {RIGHT, KeyMod::None}, Command::CursorRight);
    bind(ViewMode::TextEdit, {UP, KeyMod::None}, Command::CursorUp);
    bind(ViewMode::TextEdit, {DOWN, KeyMod::None}, Command::CursorDown);
    bind(ViewMode::TextEdit, {UP, KeyMod::Alt}, Command::MoveLineUp);
    bind(ViewMode::TextEdit, {DOWN, KeyMod::Alt}, Command::MoveLineDown);
    bind(ViewMode::TextEdit, {BACKSPACE, KeyMod::None}, Command::Backspace);
    bind(ViewMode::TextEdit, {ENTER, KeyMod::None}, Command::SplitLine);
    bind(ViewMode::TextEdit, {ESCAPE, KeyMod::None}, Command::CycleViewMode);
}

size_t Keymap::count() const
{
    size_t n = 0;
    for (const auto& t : tables_)
        n += t.size();
    return n;
}

void Keymap::clear()
{
    for (auto& t : tables_)
        t.clear();
}

}   // namespace kara
