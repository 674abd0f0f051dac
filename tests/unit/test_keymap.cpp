#include <gtest/gtest.h>

#include "ui/keymap.hpp"

using namespace kara;

// ─── Shortcut ────────────────────────────────────────────────────────────────

TEST(Shortcut, ToString)
{
    EXPECT_EQ((Shortcut{keys::Z, KeyMod::Control | KeyMod::Shift}).to_string(), "Ctrl+Shift+Z");
    EXPECT_EQ((Shortcut{keys::UP, KeyMod::Alt}).to_string(), "Alt+Up");
    EXPECT_EQ((Shortcut{keys::SPACE, KeyMod::None}).to_string(), "Space");
    EXPECT_EQ((Shortcut{keys::PAGE_DOWN, KeyMod::None}).to_string(), "PageDown");
}

TEST(Shortcut, FromStringIsCaseInsensitive)
{
    Shortcut sc = Shortcut::from_string("ctrl+shift+z");
    EXPECT_EQ(sc.key, keys::Z);
    EXPECT_EQ(sc.mods, KeyMod::Control | KeyMod::Shift);

    EXPECT_EQ(Shortcut::from_string("Esc").key, keys::ESCAPE);
    EXPECT_EQ(Shortcut::from_string("Del").key, keys::DELETE);
    EXPECT_EQ(Shortcut::from_string("F5").key, keys::F1 + 4);
    EXPECT_EQ(Shortcut::from_string(" Alt + Down ").mods, KeyMod::Alt);
}

TEST(Shortcut, StringRoundTrip)
{
    for (const char* text : {"Ctrl+Z", "Alt+Up", "Backspace", "Super+Enter", "Ctrl+\\", "F12"})
        EXPECT_EQ(Shortcut::from_string(text).to_string(), text);
}

TEST(Shortcut, InvalidStrings)
{
    EXPECT_FALSE(Shortcut::from_string("").valid());
    EXPECT_FALSE(Shortcut::from_string("Ctrl+").valid());
    EXPECT_FALSE(Shortcut::from_string("Hyper+A").valid());
    EXPECT_FALSE(Shortcut::from_string("NotAKey").valid());
    EXPECT_FALSE(Shortcut::from_string("F13").valid());
}

// ─── Command ids ─────────────────────────────────────────────────────────────

TEST(Keymap, CommandIdsRoundTrip)
{
    for (int i = 0; i < static_cast<int>(Command::Count); ++i)
    {
        auto        command = static_cast<Command>(i);
        std::string id      = command_id(command);
        EXPECT_FALSE(id.empty());
        EXPECT_EQ(command_from_id(id), command) << id;
    }
    EXPECT_FALSE(command_from_id("keyframe.explode").has_value());
}

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST(Keymap, DefaultLayout)
{
    Keymap km;
    km.register_defaults();
    EXPECT_EQ(km.count(), 41u);

    EXPECT_EQ(km.lookup(ViewMode::List, {keys::LEFT, KeyMod::None}), Command::SeekBackward);
    EXPECT_EQ(km.lookup(ViewMode::TextEdit, {keys::LEFT, KeyMod::None}), Command::CursorLeft);
    EXPECT_EQ(km.lookup(ViewMode::Focus, {keys::UP, KeyMod::None}), Command::AdjustUp);
    EXPECT_EQ(km.lookup(ViewMode::TextEdit, {keys::UP, KeyMod::Alt}), Command::MoveLineUp);
    EXPECT_EQ(km.lookup(ViewMode::List, {keys::PAGE_DOWN, KeyMod::None}), Command::SelectNextLine);
    EXPECT_FALSE(km.lookup(ViewMode::TextEdit, {keys::SPACE, KeyMod::None}).has_value());
    EXPECT_FALSE(km.lookup(ViewMode::List, {keys::F, KeyMod::None}).has_value());
}

TEST(Keymap, UndoRedoInEveryMode)
{
    Keymap km;
    km.register_defaults();

    auto modes = km.modes_for(Command::Undo);
    EXPECT_EQ(modes.size(), 3u);
    EXPECT_EQ(km.modes_for(Command::AddKeyframe), std::vector<ViewMode>{ViewMode::Focus});
}

TEST(Keymap, ShortcutsForAreSorted)
{
    Keymap km;
    km.register_defaults();

    auto shortcuts = km.shortcuts_for(ViewMode::Focus, Command::RemoveKeyframe);
    ASSERT_EQ(shortcuts.size(), 2u);
    EXPECT_EQ(shortcuts[0].to_string(), "Delete");
    EXPECT_EQ(shortcuts[1].to_string(), "G");
}

// ─── Binding ─────────────────────────────────────────────────────────────────

TEST(Keymap, BindReplacesExisting)
{
    Keymap km;
    km.bind(ViewMode::Focus, {keys::F, KeyMod::None}, Command::AddKeyframe);
    km.bind(ViewMode::Focus, {keys::F, KeyMod::None}, Command::RemoveKeyframe);

    EXPECT_EQ(km.count(), 1u);
    EXPECT_EQ(km.lookup(ViewMode::Focus, {keys::F, KeyMod::None}), Command::RemoveKeyframe);
}

TEST(Keymap, BindIgnoresInvalidShortcut)
{
    Keymap km;
    km.bind(ViewMode::List, Shortcut{}, Command::Quit);
    EXPECT_EQ(km.count(), 0u);
}

TEST(Keymap, UnbindAndUnbindCommand)
{
    Keymap km;
    km.register_defaults();

    km.unbind(ViewMode::List, {keys::Q, KeyMod::None});
    EXPECT_FALSE(km.lookup(ViewMode::List, {keys::Q, KeyMod::None}).has_value());
    EXPECT_TRUE(km.lookup(ViewMode::Focus, {keys::Q, KeyMod::None}).has_value());

    km.unbind_command(Command::Undo);
    EXPECT_TRUE(km.modes_for(Command::Undo).empty());
    EXPECT_EQ(km.count(), 41u - 1u - 3u);
}

TEST(Keymap, AllBindingsOrderedByMode)
{
    Keymap km;
    km.register_defaults();

    auto all = km.all_bindings();
    ASSERT_EQ(all.size(), km.count());
    for (size_t i = 1; i < all.size(); ++i)
        EXPECT_LE(all[i - 1].mode, all[i].mode);
    EXPECT_EQ(all.front().mode, ViewMode::List);
    EXPECT_EQ(all.back().mode, ViewMode::TextEdit);
}

TEST(Keymap, Clear)
{
    Keymap km;
    km.register_defaults();
    km.clear();
    EXPECT_EQ(km.count(), 0u);
}
