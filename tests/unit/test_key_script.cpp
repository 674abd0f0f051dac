#include <gtest/gtest.h>

#include "ui/edit_session.hpp"
#include "ui/key_script.hpp"

using namespace kara;

// ─── Parsing ─────────────────────────────────────────────────────────────────

TEST(KeyScript, ParsesAllStepKinds)
{
    KeyScript script = parse_key_script("key Space\ntick 0.5\ntype hi there\nquit\n");
    ASSERT_TRUE(script.error.empty()) << script.error;
    ASSERT_EQ(script.steps.size(), 4u);

    EXPECT_EQ(script.steps[0].kind, ScriptStep::Kind::Key);
    EXPECT_EQ(script.steps[0].event.key, keys::SPACE);
    EXPECT_EQ(script.steps[0].event.action, KeyAction::Press);

    EXPECT_EQ(script.steps[1].kind, ScriptStep::Kind::Tick);
    EXPECT_FLOAT_EQ(script.steps[1].seconds, 0.5f);

    EXPECT_EQ(script.steps[2].kind, ScriptStep::Kind::Text);
    EXPECT_EQ(script.steps[2].text, "hi there");

    EXPECT_EQ(script.steps[3].kind, ScriptStep::Kind::Quit);
}

TEST(KeyScript, SkipsCommentsAndBlankLines)
{
    KeyScript script = parse_key_script("# header\n\n   \nkey Ctrl+Z\r\n  # indented comment\nkey Alt+Up");
    ASSERT_TRUE(script.error.empty()) << script.error;
    ASSERT_EQ(script.steps.size(), 2u);

    EXPECT_EQ(script.steps[0].line, 4u);
    EXPECT_EQ(script.steps[0].event.mods, KeyMod::Control);
    EXPECT_EQ(script.steps[1].line, 6u);
    EXPECT_EQ(script.steps[1].event.key, keys::UP);
}

TEST(KeyScript, TypeKeepsSpaces)
{
    KeyScript script = parse_key_script("type  a \ntype  \r\n");
    ASSERT_TRUE(script.error.empty()) << script.error;
    ASSERT_EQ(script.steps.size(), 2u);
    EXPECT_EQ(script.steps[0].text, " a ");
    EXPECT_EQ(script.steps[1].text, " ");

    EXPECT_FALSE(parse_key_script("type ").error.empty());
}

TEST(KeyScript, ReleaseStep)
{
    KeyScript script = parse_key_script("release Space");
    ASSERT_EQ(script.steps.size(), 1u);
    EXPECT_EQ(script.steps[0].event.action, KeyAction::Release);
}

TEST(KeyScript, EmptySourceHasNoSteps)
{
    KeyScript script = parse_key_script("");
    EXPECT_TRUE(script.error.empty());
    EXPECT_TRUE(script.steps.empty());
}

TEST(KeyScript, ErrorsNameTheLine)
{
    KeyScript bad_key = parse_key_script("key Space\nkey Bogus");
    EXPECT_EQ(bad_key.error, "line 2: unknown key 'Bogus'");
    EXPECT_TRUE(bad_key.steps.empty());

    EXPECT_EQ(parse_key_script("tick 1\n\njump").error, "line 3: unknown command 'jump'");
    EXPECT_EQ(parse_key_script("type").error, "line 1: type needs text");
}

TEST(KeyScript, RejectsBadTicks)
{
    EXPECT_FALSE(parse_key_script("tick -1").error.empty());
    EXPECT_FALSE(parse_key_script("tick abc").error.empty());
    EXPECT_FALSE(parse_key_script("tick").error.empty());
    EXPECT_FALSE(parse_key_script("tick inf").error.empty());
}

// ─── Running ─────────────────────────────────────────────────────────────────

TEST(KeyScript, DrivesSession)
{
    EditSession s;
    KeyScript   script = parse_key_script("key Space\ntick 1.0\nkey Space\ntick 1.0\n");

    EXPECT_EQ(run_key_script(script, s), 4u);
    EXPECT_NEAR(s.current_time(), 1.0f, 1e-5f);
    EXPECT_FALSE(s.is_playing());
}

TEST(KeyScript, StopsAtQuitStep)
{
    EditSession s;
    KeyScript   script = parse_key_script("key Space\ntick 0.5\nquit\ntick 0.5");

    EXPECT_EQ(run_key_script(script, s), 3u);
    EXPECT_NEAR(s.current_time(), 0.5f, 1e-5f);
}

TEST(KeyScript, StopsWhenSessionQuits)
{
    EditSession s;
    KeyScript   script = parse_key_script("key Q\nkey Space");

    EXPECT_EQ(run_key_script(script, s), 1u);
    EXPECT_TRUE(s.quit_requested());
    EXPECT_FALSE(s.is_playing());
}

TEST(KeyScript, TypesIntoTextEdit)
{
    EditSession s;
    KeyScript   script = parse_key_script("key E\nkey Backspace\ntype s!\nkey Escape");

    run_key_script(script, s);
    EXPECT_EQ(s.data().lines[0].text, "City of stars!");
    EXPECT_EQ(s.view_mode(), ViewMode::List);
}

TEST(KeyScript, TypeRightAfterEnterKeepsFirstCharacter)
{
    EditSession s;
    run_key_script(parse_key_script("key E\ntype e!"), s);
    EXPECT_EQ(s.data().lines[0].text, "City of starse!");
}

TEST(KeyScript, TypesSingleSpace)
{
    EditSession s;
    run_key_script(parse_key_script("key E\ntype  "), s);
    EXPECT_EQ(s.data().lines[0].text, "City of stars ");
}

TEST(KeyScript, SplitAndUndo)
{
    EditSession s;
    KeyScript   script = parse_key_script(
        "key E\n"
        "key Left\nkey Left\nkey Left\nkey Left\nkey Left\nkey Left\nkey Left\nkey Left\nkey Left\n"
        "key Enter\n"
        "key Ctrl+Z\n");

    run_key_script(script, s);
    EXPECT_EQ(s.data(), AnimationData::demo());
    EXPECT_TRUE(s.history().can_redo());
}
