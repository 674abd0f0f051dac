#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "ui/keymap.hpp"

namespace kara
{

class EditSession;

// Line-oriented input script for the headless runner:
//
//   # comment
//   key Space        press a shortcut ("Ctrl+Z", "Alt+Up", "PageDown", ...)
//   release Space    release event (ignored by the session)
//   tick 0.5         advance the clock by 0.5 s
//   type hello       text after the first space, typed verbatim
//   quit             stop
struct ScriptStep
{
    enum class Kind
    {
        Key,
        Tick,
        Text,
        Quit,
    };

    Kind        kind    = Kind::Quit;
    KeyEvent    event;          // Kind::Key
    float       seconds = 0.0f;   // Kind::Tick
    std::string text;           // Kind::Text
    size_t      line    = 0;      // 1-based source line
};

struct KeyScript
{
    std::vector<ScriptStep> steps;
    std::string             error;   // Non-empty on parse failure
};

KeyScript parse_key_script(std::string_view source);

// Feed the steps to `session` until the script ends, a quit step is reached
// or the session requests quit. Returns the number of steps run.
size_t run_key_script(const KeyScript& script, EditSession& session);

}   // namespace kara
