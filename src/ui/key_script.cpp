#include "key_script.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <kara/logger.hpp>

#include "ui/edit_session.hpp"

namespace kara
{

namespace
{

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool try_parse_seconds(std::string_view s, float& out)
{
    if (s.empty())
        return false;
    std::string token(s);
    char*       end = nullptr;
    float       val = std::strtof(token.c_str(), &end);
    if (end != token.c_str() + token.size() || !std::isfinite(val) || val < 0.0f)
        return false;
    out = val;
    return true;
}

}   // namespace

KeyScript parse_key_script(std::string_view source)
{
    KeyScript script;
    size_t    line_no = 0;
    size_t    pos     = 0;

    while (pos <= source.size())
    {
        size_t           eol  = source.find('\n', pos);
        std::string_view raw  = source.substr(pos, eol == std::string_view::npos ? eol : eol - pos);
        pos                   = eol == std::string_view::npos ? source.size() + 1 : eol + 1;
        ++line_no;

        std::string_view line = trim(raw);
        if (line.empty() || line.front() == '#')
            continue;

        size_t           space = line.find_first_of(" \t");
        std::string_view verb  = line.substr(0, space);
        std::string_view arg =
            space == std::string_view::npos ? std::string_view{} : trim(line.substr(space + 1));

        ScriptStep step;
        step.line = line_no;

        auto fail = [&](const std::string& what)
        {
            script.steps.clear();
            script.error = "line " + std::to_string(line_no) + ": " + what;
            return script;
        };

        if (verb == "key" || verb == "release")
        {
            Shortcut sc = Shortcut::from_string(std::string(arg));
            if (!sc.valid())
                return fail("unknown key '" + std::string(arg) + "'");
            step.kind  = ScriptStep::Kind::Key;
            step.event = KeyEvent::press(sc.key, sc.mods);
            if (verb == "release")
                step.event.action = KeyAction::Release;
        }
        else if (verb == "tick")
        {
            if (!try_parse_seconds(arg, step.seconds))
                return fail("bad tick duration '" + std::string(arg) + "'");
            step.kind = ScriptStep::Kind::Tick;
        }
        else if (verb == "type")
        {
            // Everything after the one separator is typed verbatim, spaces included
            std::string_view text = raw.substr(raw.find(verb) + verb.size());
            if (!text.empty() && text.back() == '\r')
                text.remove_suffix(1);
            if (!text.empty())
                text.remove_prefix(1);
            if (text.empty())
                return fail("type needs text");
            step.kind = ScriptStep::Kind::Text;
            step.text = std::string(text);
        }
        else if (verb == "quit")
        {
            step.kind = ScriptStep::Kind::Quit;
        }
        else
        {
            return fail("unknown command '" + std::string(verb) + "'");
        }

        script.steps.push_back(std::move(step));
    }

    return script;
}

size_t run_key_script(const KeyScript& script, EditSession& session)
{
    size_t ran = 0;
    for (const auto& step : script.steps)
    {
        if (session.quit_requested())
            break;
        ++ran;

        switch (step.kind)
        {
            case ScriptStep::Kind::Key:
                if (!session.handle_key(step.event))
                    KARA_LOG_TRACE("script", "line {}: key not handled", step.line);
                break;
            case ScriptStep::Kind::Tick:
                session.update(step.seconds);
                break;
            case ScriptStep::Kind::Text:
                session.insert_text(step.text);
                break;
            case ScriptStep::Kind::Quit:
                return ran;
        }
    }
    return ran;
}

}   // namespace kara
