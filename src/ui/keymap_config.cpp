#include "keymap_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <kara/logger.hpp>
#include <optional>
#include <ostream>
#include <sstream>
#include <string_view>
#include <system_error>

#include "keymap.hpp"

namespace kara
{

// ─── Override management ─────────────────────────────────────────────────────

void KeymapConfig::set_override(const std::string& command_id, const std::string& shortcut_str)
{
    auto it = std::find_if(overrides_.begin(),
                           overrides_.end(),
                           [&](const BindingOverride& o) { return o.command_id == command_id; });
    if (it == overrides_.end())
        it = overrides_.insert(overrides_.end(), BindingOverride{command_id, {}, false});

    it->shortcut_str = shortcut_str;
    it->removed      = shortcut_str.empty();
}

void KeymapConfig::remove_override(const std::string& command_id)
{
    std::erase_if(overrides_,
                  [&](const BindingOverride& o) { return o.command_id == command_id; });
}

bool KeymapConfig::has_override(const std::string& command_id) const
{
    return std::any_of(overrides_.begin(),
                       overrides_.end(),
                       [&](const BindingOverride& o) { return o.command_id == command_id; });
}

size_t KeymapConfig::apply_overrides(Keymap& keymap) const
{
    Keymap defaults;
    defaults.register_defaults();

    size_t skipped = 0;
    for (const auto& o : overrides_)
    {
        auto command = command_from_id(o.command_id);
        if (!command)
        {
            KARA_LOG_WARN("keymap", "unknown command '{}' in keymap config", o.command_id);
            ++skipped;
            continue;
        }

        if (o.removed || o.shortcut_str.empty())
        {
            keymap.unbind_command(*command);
            continue;
        }

        Shortcut sc = Shortcut::from_string(o.shortcut_str);
        if (!sc.valid())
        {
            KARA_LOG_WARN("keymap",
                          "cannot parse shortcut '{}' for {}",
                          o.shortcut_str,
                          o.command_id);
            ++skipped;
            continue;
        }

        auto modes = keymap.modes_for(*command);
        if (modes.empty())
            modes = defaults.modes_for(*command);

        keymap.unbind_command(*command);
        for (ViewMode mode : modes)
            keymap.bind(mode, sc, *command);

        KARA_LOG_DEBUG("keymap", "{} -> {}", o.command_id, sc.to_string());
    }
    return skipped;
}

// ─── JSON ────────────────────────────────────────────────────────────────────

namespace
{

void write_json_string(std::ostream& os, const std::string& s)
{
    os << '"';
    for (char c : s)
    {
        if (c == '"' || c == '\\')
            os << '\\' << c;
        else if (c == '\n')
            os << "\\n";
        else if (c == '\t')
            os << "\\t";
        else
            os << c;
    }
    os << '"';
}

// Minimal recursive-descent reader for the keymap file. It understands
// objects, arrays, strings, numbers and literals; unknown fields are skipped.
class JsonReader
{
   public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    bool failed() const { return failed_; }
    bool at_end()
    {
        skip_ws();
        return pos_ >= text_.size();
    }

    bool consume(char c)
    {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(char c)
    {
        if (!consume(c))
            fail();
    }

    char peek()
    {
        skip_ws();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    std::string read_string()
    {
        std::string out;
        expect('"');
        while (!failed_)
        {
            if (pos_ >= text_.size())
            {
                fail();
                break;
            }
            char c = text_[pos_++];
            if (c == '"')
                break;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= text_.size())
            {
                fail();
                break;
            }
            char esc = text_[pos_++];
            switch (esc)
            {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'r':
                    out += '\r';
                    break;
                default:
                    out += esc;
                    break;
            }
        }
        return out;
    }

    double read_number()
    {
        skip_ws();
        size_t begin = pos_;
        while (pos_ < text_.size()
               && (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '-'
                   || text_[pos_] == '+' || text_[pos_] == '.' || text_[pos_] == 'e'
                   || text_[pos_] == 'E'))
            ++pos_;
        if (begin == pos_)
        {
            fail();
            return 0.0;
        }
        return std::strtod(std::string(text_.substr(begin, pos_ - begin)).c_str(), nullptr);
    }

    std::optional<bool> read_bool()
    {
        skip_ws();
        if (text_.substr(pos_, 4) == "true")
        {
            pos_ += 4;
            return true;
        }
        if (text_.substr(pos_, 5) == "false")
        {
            pos_ += 5;
            return false;
        }
        return std::nullopt;
    }

    void skip_value()
    {
        char c = peek();
        if (c == '"')
        {
            read_string();
        }
        else if (c == '{' || c == '[')
        {
            char close = c == '{' ? '}' : ']';
            ++pos_;
            if (consume(close))
                return;
            do
            {
                if (close == '}')
                {
                    read_string();
                    expect(':');
                }
                skip_value();
            } while (!failed_ && consume(','));
            expect(close);
        }
        else if (c == 't' || c == 'f')
        {
            if (!read_bool())
                fail();
        }
        else if (text_.substr(pos_, 4) == "null")
        {
            pos_ += 4;
        }
        else
        {
            read_number();
        }
    }

   private:
    void skip_ws()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
            ++pos_;
    }

    void fail() { failed_ = true; }

    std::string_view text_;
    size_t           pos_    = 0;
    bool             failed_ = false;
};

// Calls `field(key)` for every member of the object at the reader's position.
// `field` must consume the value.
template <typename Fn>
void read_object(JsonReader& in, Fn&& field)
{
    in.expect('{');
    if (in.failed() || in.consume('}'))
        return;
    do
    {
        std::string key = in.read_string();
        in.expect(':');
        if (in.failed())
            return;
        field(key);
    } while (!in.failed() && in.consume(','));
    in.expect('}');
}

KeymapConfig::BindingOverride read_binding(JsonReader& in)
{
    KeymapConfig::BindingOverride bo;
    read_object(in,
                [&](const std::string& field)
                {
                    if (field == "command")
                        bo.command_id = in.read_string();
                    else if (field == "shortcut")
                        bo.shortcut_str = in.read_string();
                    else if (auto flag = field == "removed" ? in.read_bool() : std::nullopt)
                        bo.removed = *flag;
                    else
                        in.skip_value();
                });
    return bo;
}

}   // namespace

std::string KeymapConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n  \"version\": " << FORMAT_VERSION << ",\n  \"bindings\": [";
    const char* sep = "\n";
    for (const auto& o : overrides_)
    {
        os << sep << "    {\"command\": ";
        write_json_string(os, o.command_id);
        os << ", \"shortcut\": ";
        write_json_string(os, o.shortcut_str);
        os << ", \"removed\": " << (o.removed ? "true" : "false") << "}";
        sep = ",\n";
    }
    os << (overrides_.empty() ? "]\n}\n" : "\n  ]\n}\n");
    return os.str();
}

bool KeymapConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    JsonReader                   in(json);
    int                          version = FORMAT_VERSION;
    std::vector<BindingOverride> parsed;

    read_object(in,
                [&](const std::string& key)
                {
                    if (key == "version")
                    {
                        version = static_cast<int>(in.read_number());
                    }
                    else if (key == "bindings")
                    {
                        in.expect('[');
                        if (in.failed() || in.consume(']'))
                            return;
                        do
                        {
                            BindingOverride bo = read_binding(in);
                            if (!bo.command_id.empty())
                                parsed.push_back(std::move(bo));
                        } while (!in.failed() && in.consume(','));
                        in.expect(']');
                    }
                    else
                    {
                        in.skip_value();
                    }
                });

    if (in.failed() || !in.at_end())
    {
        KARA_LOG_WARN("keymap", "malformed keymap config");
        return false;
    }
    if (version > FORMAT_VERSION)
    {
        KARA_LOG_WARN("keymap", "keymap config version {} is newer than {}", version,
                      FORMAT_VERSION);
        return false;
    }

    overrides_ = std::move(parsed);
    return true;
}

// ─── Files ───────────────────────────────────────────────────────────────────

bool KeymapConfig::save(const std::string& path) const
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path        target(path);
    if (target.has_parent_path())
        fs::create_directories(target.parent_path(), ec);
    if (ec)
    {
        KARA_LOG_WARN("keymap", "cannot create {}: {}", target.parent_path().string(),
                      ec.message());
        return false;
    }

    std::ofstream out(target);
    out << serialize();
    out.flush();
    if (!out)
    {
        KARA_LOG_WARN("keymap", "failed to write keymap config {}", path);
        return false;
    }
    return true;
}

bool KeymapConfig::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        KARA_LOG_WARN("keymap", "cannot open keymap config {}", path);
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return deserialize(buffer.str());
}

}   // namespace kara
