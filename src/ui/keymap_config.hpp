#pragma once

#include <string>
#include <vector>

namespace kara
{

class Keymap;

// User overrides of the default keymap, stored as a small JSON document:
//
//   {"version": 1, "bindings": [{"command": "session.undo",
//                                "shortcut": "Ctrl+U", "removed": false}]}
//
// Overrides are kept apart from the defaults so resetting is trivial.
class KeymapConfig
{
   public:
    KeymapConfig()  = default;
    ~KeymapConfig() = default;

    KeymapConfig(const KeymapConfig&)            = delete;
    KeymapConfig& operator=(const KeymapConfig&) = delete;

    struct BindingOverride
    {
        std::string command_id;     // e.g. "keyframe.add"
        std::string shortcut_str;   // e.g. "Ctrl+F" or "" to unbind
        bool        removed = false;
    };

    static constexpr int FORMAT_VERSION = 1;

    // Rebind a command. An empty shortcut_str unbinds it.
    void set_override(const std::string& command_id, const std::string& shortcut_str);

    void remove_override(const std::string& command_id);
    bool has_override(const std::string& command_id) const;

    const std::vector<BindingOverride>& overrides() const { return overrides_; }
    size_t                              override_count() const { return overrides_.size(); }

    void reset_all() { overrides_.clear(); }

    // Layer the overrides on top of `keymap` (normally after
    // register_defaults()). A rebound command keeps the modes it was bound
    // in. Returns the number of overrides skipped because the command id or
    // the shortcut could not be resolved.
    size_t apply_overrides(Keymap& keymap) const;

    std::string serialize() const;

    // Returns false for empty input or a newer format version.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

   private:
    std::vector<BindingOverride> overrides_;
};

}   // namespace kara
