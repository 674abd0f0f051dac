#pragma once

#include <cstddef>
#include <kara/document.hpp>
#include <kara/timeline.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "ui/keymap.hpp"
#include "ui/snapshot_history.hpp"
#include "ui/view_mode.hpp"

namespace kara
{

// Tuning constants of the editing commands.
struct SessionConfig
{
    float  seek_step           = 0.5f;    // seconds per seek
    float  progress_step       = 0.5f;    // characters per Progress nudge
    float  time_step           = 0.05f;   // seconds per Time nudge
    float  min_line_duration   = 0.01f;   // boundary keyframe floor
    float  jump_epsilon        = 0.01f;   // keyframe jump dead zone
    float  split_line_duration = 2.0f;    // placeholder length of a split-off line
    size_t history_limit       = SnapshotHistory::DEFAULT_CAPACITY;
};

// One editing session over an AnimationData it exclusively owns.
//
// The host loop calls update() once per frame with the elapsed wall-clock
// time and feeds input through handle_key(). Everything the renderer needs
// is exposed through const accessors.
class EditSession
{
   public:
    explicit EditSession(AnimationData data = AnimationData::demo(), SessionConfig config = {});

    EditSession(const EditSession&)            = delete;
    EditSession& operator=(const EditSession&) = delete;

    // ─── Input ──────────────────────────────────────────────────────────────

    // Advance the playhead by `dt` seconds (if playing) and resolve the
    // derived scroll and focus state.
    void update(float dt);

    // Dispatch a key or text event through the keymap for the current mode.
    // Release events are ignored. A text event that only repeats the
    // character of a key press which just ran a command is dropped.
    // Returns true if a command ran.
    bool handle_key(const KeyEvent& event);

    // Run a command directly. Returns false if the command does not apply to
    // the current view mode. Commands whose prerequisites are missing (no
    // focus line, no selected keyframe) are accepted and do nothing.
    bool execute(Command command);

    // Insert text at the cursor, one code point at a time (TextEdit only).
    // Control characters are dropped. Returns the number inserted.
    size_t insert_text(std::string_view utf8_text);

    // Restore the state before the last structural edit.
    bool undo();
    bool redo();

    // Replace the model with a decoded document. On failure the session is
    // untouched and the error is returned.
    DecodeError load_document(std::string_view document);

    std::string export_document() const { return encode_document(data_); }

    // Place the playhead directly (scrubbing). Negative times clamp to 0.
    void set_current_time(float time);

    // ─── State ──────────────────────────────────────────────────────────────

    const AnimationData& data() const { return data_; }
    float                current_time() const { return current_time_; }
    bool                 is_playing() const { return is_playing_; }
    ViewMode             view_mode() const { return view_mode_; }
    EditMode             edit_mode() const { return edit_mode_; }
    size_t               scroll_offset() const { return scroll_offset_; }
    bool                 manual_scroll() const { return manual_scroll_; }
    std::optional<size_t> focus_line_index() const { return focus_line_; }
    std::optional<size_t> active_keyframe_index() const { return active_kf_; }
    size_t               cursor_col() const { return cursor_col_; }
    bool                 quit_requested() const { return quit_requested_; }

    // Line whose [start, end] contains the playhead.
    std::optional<size_t> playing_line_index() const { return data_.line_at(current_time_); }

    // Line that keyframe commands act on: the focus line, else the playing one.
    std::optional<size_t> editor_line_index() const;

    const SessionConfig&   config() const { return config_; }
    const SnapshotHistory& history() const { return history_; }
    Keymap&                keymap() { return keymap_; }
    const Keymap&          keymap() const { return keymap_; }

   private:
    // Playback and navigation
    void toggle_play();
    void seek(int direction);
    void enter_text_edit();
    void cycle_view_mode();
    void step_focus_line(int direction);
    void select_list_line(int direction);

    // Keyframe editing (Focus)
    void toggle_edit_mode();
    void add_keyframe();
    void remove_keyframe();
    void adjust_keyframe(int direction);
    void jump_keyframe(int direction);

    // Text editing (TextEdit)
    void move_cursor(int direction);
    void move_text_focus(int direction);
    void move_line(int direction);
    bool insert_char(char32_t cp);
    void backspace();
    void split_line();

    void export_preview() const;
    void snapshot(std::string description);
    void clamp_selection();

    bool valid_line(std::optional<size_t> index) const
    {
        return index && *index < data_.lines.size();
    }

    AnimationData   data_;
    SessionConfig   config_;
    SnapshotHistory history_;
    Keymap          keymap_;

    float    current_time_   = 0.0f;
    bool     is_playing_     = false;
    ViewMode view_mode_      = ViewMode::List;
    EditMode edit_mode_      = EditMode::Time;
    size_t   scroll_offset_  = 0;
    bool     manual_scroll_  = false;
    bool     quit_requested_ = false;

    std::optional<size_t> focus_line_;
    std::optional<size_t> active_kf_;
    size_t                cursor_col_ = 0;

    // Printable key whose press just ran a command. The window system
    // follows such a press with a character event that must not be typed.
    std::optional<int> consumed_key_;
};

}   // namespace kara
