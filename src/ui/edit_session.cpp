#include "edit_session.hpp"

#include <algorithm>
#include <cctype>
#include <kara/logger.hpp>
#include <utility>

#include "core/utf8.hpp"

namespace kara
{

EditSession::EditSession(AnimationData data, SessionConfig config)
    : data_(std::move(data)), config_(config), history_(config.history_limit)
{
    keymap_.register_defaults();
}

std::optional<size_t> EditSession::editor_line_index() const
{
    if (valid_line(focus_line_))
        return focus_line_;
    return playing_line_index();
}

void EditSession::set_current_time(float time)
{
    current_time_ = std::max(time, 0.0f);
}

// ─── Tick ────────────────────────────────────────────────────────────────────

void EditSession::update(float dt)
{
    consumed_key_.reset();

    if (is_playing_)
    {
        current_time_ += dt;

        if (view_mode_ == ViewMode::Focus)
        {
            if (valid_line(focus_line_))
            {
                const auto& line = data_.lines[*focus_line_];
                if (current_time_ > line.end)
                    current_time_ = line.start;
                else if (current_time_ < line.start)
                    current_time_ = line.start;
            }
            else
            {
                focus_line_ = playing_line_index();
            }
        }
        else if (view_mode_ == ViewMode::List)
        {
            // Playback flows across lines in the overview
            focus_line_.reset();
        }
    }

    if (!manual_scroll_)
    {
        if (auto idx = playing_line_index())
        {
            scroll_offset_ = *idx;
            if (view_mode_ == ViewMode::Focus && !focus_line_)
                focus_line_ = idx;
        }
        else
        {
            auto it = std::find_if(data_.lines.begin(),
                                   data_.lines.end(),
                                   [&](const LyricLine& l) { return current_time_ >= l.start; });
            scroll_offset_ =
                it == data_.lines.end() ? 0 : static_cast<size_t>(it - data_.lines.begin());
        }
    }
}

// ─── Dispatch ────────────────────────────────────────────────────────────────

bool EditSession::handle_key(const KeyEvent& event)
{
    std::optional<int> consumed = std::exchange(consumed_key_, std::nullopt);
    if (event.action == KeyAction::Release)
        return false;

    if (event.is_text())
    {
        if (consumed && event.codepoint < 0x80
            && std::toupper(static_cast<int>(event.codepoint)) == *consumed)
            return false;
        if (view_mode_ != ViewMode::TextEdit)
            return false;
        if (has_mod(event.mods, KeyMod::Control) || has_mod(event.mods, KeyMod::Super))
            return false;
        return insert_char(event.codepoint);
    }

    Shortcut sc{event.key, static_cast<KeyMod>(static_cast<uint8_t>(event.mods) & 0x0F)};
    auto     command = keymap_.lookup(view_mode_, sc);
    if (!command || !execute(*command))
        return false;

    if (event.key >= keys::SPACE && event.key <= keys::GRAVE_ACCENT)
        consumed_key_ = event.key;
    return true;
}

bool EditSession::execute(Command command)
{
    const bool list      = view_mode_ == ViewMode::List;
    const bool focus     = view_mode_ == ViewMode::Focus;
    const bool text_edit = view_mode_ == ViewMode::TextEdit;

    switch (command)
    {
        // Any mode
        case Command::CycleViewMode:
            cycle_view_mode();
            return true;
        case Command::Undo:
            undo();
            return true;
        case Command::Redo:
            redo();
            return true;

        // Playback views
        case Command::TogglePlay:
            if (text_edit)
                return false;
            toggle_play();
            return true;
        case Command::SeekBackward:
        case Command::SeekForward:
            if (text_edit)
                return false;
            seek(command == Command::SeekForward ? 1 : -1);
            return true;
        case Command::EnterTextEdit:
            if (text_edit)
                return false;
            enter_text_edit();
            return true;
        case Command::Quit:
            if (text_edit)
                return false;
            KARA_LOG_INFO("session", "quit requested");
            quit_requested_ = true;
            return true;
        case Command::ExportPreview:
            if (text_edit)
                return false;
            export_preview();
            return true;

        // List
        case Command::SelectPrevLine:
        case Command::SelectNextLine:
            if (!list)
                return false;
            select_list_line(command == Command::SelectNextLine ? 1 : -1);
            return true;

        // Focus
        case Command::NextLine:
        case Command::PrevLine:
            if (!focus)
                return false;
            step_focus_line(command == Command::NextLine ? 1 : -1);
            return true;
        case Command::ToggleEditMode:
            if (!focus)
                return false;
            toggle_edit_mode();
            return true;
        case Command::AddKeyframe:
            if (!focus)
                return false;
            add_keyframe();
            return true;
        case Command::RemoveKeyframe:
            if (!focus)
                return false;
            remove_keyframe();
            return true;
        case Command::AdjustUp:
        case Command::AdjustDown:
            if (!focus)
                return false;
            adjust_keyframe(command == Command::AdjustUp ? 1 : -1);
            return true;
        case Command::NextKeyframe:
        case Command::PrevKeyframe:
            if (!focus)
                return false;
            jump_keyframe(command == Command::NextKeyframe ? 1 : -1);
            return true;

        // TextEdit
        case Command::CursorLeft:
        case Command::CursorRight:
            if (!text_edit)
                return false;
            move_cursor(command == Command::CursorRight ? 1 : -1);
            return true;
        case Command::CursorUp:
        case Command::CursorDown:
            if (!text_edit)
                return false;
            move_text_focus(command == Command::CursorDown ? 1 : -1);
            return true;
        case Command::MoveLineUp:
        case Command::MoveLineDown:
            if (!text_edit)
                return false;
            move_line(command == Command::MoveLineDown ? 1 : -1);
            return true;
        case Command::Backspace:
            if (!text_edit)
                return false;
            backspace();
            return true;
        case Command::SplitLine:
            if (!text_edit)
                return false;
            split_line();
            return true;

        case Command::Count:
            break;
    }
    return false;
}

// ─── Playback and navigation ─────────────────────────────────────────────────

void EditSession::toggle_play()
{
    is_playing_ = !is_playing_;
    KARA_LOG_DEBUG("session", "{} at {}", is_playing_ ? "play" : "pause", current_time_);
}

void EditSession::seek(int direction)
{
    active_kf_.reset();
    current_time_ = std::max(current_time_ + config_.seek_step * static_cast<float>(direction), 0.0f);
    if (view_mode_ == ViewMode::Focus)
        focus_line_ = playing_line_index();
}

void EditSession::enter_text_edit()
{
    if (!focus_line_)
        focus_line_ = scroll_offset_;
    if (!valid_line(focus_line_))
    {
        focus_line_.reset();
        return;
    }

    view_mode_  = ViewMode::TextEdit;
    cursor_col_ = data_.lines[*focus_line_].length();
    KARA_LOG_DEBUG("session", "text edit on line {}", *focus_line_);
}

void EditSession::cycle_view_mode()
{
    switch (view_mode_)
    {
        case ViewMode::Focus:
            focus_line_.reset();
            view_mode_ = ViewMode::List;
            break;
        case ViewMode::List:
            manual_scroll_ = false;
            focus_line_    = playing_line_index();
            active_kf_.reset();
            view_mode_ = ViewMode::Focus;
            break;
        case ViewMode::TextEdit:
            focus_line_.reset();
            view_mode_ = ViewMode::List;
            break;
    }
    KARA_LOG_DEBUG("session", "view mode {}", view_mode_name(view_mode_));
}

void EditSession::step_focus_line(int direction)
{
    if (!valid_line(focus_line_))
        return;

    size_t curr = *focus_line_;
    if (direction > 0 && curr + 1 < data_.lines.size())
        focus_line_ = curr + 1;
    else if (direction < 0 && curr > 0)
        focus_line_ = curr - 1;
    else
        return;

    current_time_ = data_.lines[*focus_line_].start;
}

void EditSession::select_list_line(int direction)
{
    manual_scroll_ = true;
    if (data_.lines.empty())
        return;

    long last     = static_cast<long>(data_.lines.size()) - 1;
    long selected = std::clamp(static_cast<long>(scroll_offset_) + direction, 0L, last);
    scroll_offset_ = static_cast<size_t>(selected);

    current_time_ = data_.lines[scroll_offset_].start;
    focus_line_.reset();
    active_kf_.reset();
}

// ─── Keyframe editing ────────────────────────────────────────────────────────

void EditSession::toggle_edit_mode()
{
    edit_mode_ = edit_mode_ == EditMode::Time ? EditMode::Progress : EditMode::Time;
    KARA_LOG_DEBUG("session", "edit mode {}", edit_mode_name(edit_mode_));
}

void EditSession::add_keyframe()
{
    auto idx = editor_line_index();
    if (!idx)
        return;

    const auto& line     = data_.lines[*idx];
    float       rel_time = std::max(line.relative_time(current_time_), 0.0f);
    float       index    = line.get_current_index(rel_time);

    snapshot("Add keyframe");
    data_.lines[*idx].add_keyframe(rel_time, index);
    KARA_LOG_DEBUG("session", "keyframe {}/{} on line {}", rel_time, index, *idx);
}

void EditSession::remove_keyframe()
{
    auto idx = editor_line_index();
    if (!idx)
        return;

    auto& line = data_.lines[*idx];
    if (line.keyframes.size() <= 1)
        return;

    auto closest = line.find_closest_keyframe(line.relative_time(current_time_));
    if (!closest)
        return;

    snapshot("Remove keyframe");
    line.keyframes.erase(line.keyframes.begin() + static_cast<std::ptrdiff_t>(*closest));

    if (active_kf_)
    {
        if (*active_kf_ == *closest)
            active_kf_.reset();
        else if (*active_kf_ > *closest)
            --*active_kf_;
    }
}

void EditSession::adjust_keyframe(int direction)
{
    auto idx = editor_line_index();
    if (!idx || !active_kf_)
        return;

    auto&  line = data_.lines[*idx];
    size_t ki   = *active_kf_;
    if (ki >= line.keyframes.size())
    {
        active_kf_.reset();
        return;
    }

    float sign = static_cast<float>(direction);
    auto& kf   = line.keyframes[ki];

    if (edit_mode_ == EditMode::Progress)
    {
        float length = static_cast<float>(line.length());
        kf.index     = std::clamp(kf.index + config_.progress_step * sign, 0.0f, length);
        return;
    }

    kf.time = std::max(kf.time + config_.time_step * sign, 0.0f);

    if (ki == line.keyframes.size() - 1)
    {
        line.end = std::max(line.start + kf.time, line.start + config_.min_line_duration);
        kf.time  = line.end - line.start;
    }

    // Keep the order by time and follow the moved keyframe
    while (ki + 1 < line.keyframes.size() && line.keyframes[ki].time > line.keyframes[ki + 1].time)
    {
        std::swap(line.keyframes[ki], line.keyframes[ki + 1]);
        ++ki;
    }
    while (ki > 0 && line.keyframes[ki].time < line.keyframes[ki - 1].time)
    {
        std::swap(line.keyframes[ki], line.keyframes[ki - 1]);
        --ki;
    }
    active_kf_ = ki;
}

void EditSession::jump_keyframe(int direction)
{
    auto idx = editor_line_index();
    if (!idx)
        return;

    const auto& line     = data_.lines[*idx];
    float       rel_time = line.relative_time(current_time_);
    is_playing_          = false;

    if (direction > 0)
    {
        for (size_t i = 0; i < line.keyframes.size(); ++i)
        {
            if (line.keyframes[i].time > rel_time + config_.jump_epsilon)
            {
                active_kf_    = i;
                current_time_ = line.start + line.keyframes[i].time;
                return;
            }
        }
        if (*idx + 1 < data_.lines.size())
        {
            const auto& next = data_.lines[*idx + 1];
            focus_line_      = *idx + 1;
            current_time_    = next.start;
            active_kf_       = next.keyframes.empty() ? std::nullopt : std::optional<size_t>(0);
        }
        return;
    }

    for (size_t i = line.keyframes.size(); i-- > 0;)
    {
        if (line.keyframes[i].time < rel_time - config_.jump_epsilon)
        {
            active_kf_    = i;
            current_time_ = line.start + line.keyframes[i].time;
            return;
        }
    }
    if (*idx > 0)
    {
        const auto& prev = data_.lines[*idx - 1];
        focus_line_      = *idx - 1;
        current_time_    = prev.start;
        active_kf_       = prev.keyframes.empty()
                               ? std::nullopt
                               : std::optional<size_t>(prev.keyframes.size() - 1);
    }
}

// ─── Text editing ────────────────────────────────────────────────────────────

void EditSession::move_cursor(int direction)
{
    if (!valid_line(focus_line_))
        return;

    size_t length = data_.lines[*focus_line_].length();
    if (direction < 0 && cursor_col_ > 0)
        --cursor_col_;
    else if (direction > 0 && cursor_col_ < length)
        ++cursor_col_;
}

void EditSession::move_text_focus(int direction)
{
    if (!valid_line(focus_line_))
        return;

    size_t idx = *focus_line_;
    if (direction < 0 && idx > 0)
        focus_line_ = idx - 1;
    else if (direction > 0 && idx + 1 < data_.lines.size())
        focus_line_ = idx + 1;
    else
        return;

    cursor_col_ = std::min(cursor_col_, data_.lines[*focus_line_].length());
}

void EditSession::move_line(int direction)
{
    if (!valid_line(focus_line_))
        return;

    size_t idx = *focus_line_;
    size_t target;
    if (direction < 0 && idx > 0)
        target = idx - 1;
    else if (direction > 0 && idx + 1 < data_.lines.size())
        target = idx + 1;
    else
        return;

    snapshot("Move line");
    std::swap(data_.lines[idx], data_.lines[target]);
    focus_line_ = target;
}

bool EditSession::insert_char(char32_t cp)
{
    if (!valid_line(focus_line_) || utf8::is_control(cp))
        return false;

    auto& line  = data_.lines[*focus_line_];
    cursor_col_ = std::min(cursor_col_, line.length());
    utf8::insert(line.text, cursor_col_, cp);
    ++cursor_col_;
    return true;
}

size_t EditSession::insert_text(std::string_view utf8_text)
{
    consumed_key_.reset();
    if (view_mode_ != ViewMode::TextEdit)
        return 0;

    size_t inserted = 0;
    size_t pos      = 0;
    while (pos < utf8_text.size())
    {
        if (insert_char(utf8::decode_next(utf8_text, pos)))
            ++inserted;
    }
    return inserted;
}

void EditSession::backspace()
{
    if (!valid_line(focus_line_))
        return;

    size_t idx  = *focus_line_;
    auto&  line = data_.lines[idx];
    cursor_col_ = std::min(cursor_col_, line.length());

    if (cursor_col_ > 0)
    {
        if (utf8::erase(line.text, cursor_col_ - 1))
            --cursor_col_;
        return;
    }

    if (idx == 0)
        return;

    // Merge into the previous line
    snapshot("Merge lines");
    std::string tail = std::move(data_.lines[idx].text);
    data_.lines.erase(data_.lines.begin() + static_cast<std::ptrdiff_t>(idx));

    auto&  prev     = data_.lines[idx - 1];
    size_t prev_len = prev.length();
    prev.text += tail;
    focus_line_ = idx - 1;
    cursor_col_ = prev_len;
}

void EditSession::split_line()
{
    if (!valid_line(focus_line_))
        return;

    size_t idx = *focus_line_;
    snapshot("Split line");

    auto& line         = data_.lines[idx];
    auto [left, right] = utf8::split_at(line.text, cursor_col_);
    line.text          = std::move(left);

    LyricLine next(std::move(right), line.end, line.end + config_.split_line_duration);
    data_.lines.insert(data_.lines.begin() + static_cast<std::ptrdiff_t>(idx) + 1,
                       std::move(next));

    focus_line_ = idx + 1;
    cursor_col_ = 0;
}

// ─── History ─────────────────────────────────────────────────────────────────

void EditSession::snapshot(std::string description)
{
    KARA_LOG_TRACE("session", "snapshot: {}", description);
    history_.push(std::move(description), data_);
}

bool EditSession::undo()
{
    std::string description = history_.undo_description();
    if (!history_.undo(data_))
        return false;
    clamp_selection();
    KARA_LOG_DEBUG("session", "undo: {}", description);
    return true;
}

bool EditSession::redo()
{
    std::string description = history_.redo_description();
    if (!history_.redo(data_))
        return false;
    clamp_selection();
    KARA_LOG_DEBUG("session", "redo: {}", description);
    return true;
}

void EditSession::clamp_selection()
{
    const size_t count = data_.lines.size();

    if (focus_line_ && *focus_line_ >= count)
    {
        if (count == 0)
            focus_line_.reset();
        else
            focus_line_ = count - 1;
    }

    if (view_mode_ == ViewMode::TextEdit && !focus_line_)
        view_mode_ = ViewMode::List;

    cursor_col_ = valid_line(focus_line_)
                      ? std::min(cursor_col_, data_.lines[*focus_line_].length())
                      : 0;

    auto line = editor_line_index();
    if (active_kf_ && (!line || *active_kf_ >= data_.lines[*line].keyframes.size()))
        active_kf_.reset();

    if (scroll_offset_ >= count)
        scroll_offset_ = count == 0 ? 0 : count - 1;
}

// ─── Documents ───────────────────────────────────────────────────────────────

DecodeError EditSession::load_document(std::string_view document)
{
    DecodeResult result = decode_document(document);
    if (!result.ok())
    {
        KARA_LOG_WARN("session", "document rejected: {}", result.message);
        return result.error;
    }

    snapshot("Load document");
    data_ = std::move(result.data);

    view_mode_     = ViewMode::List;
    current_time_  = 0.0f;
    is_playing_    = false;
    scroll_offset_ = 0;
    manual_scroll_ = false;
    focus_line_.reset();
    active_kf_.reset();
    cursor_col_ = 0;

    KARA_LOG_INFO("session", "loaded document with {} lines", data_.lines.size());
    return DecodeError::None;
}

void EditSession::export_preview() const
{
    std::string document = export_document();
    KARA_LOG_DEBUG("session",
                   "export preview: {} bytes, {} lines, {} keyframes",
                   document.size(),
                   data_.lines.size(),
                   data_.total_keyframe_count());
}

}   // namespace kara
