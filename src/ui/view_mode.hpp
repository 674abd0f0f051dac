#pragma once

#include <cstdint>

namespace kara
{

enum class ViewMode : uint8_t
{
    List,       // Overview, follows the playhead
    Focus,      // One line, looping playback, keyframe editing
    TextEdit,   // Character editing of one line
};

// What keyframe adjustment changes while in Focus.
enum class EditMode : uint8_t
{
    Time,
    Progress,
};

inline constexpr int VIEW_MODE_COUNT = 3;

inline const char* view_mode_name(ViewMode mode)
{
    switch (mode)
    {
        case ViewMode::List:
            return "List";
        case ViewMode::Focus:
            return "Focus";
        case ViewMode::TextEdit:
            return "TextEdit";
    }
    return "Unknown";
}

inline const char* edit_mode_name(EditMode mode)
{
    return mode == EditMode::Time ? "Time" : "Progress";
}

}   // namespace kara
