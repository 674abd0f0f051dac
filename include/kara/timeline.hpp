#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kara
{

// A point on a line's highlight curve. `time` is relative to the line's
// start; `index` is a fractional code-point position in the line's text.
struct Keyframe
{
    float time  = 0.0f;
    float index = 0.0f;

    bool operator==(const Keyframe&) const = default;
};

// One lyric line with absolute timing and its keyframes (always sorted by
// time). The last keyframe is the boundary keyframe, coupled to `end`.
struct LyricLine
{
    std::string                text;
    std::optional<std::string> part;
    float                      start = 0.0f;
    float                      end   = 0.0f;
    std::vector<Keyframe>      keyframes;

    LyricLine() = default;
    LyricLine(std::string text, float start, float end);

    bool operator==(const LyricLine&) const = default;

    // Text length in code points.
    size_t length() const;

    float relative_time(float absolute_time) const { return absolute_time - start; }
    float duration() const { return end - start; }

    // Highlight position at `rel_time`. Interpolates linearly inside the first
    // keyframe pair bracketing `rel_time`; any unbracketed time (also before
    // the first keyframe) yields the last keyframe's index. 0 without keyframes.
    float get_current_index(float rel_time) const;

    // Stable sort by time; equal times keep their relative order.
    void sort_keyframes();

    LyricLine& add_keyframe(float time, float index);

    // Keyframe at `pct` of the line's length.
    LyricLine& add_keyframe_pct(float time, float pct);

    // Position of the keyframe nearest to `rel_time`, first one on ties.
    std::optional<size_t> find_closest_keyframe(float rel_time) const;
};

struct AnimationData
{
    std::vector<LyricLine> lines;

    bool operator==(const AnimationData&) const = default;

    LyricLine& add_line(const std::string& text, float start, float end);

    // First line whose [start, end] contains `time`.
    std::optional<size_t> line_at(float time) const;

    size_t total_keyframe_count() const;

    // Built-in two-line sample used as the default session content.
    static AnimationData demo();
};

}   // namespace kara
