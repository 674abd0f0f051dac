#include <algorithm>
#include <cmath>
#include <kara/timeline.hpp>

#include "utf8.hpp"

namespace kara
{

// ─── LyricLine ───────────────────────────────────────────────────────────────

LyricLine::LyricLine(std::string text, float start, float end)
    : text(std::move(text)), start(start), end(end)
{
}

size_t LyricLine::length() const
{
    return utf8::length(text);
}

float LyricLine::get_current_index(float rel_time) const
{
    if (keyframes.empty())
        return 0.0f;

    for (size_t i = 0; i + 1 < keyframes.size(); ++i)
    {
        const auto& k1 = keyframes[i];
        const auto& k2 = keyframes[i + 1];
        if (rel_time >= k1.time && rel_time <= k2.time)
        {
            float span = k2.time - k1.time;
            if (span <= 0.0f)
                return k1.index;
            float t = (rel_time - k1.time) / span;
            return k1.index + (k2.index - k1.index) * t;
        }
    }
    return keyframes.back().index;
}

void LyricLine::sort_keyframes()
{
    std::stable_sort(keyframes.begin(),
                     keyframes.end(),
                     [](const Keyframe& a, const Keyframe& b) { return a.time < b.time; });
}

LyricLine& LyricLine::add_keyframe(float time, float index)
{
    keyframes.push_back({time, index});
    sort_keyframes();
    return *this;
}

LyricLine& LyricLine::add_keyframe_pct(float time, float pct)
{
    return add_keyframe(time, static_cast<float>(length()) * pct);
}

std::optional<size_t> LyricLine::find_closest_keyframe(float rel_time) const
{
    std::optional<size_t> best;
    float                 best_dist = 0.0f;
    for (size_t i = 0; i < keyframes.size(); ++i)
    {
        float dist = std::abs(keyframes[i].time - rel_time);
        if (!best || dist < best_dist)
        {
            best      = i;
            best_dist = dist;
        }
    }
    return best;
}

// ─── AnimationData ───────────────────────────────────────────────────────────

LyricLine& AnimationData::add_line(const std::string& text, float start, float end)
{
    lines.emplace_back(text, start, end);
    return lines.back();
}

std::optional<size_t> AnimationData::line_at(float time) const
{
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (time >= lines[i].start && time <= lines[i].end)
            return i;
    }
    return std::nullopt;
}

size_t AnimationData::total_keyframe_count() const
{
    size_t count = 0;
    for (const auto& line : lines)
        count += line.keyframes.size();
    return count;
}

AnimationData AnimationData::demo()
{
    AnimationData data;

    data.add_line("City of stars", 0.0f, 3.42f)
        .add_keyframe_pct(0.0f, 0.0f)
        .add_keyframe_pct(1.2f, 0.7f)
        .add_keyframe_pct(3.42f, 1.0f);

    const float second_start = 3.42f + 0.5f;
    data.add_line("You never shined so brightly", second_start, second_start + 7.112f)
        .add_keyframe_pct(0.0f, 0.0f)
        .add_keyframe_pct(0.4f, 0.2f)
        .add_keyframe_pct(5.4f, 0.9f)
        .add_keyframe_pct(7.0f, 1.0f);

    return data;
}

}   // namespace kara
