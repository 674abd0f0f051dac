#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <kara/document.hpp>
#include <kara/logger.hpp>
#include <vector>

#include "core/utf8.hpp"

namespace kara
{

namespace
{

constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

std::string_view trim(std::string_view s)
{
    size_t first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split(std::string_view s, std::string_view delim)
{
    std::vector<std::string_view> parts;
    size_t                        pos = 0;
    while (true)
    {
        size_t next = s.find(delim, pos);
        if (next == std::string_view::npos)
        {
            parts.push_back(s.substr(pos));
            break;
        }
        parts.push_back(s.substr(pos, next - pos));
        pos = next + delim.size();
    }
    return parts;
}

std::string format_fixed3(float value)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(value));
    return buf;
}

// Whole-token float parse. Leading or trailing characters make it fail.
bool try_parse_float(std::string_view s, float& out)
{
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
        return false;
    std::string token(s);
    char*       end = nullptr;
    float       val = std::strtof(token.c_str(), &end);
    if (end != token.c_str() + token.size())
        return false;
    out = val;
    return true;
}

float parse_float_or_zero(std::string_view s)
{
    float value = 0.0f;
    if (!try_parse_float(s, value))
        return 0.0f;
    return value;
}

struct Extracted
{
    std::string_view block;
    DecodeError      error = DecodeError::None;
    std::string      message;
};

// Content between the first '[' after `marker` and the first ']' after it.
Extracted extract_block(std::string_view section, std::string_view marker)
{
    Extracted out;

    size_t marker_pos = section.find(marker);
    if (marker_pos == std::string_view::npos)
    {
        out.error   = DecodeError::MissingMarker;
        out.message = "Missing " + std::string(marker);
        return out;
    }

    size_t open = section.find('[', marker_pos + marker.size());
    if (open == std::string_view::npos)
    {
        out.error   = DecodeError::MissingOpenBracket;
        out.message = "Missing [ after " + std::string(marker);
        return out;
    }

    size_t close = section.find(']', open);
    if (close == std::string_view::npos)
    {
        out.error   = DecodeError::MissingCloseBracket;
        out.message = "Missing ] after " + std::string(marker);
        return out;
    }

    out.block = section.substr(open + 1, close - open - 1);
    return out;
}

DecodeResult fail(DecodeError error, std::string message)
{
    KARA_LOG_DEBUG("codec", "decode failed: {}", message);
    DecodeResult result;
    result.error   = error;
    result.message = std::move(message);
    return result;
}

std::string_view strip_parens(std::string_view s)
{
    while (!s.empty() && (s.front() == '(' || s.front() == ')'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == '(' || s.back() == ')'))
        s.remove_suffix(1);
    return s;
}

}   // namespace

const char* decode_error_name(DecodeError error)
{
    switch (error)
    {
        case DecodeError::None:
            return "None";
        case DecodeError::MissingSeparator:
            return "MissingSeparator";
        case DecodeError::MissingMarker:
            return "MissingMarker";
        case DecodeError::MissingOpenBracket:
            return "MissingOpenBracket";
        case DecodeError::MissingCloseBracket:
            return "MissingCloseBracket";
        case DecodeError::LineCountMismatch:
            return "LineCountMismatch";
    }
    return "Unknown";
}

std::string sanitize_text(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size())
    {
        size_t   start = pos;
        char32_t cp    = utf8::decode_next(text, pos);
        if (utf8::is_control(cp) || cp == U'/' || cp == U'[' || cp == U']')
            continue;
        out.append(text.substr(start, pos - start));
    }
    return out;
}

// ─── Encoding ────────────────────────────────────────────────────────────────

std::string encode_document(const AnimationData& data)
{
    std::string text_section;
    std::string timestamps;
    std::string keyframes;

    for (size_t i = 0; i < data.lines.size(); ++i)
    {
        const auto& line = data.lines[i];
        if (i > 0)
        {
            text_section += '\n';
            timestamps += ',';
            keyframes += ',';
        }

        if (line.part)
            text_section += "\n[" + *line.part + "]\n";
        text_section += sanitize_text(line.text);

        timestamps += format_fixed3(line.start) + "/" + format_fixed3(line.end);

        float length = static_cast<float>(line.length());
        keyframes += '(';
        for (size_t k = 0; k < line.keyframes.size(); ++k)
        {
            const auto& kf  = line.keyframes[k];
            float       pct = length > 0.0f ? kf.index / length : 0.0f;
            if (k > 0)
                keyframes += ',';
            keyframes += format_fixed3(kf.time) + "/" + format_fixed3(pct);
        }
        keyframes += ')';
    }

    std::string out;
    out.reserve(text_section.size() + timestamps.size() + keyframes.size() + 32);
    out += text_section;
    out += '\n';
    out += SECTION_SEPARATOR;
    out += '\n';
    out += LINE_TIMESTAMP_MARKER;
    out += '[' + timestamps + "]\n";
    out += SYLLABLE_KEYFRAME_MARKER;
    out += '[' + keyframes + ']';
    return out;
}

// ─── Decoding ────────────────────────────────────────────────────────────────

DecodeResult decode_document(std::string_view document)
{
    auto sections = split(document, SECTION_SEPARATOR);
    if (sections.size() < 2)
        return fail(DecodeError::MissingSeparator, "Missing [//] separator");

    std::string_view text_section = trim(sections[0]);
    std::string_view data_section = trim(sections[1]);

    // Text lines, with sticky part labels
    AnimationData              data;
    std::optional<std::string> current_part;
    for (std::string_view raw : split(text_section, "\n"))
    {
        std::string_view line = trim(raw);
        if (line.empty())
            continue;

        if (line.size() >= 2 && line.front() == '[' && line.back() == ']')
        {
            current_part = std::string(line.substr(1, line.size() - 2));
            continue;
        }

        auto& added = data.add_line(std::string(line), 0.0f, 0.0f);
        added.part  = current_part;
    }

    auto timestamps = extract_block(data_section, LINE_TIMESTAMP_MARKER);
    if (timestamps.error != DecodeError::None)
        return fail(timestamps.error, timestamps.message);

    auto keyframes = extract_block(data_section, SYLLABLE_KEYFRAME_MARKER);
    if (keyframes.error != DecodeError::None)
        return fail(keyframes.error, keyframes.message);

    auto pairs = split(timestamps.block, ",");
    if (pairs.size() != data.lines.size())
    {
        return fail(DecodeError::LineCountMismatch,
                    "Line count mismatch with timestamps: " + std::to_string(data.lines.size())
                        + " lines, " + std::to_string(pairs.size()) + " timestamps");
    }

    for (size_t i = 0; i < pairs.size(); ++i)
    {
        auto fields = split(pairs[i], "/");
        if (fields.size() != 2)
            continue;
        data.lines[i].start = parse_float_or_zero(fields[0]);
        data.lines[i].end   = parse_float_or_zero(fields[1]);
    }

    auto groups = split(keyframes.block, "),(");
    for (size_t i = 0; i < groups.size() && i < data.lines.size(); ++i)
    {
        auto& line   = data.lines[i];
        float length = static_cast<float>(line.length());

        for (std::string_view entry : split(strip_parens(groups[i]), ","))
        {
            size_t slash = entry.find('/');
            if (slash == std::string_view::npos)
                continue;
            float time = parse_float_or_zero(entry.substr(0, slash));
            float pct  = parse_float_or_zero(entry.substr(slash + 1));
            line.keyframes.push_back({time, pct * length});
        }
        line.sort_keyframes();
    }

    KARA_LOG_DEBUG("codec",
                   "decoded {} lines, {} keyframes",
                   data.lines.size(),
                   data.total_keyframe_count());

    DecodeResult result;
    result.data = std::move(data);
    return result;
}

}   // namespace kara
