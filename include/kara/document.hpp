#pragma once

#include <kara/timeline.hpp>
#include <string>
#include <string_view>

namespace kara
{

// Literal tokens of the exported document.
inline constexpr std::string_view SECTION_SEPARATOR = "[//]";
inline constexpr std::string_view LINE_TIMESTAMP_MARKER = "[lbl]";
inline constexpr std::string_view SYLLABLE_KEYFRAME_MARKER = "[lsk]";

enum class DecodeError
{
    None,
    MissingSeparator,
    MissingMarker,
    MissingOpenBracket,
    MissingCloseBracket,
    LineCountMismatch,
};

const char* decode_error_name(DecodeError error);

// Result of decode_document(). On failure `data` is empty and `message`
// names the missing token; there is no partial model.
struct DecodeResult
{
    AnimationData data;
    DecodeError   error = DecodeError::None;
    std::string   message;   // Non-empty on failure

    bool ok() const { return error == DecodeError::None; }
};

// Serialize the whole model:
//
//   <text lines>
//   [//]
//   [lbl][start/end,...]
//   [lsk][(time/pct,...),...]
//
// A line with a part label is preceded by a blank line and "[label]".
// Numbers carry three fractional digits; pct is index / length.
std::string encode_document(const AnimationData& data);

// Parse a document produced by encode_document (or written by hand).
// Structural problems reject the whole document; individual numbers that
// fail to parse read as 0.
DecodeResult decode_document(std::string_view document);

// Line text with control characters and '/', '[', ']' removed.
std::string sanitize_text(std::string_view text);

}   // namespace kara
