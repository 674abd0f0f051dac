#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kara::utf8
{

inline constexpr char32_t REPLACEMENT = 0xFFFD;

// Decode the code point starting at byte `pos` and advance `pos` past it.
// A malformed or truncated sequence consumes a single byte and decodes to
// REPLACEMENT, so every byte string splits into well-defined units.
char32_t decode_next(std::string_view text, size_t& pos);

std::string encode(char32_t cp);

// Number of code points (units as split by decode_next).
size_t length(std::string_view text);

// Byte offset of code point `index`; text.size() when index >= length.
size_t byte_offset(std::string_view text, size_t index);

// Text split into one string per code point, for per-glyph rendering.
std::vector<std::string> split_chars(std::string_view text);

// Split at code point `index` (clamped to the length).
std::pair<std::string, std::string> split_at(std::string_view text, size_t index);

// Insert `cp` before code point `index` (clamped to the length).
void insert(std::string& text, size_t index, char32_t cp);

// Erase code point `index`. Returns false if index is past the end.
bool erase(std::string& text, size_t index);

// Unicode general category Cc: C0 controls, DEL and C1 controls.
bool is_control(char32_t cp);

}   // namespace kara::utf8
