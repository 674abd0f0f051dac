#include "utf8.hpp"

#include <cstdint>

namespace kara::utf8
{

char32_t decode_next(std::string_view text, size_t& pos)
{
    if (pos >= text.size())
        return REPLACEMENT;

    auto   lead = static_cast<uint8_t>(text[pos]);
    size_t need = 0;
    char32_t cp = 0;

    if (lead < 0x80)
    {
        ++pos;
        return lead;
    }
    if ((lead & 0xE0) == 0xC0)
    {
        need = 1;
        cp   = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        need = 2;
        cp   = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        need = 3;
        cp   = lead & 0x07;
    }
    else
    {
        ++pos;
        return REPLACEMENT;
    }

    if (pos + need >= text.size())
    {
        ++pos;
        return REPLACEMENT;
    }

    for (size_t i = 1; i <= need; ++i)
    {
        auto b = static_cast<uint8_t>(text[pos + i]);
        if ((b & 0xC0) != 0x80)
        {
            ++pos;
            return REPLACEMENT;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    // Reject overlong encodings and surrogates.
    static constexpr char32_t MIN_FOR_LENGTH[] = {0, 0x80, 0x800, 0x10000};
    if (cp < MIN_FOR_LENGTH[need] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
        ++pos;
        return REPLACEMENT;
    }

    pos += need + 1;
    return cp;
}

std::string encode(char32_t cp)
{
    std::string s;
    if (cp <= 0x7F)
    {
        s.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FF)
    {
        s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
        s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0x10FFFF)
    {
        s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        return encode(REPLACEMENT);
    }
    return s;
}

size_t length(std::string_view text)
{
    size_t count = 0;
    size_t pos   = 0;
    while (pos < text.size())
    {
        decode_next(text, pos);
        ++count;
    }
    return count;
}

size_t byte_offset(std::string_view text, size_t index)
{
    size_t pos = 0;
    for (size_t i = 0; i < index && pos < text.size(); ++i)
        decode_next(text, pos);
    return pos;
}

std::vector<std::string> split_chars(std::string_view text)
{
    std::vector<std::string> chars;
    size_t                   pos = 0;
    while (pos < text.size())
    {
        size_t start = pos;
        decode_next(text, pos);
        chars.emplace_back(text.substr(start, pos - start));
    }
    return chars;
}

std::pair<std::string, std::string> split_at(std::string_view text, size_t index)
{
    size_t off = byte_offset(text, index);
    return {std::string(text.substr(0, off)), std::string(text.substr(off))};
}

void insert(std::string& text, size_t index, char32_t cp)
{
    text.insert(byte_offset(text, index), encode(cp));
}

bool erase(std::string& text, size_t index)
{
    size_t start = byte_offset(text, index);
    if (start >= text.size())
        return false;
    size_t end = start;
    decode_next(text, end);
    text.erase(start, end - start);
    return true;
}

bool is_control(char32_t cp)
{
    return cp < 0x20 || (cp >= 0x7F && cp <= 0x9F);
}

}   // namespace kara::utf8
