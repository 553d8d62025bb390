#include "mcptool/util/utf8.hpp"

namespace mcptool::util::utf8
{

namespace
{

// Returns number of bytes that form a valid UTF-8 lead byte (1-4), or 0 if invalid.
std::size_t lead_length(unsigned char byte)
{
    if (byte < 0x80u)
        return 1;
    if (byte >= 0xC2u && byte <= 0xDFu)
        return 2;
    if (byte >= 0xE0u && byte <= 0xEFu)
        return 3;
    if (byte >= 0xF0u && byte <= 0xF4u)
        return 4;
    return 0;
}

bool is_continuation(unsigned char byte)
{
    return (byte & 0xC0u) == 0x80u;
}

// Length of the well-formed sequence at pos, or 0.
std::size_t sequence_length(const std::string& text, std::size_t pos)
{
    const auto* p = reinterpret_cast<const unsigned char*>(text.data()) + pos;
    std::size_t remaining = text.size() - pos;
    std::size_t len = lead_length(p[0]);
    if (len == 0 || len > remaining)
        return 0;
    for (std::size_t i = 1; i < len; ++i)
        if (!is_continuation(p[i]))
            return 0;
    // Second-byte ranges that exclude overlongs, surrogates and > U+10FFFF.
    if (p[0] == 0xE0u && p[1] < 0xA0u)
        return 0;
    if (p[0] == 0xEDu && p[1] > 0x9Fu)
        return 0;
    if (p[0] == 0xF0u && p[1] < 0x90u)
        return 0;
    if (p[0] == 0xF4u && p[1] > 0x8Fu)
        return 0;
    return len;
}

// Advance one code point; invalid bytes advance by one.
std::size_t next(const std::string& text, std::size_t pos)
{
    std::size_t len = sequence_length(text, pos);
    return pos + (len == 0 ? 1 : len);
}

} // namespace

bool is_valid(const std::string& text)
{
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t len = sequence_length(text, pos);
        if (len == 0)
            return false;
        pos += len;
    }
    return true;
}

std::size_t length(const std::string& text)
{
    std::size_t count = 0;
    for (std::size_t pos = 0; pos < text.size(); pos = next(text, pos))
        ++count;
    return count;
}

std::string substr(const std::string& text, std::size_t start, std::size_t count)
{
    std::size_t pos = 0;
    for (std::size_t i = 0; i < start && pos < text.size(); ++i)
        pos = next(text, pos);
    std::size_t end = pos;
    for (std::size_t i = 0; i < count && end < text.size(); ++i)
        end = next(text, end);
    return text.substr(pos, end - pos);
}

} // namespace mcptool::util::utf8
