#pragma once
#include <cstddef>
#include <string>

namespace mcptool::util::utf8
{

/// True when text is well-formed UTF-8 (no overlongs, surrogates or bytes past U+10FFFF).
bool is_valid(const std::string& text);

/// Number of code points; an invalid byte counts as one.
std::size_t length(const std::string& text);

/// Up to count code points starting at code point index start.
std::string substr(const std::string& text, std::size_t start, std::size_t count);

} // namespace mcptool::util::utf8
