#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace text {

// Number of UTF-8 code points in s.
size_t char_count(std::string_view s);

// First max_chars code points of s. Never splits a multi-byte sequence.
std::string truncate_chars(std::string_view s, size_t max_chars);

// Strip leading and trailing whitespace: ASCII, the \x1c-\x1f separators
// and the Unicode space characters (NBSP, U+2000-U+200A, U+3000, ...).
std::string_view trim(std::string_view s);

std::string to_lower(std::string_view s);

} // namespace text
