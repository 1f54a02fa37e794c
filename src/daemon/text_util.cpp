#include "text_util.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace text {

namespace {

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

constexpr std::string_view ascii_ws = " \t\n\r\f\v\x1c\x1d\x1e\x1f";

// UTF-8 encodings of the non-ASCII code points with the White_Space property.
constexpr std::array<std::string_view, 18> unicode_ws = {
    "\xC2\x85",     "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81",
    "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86",
    "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8",
    "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F",
};

constexpr std::string_view ideographic_space = "\xE3\x80\x80";

// Byte length of the whitespace sequence at the front of s, or 0.
size_t leading_ws(std::string_view s) {
    if (s.empty()) return 0;
    if (ascii_ws.find(s.front()) != std::string_view::npos) return 1;
    if (s.starts_with(ideographic_space)) return ideographic_space.size();
    for (auto ws : unicode_ws) {
        if (s.starts_with(ws)) return ws.size();
    }
    return 0;
}

size_t trailing_ws(std::string_view s) {
    if (s.empty()) return 0;
    if (ascii_ws.find(s.back()) != std::string_view::npos) return 1;
    if (s.ends_with(ideographic_space)) return ideographic_space.size();
    for (auto ws : unicode_ws) {
        if (s.ends_with(ws)) return ws.size();
    }
    return 0;
}

} // namespace

size_t char_count(std::string_view s) {
    return static_cast<size_t>(std::ranges::count_if(s, [](char c) { return !is_continuation(c); }));
}

std::string truncate_chars(std::string_view s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); i++) {
        if (is_continuation(s[i])) continue;
        if (chars == max_chars) return std::string(s.substr(0, i));
        chars++;
    }
    return std::string(s);
}

std::string_view trim(std::string_view s) {
    while (size_t n = leading_ws(s)) s.remove_prefix(n);
    while (size_t n = trailing_ws(s)) s.remove_suffix(n);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace text
