// string.h created on 2018-03-23 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CORE_STRING_H
#define TERMTEXT_CORE_STRING_H

#include <string_view>
#include <string>
#include <vector>
#include <utility>

namespace termtext::core {


/// Split `str` at each `delim`, at most `max_splits` times (-1 = unlimited).
/// Always returns at least one (possibly empty) part.
std::vector<std::string_view> split(std::string_view str, char delim, int max_splits = -1);

/// Make text safe for error messages: C escapes for control chars (e.g. '\n'),
/// \u{XXXX} for non-ASCII control and space chars, \xNN for broken UTF-8.
std::string escape_utf8(std::string_view str);
std::string escape_utf8(char32_t c);

/// Encode a code point as UTF-8
std::string to_utf8(char32_t codepoint);

/// Decode the first UTF-8 character in `utf8`.
/// \returns {length in bytes, code point},
///          {0, 0} if `utf8` is empty or the sequence is incomplete,
///          {-1, 0} if the sequence is malformed
std::pair<int, char32_t> utf8_codepoint_and_length(std::string_view utf8);

/// Byte offset of the first malformed or incomplete UTF-8 sequence,
/// or `npos` if all of `str` is valid.
size_t utf8_invalid_offset(std::string_view str);

/// Unicode category Cc: C0, DEL and C1
constexpr bool is_control(char32_t c) {
    return c < 0x20 || (c >= 0x7f && c < 0xa0);
}

/// Unicode property White_Space
constexpr bool is_space(char32_t c) {
    if (c >= 0x2000 && c <= 0x200A)
        return true;
    switch (c) {
        case '\t': case '\n': case '\v': case '\f': case '\r': case ' ':
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return false;
    }
}

/// Terminal cell width of a code point, like POSIX `wcwidth`:
/// 0 for non-printable and combining, 2 for wide East Asian chars and emoji.
int c32_width(char32_t c);

/// Cells taken by a rune on a canvas. Never less than one.
inline int rune_width(char32_t c) {
    const int w = c32_width(c);
    return w < 1 ? 1 : w;
}


} // namespace termtext::core

#endif // TERMTEXT_CORE_STRING_H
