// string.cpp created on 2018-03-23 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "string.h"

#include <fmt/format.h>
#include <widechar_width.h>

#include <cstdint>

namespace termtext::core {


std::vector<std::string_view> split(std::string_view str, char delim, int max_splits)
{
    std::vector<std::string_view> parts;
    for (; max_splits != 0; --max_splits) {
        const size_t end = str.find(delim);
        if (end == std::string_view::npos)
            break;
        parts.push_back(str.substr(0, end));
        str.remove_prefix(end + 1);
    }
    parts.push_back(str);
    return parts;
}


std::string escape_utf8(char32_t c)
{
    switch (c) {
        case '\a': return "\\a";
        case '\b': return "\\b";
        case '\t': return "\\t";
        case '\n': return "\\n";
        case '\v': return "\\v";
        case '\f': return "\\f";
        case '\r': return "\\r";
        case '"':  return "\\\"";
        case '\\': return "\\\\";
        default: break;
    }
    if (is_control(c) && c < 0x80)
        return fmt::format("\\x{:02x}", uint32_t(c));
    if (is_control(c) || (is_space(c) && c != ' '))
        return fmt::format("\\u{{{:04X}}}", uint32_t(c));
    return to_utf8(c);
}


std::string escape_utf8(std::string_view str)
{
    std::string res;
    res.reserve(str.size());
    while (!str.empty()) {
        const auto [len, c] = utf8_codepoint_and_length(str);
        if (len > 0) {
            res += escape_utf8(c);
            str.remove_prefix(size_t(len));
        } else {
            res += fmt::format("\\x{:02x}", uint8_t(str[0]));
            str.remove_prefix(1);
        }
    }
    return res;
}


std::string to_utf8(char32_t codepoint)
{
    const auto c = uint32_t(codepoint);
    if (c < 0x80)
        return std::string(1, char(c));

    // lead byte marker and number of continuation bytes
    const auto [lead, tail] = c < 0x800 ? std::pair{0xc0u, 1}
                            : c < 0x10000 ? std::pair{0xe0u, 2}
                            : std::pair{0xf0u, 3};
    std::string res(size_t(tail + 1), '\0');
    res[0] = char(lead | (c >> (6 * tail)));
    for (int i = 1; i <= tail; ++i)
        res[size_t(i)] = char(0x80 | ((c >> (6 * (tail - i))) & 0x3f));
    return res;
}


std::pair<int, char32_t> utf8_codepoint_and_length(std::string_view utf8)
{
    if (utf8.empty())
        return {0, 0};

    const auto lead = uint8_t(utf8[0]);
    if (lead < 0x80)
        return {1, lead};

    int len;
    if (lead >= 0xf0 && lead < 0xf8)
        len = 4;
    else if (lead >= 0xe0)
        len = lead < 0xf0 ? 3 : -1;
    else if (lead >= 0xc0)
        len = 2;
    else
        len = -1;  // stray continuation byte
    if (len < 0)
        return {-1, 0};

    char32_t c = lead & (0x7f >> len);
    for (int i = 1; i < len; ++i) {
        if (size_t(i) == utf8.size())
            return {0, 0};
        const auto b = uint8_t(utf8[size_t(i)]);
        if ((b & 0xc0) != 0x80)
            return {-1, 0};
        c = (c << 6) | (b & 0x3f);
    }
    return {len, c};
}


size_t utf8_invalid_offset(std::string_view str)
{
    for (size_t pos = 0; pos < str.size(); ) {
        const int len = utf8_codepoint_and_length(str.substr(pos)).first;
        if (len <= 0)
            return pos;
        pos += size_t(len);
    }
    return std::string_view::npos;
}


int c32_width(char32_t c)
{
    const int w = widechar_wcwidth(uint32_t(c));
    if (w >= 0)
        return w;
    switch (w) {
        case widechar_nonprint:
        case widechar_combining:
            return 0;
        case widechar_widened_in_9:
            return 2;
        default:
            // ambiguous, private use, unassigned
            return 1;
    }
}


} // namespace termtext::core
