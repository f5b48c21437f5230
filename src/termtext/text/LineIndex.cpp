// LineIndex.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "LineIndex.h"

#include <fmt/format.h>
#include <stdexcept>

namespace termtext::text {


LineIndex find_lines(std::string_view text, int width, WrapMode wrap, RuneWidthFn rune_width)
{
    if (width < 1)
        throw std::invalid_argument(fmt::format("find_lines: invalid width {}", width));

    LineIndex lines;
    if (text.empty())
        return lines;

    lines.push_back(0);
    int x = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const auto [len, c] = core::utf8_codepoint_and_length(text.substr(pos));
        if (len <= 0)
            throw std::invalid_argument(fmt::format("find_lines: invalid UTF-8 at offset {}", pos));
        const auto next = pos + size_t(len);
        if (c == '\n') {
            lines.push_back(next);
            x = 0;
            pos = next;
            continue;
        }
        const int w = rune_width(c);
        if (wrap_needed(wrap, x, w, width)) {
            lines.push_back(pos);
            x = 0;
        }
        x += w;
        pos = next;
    }
    return lines;
}


} // namespace termtext::text
