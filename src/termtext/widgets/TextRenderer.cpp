// TextRenderer.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "TextRenderer.h"
#include <termtext/core/error.h>
#include <termtext/core/string.h>

#include <fmt/format.h>

namespace termtext::widgets {

using namespace termtext::core;
using canvas::CellStyle;
using text::wrap_needed;


static void draw_marker(canvas::Canvas& canvas, Vec2i pos, char32_t marker)
{
    const int cells = canvas.set_cell(pos, marker, CellStyle{});
    if (cells != 1)
        throw InvariantError(fmt::format(
                "scroll marker '{}' occupies {} cells, only single-cell markers are supported",
                escape_utf8(marker), cells));
}


bool TextRenderer::has_lines_below(size_t first_line, int height) const
{
    return size_t(height) < m_lines.size() - first_line;
}


void TextRenderer::draw(canvas::Canvas& canvas, size_t first_line)
{
    const Vec2i size = canvas.size();
    const int width = size.x;
    const int height = size.y;
    if (width < 1 || height < 1 || first_line >= m_lines.size())
        return;

    const bool markers = height >= c_min_lines_for_markers;
    Vec2i cur;
    size_t pos = m_lines[first_line];

    if (markers && first_line > 0) {
        draw_marker(canvas, cur, c_scroll_up_marker);
        // the marker replaced the first visible line
        if (first_line + 1 >= m_lines.size())
            return;
        cur = {0, 1};
        pos = m_lines[first_line + 1];
    }

    const text::StyleRange* range = nullptr;
    bool trimmed = false;
    while (pos < m_text.size()) {
        const auto [len, c] = utf8_codepoint_and_length(m_text.substr(pos));
        if (len <= 0)
            throw InvariantError(fmt::format("invalid UTF-8 in text buffer at offset {}", pos));
        const size_t rune_pos = pos;
        pos += size_t(len);

        const bool newline = (c == '\n');
        const int w = newline ? 0 : m_rune_width(c);
        if (newline || wrap_needed(m_wrap, cur.x, w, width)) {
            cur = {0, cur.y + 1};
            trimmed = false;
        }

        if (cur.y >= height)
            break;
        if (markers && cur.y == height - 1 && has_lines_below(first_line, height)) {
            draw_marker(canvas, cur, c_scroll_down_marker);
            break;
        }

        if (newline || trimmed)
            continue;

        if (cur.x + w > width) {
            if (m_wrap == text::WrapMode::None) {
                // skip the rest of this line
                trimmed = true;
                continue;
            }
            // A rune wider than the whole canvas. It has its own line
            // in the index. Advance as if it was drawn to keep in sync.
            cur.x += w;
            continue;
        }

        if (range == nullptr || !range->contains(rune_pos))
            range = m_styles.find(rune_pos);
        const CellStyle style = range != nullptr ? range->style : CellStyle{};
        cur.x += canvas.set_cell(cur, c, style);
    }
}


} // namespace termtext::widgets
