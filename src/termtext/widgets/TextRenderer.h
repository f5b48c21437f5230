// TextRenderer.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_WIDGETS_TEXTRENDERER_H
#define TERMTEXT_WIDGETS_TEXTRENDERER_H

#include <termtext/canvas/Canvas.h>
#include <termtext/text/LineIndex.h>
#include <termtext/text/StyleRanges.h>

#include <string_view>

namespace termtext::widgets {


/// Minimal canvas height for drawing the scroll markers
constexpr int c_min_lines_for_markers = 3;
constexpr char32_t c_scroll_up_marker = U'⇧';
constexpr char32_t c_scroll_down_marker = U'⇩';


/// Draws visual lines of a text onto a canvas.
///
/// The renderer walks the text from the first visible line, breaking
/// rows at newlines and (with WrapMode::AtRunes) at runes which don't fit.
/// The breaks follow the same rule as `text::find_lines`, so the rows
/// drawn correspond to the entries of the line index.
///
/// When the canvas has at least `c_min_lines_for_markers` rows,
/// the first row is replaced by a scroll-up marker if there are lines above,
/// and the last row by a scroll-down marker if there are lines below.
class TextRenderer {
public:
    TextRenderer(std::string_view text, const text::LineIndex& lines,
                 const text::StyleRanges& styles, text::WrapMode wrap,
                 text::RuneWidthFn rune_width)
        : m_text(text), m_lines(lines), m_styles(styles),
          m_wrap(wrap), m_rune_width(rune_width) {}

    /// Draw onto `canvas`, starting with line number `first_line`.
    /// \throws core::CanvasError propagated from the canvas
    /// \throws core::InvariantError if a marker doesn't occupy exactly one cell
    void draw(canvas::Canvas& canvas, size_t first_line);

private:
    bool has_lines_below(size_t first_line, int height) const;

    std::string_view m_text;
    const text::LineIndex& m_lines;
    const text::StyleRanges& m_styles;
    text::WrapMode m_wrap;
    text::RuneWidthFn m_rune_width;
};


} // namespace termtext::widgets

#endif // TERMTEXT_WIDGETS_TEXTRENDERER_H
