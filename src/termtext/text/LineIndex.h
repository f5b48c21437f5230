// LineIndex.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_TEXT_LINEINDEX_H
#define TERMTEXT_TEXT_LINEINDEX_H

#include <termtext/core/string.h>

#include <string_view>
#include <vector>
#include <cstddef>

namespace termtext::text {


enum class WrapMode {
    None,       // long lines are trimmed at canvas width
    AtRunes,    // long lines continue on next row, breaking between any two runes
};

/// Number of cells occupied by a rune.
using RuneWidthFn = int(*)(char32_t);

inline int default_rune_width(char32_t c) { return core::rune_width(c); }

/// Byte offsets into the text where each visual line begins.
using LineIndex = std::vector<size_t>;


/// Find visual lines of `text` drawn on canvas of `width` cells.
///
/// Each newline starts a new line at the following offset (a trailing newline
/// starts a final empty line). With `WrapMode::AtRunes`, a new line also begins
/// at a rune which would overflow `width`.
///
/// This is a pure function, the result depends only on the arguments.
/// \param text         valid UTF-8
/// \param width        canvas width, must be >= 1
/// \throws std::invalid_argument for width < 1
LineIndex find_lines(std::string_view text, int width, WrapMode wrap,
                     RuneWidthFn rune_width = default_rune_width);

/// Should a rune of `rune_width` placed at column `x` start a new visual line?
/// Shared by line index and renderer, so both agree on the line breaks.
constexpr bool wrap_needed(WrapMode wrap, int x, int rune_width, int width) {
    return wrap == WrapMode::AtRunes && x > 0 && x + rune_width > width;
}


} // namespace termtext::text

#endif // TERMTEXT_TEXT_LINEINDEX_H
