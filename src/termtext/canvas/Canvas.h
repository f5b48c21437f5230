// Canvas.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CANVAS_CANVAS_H
#define TERMTEXT_CANVAS_CANVAS_H

#include "CellStyle.h"
#include <termtext/core/geometry.h>

namespace termtext::canvas {

using core::Vec2i;


/// Rectangular grid of character cells, provided by the host application.
class Canvas {
public:
    virtual ~Canvas() = default;

    /// Drawable area: x = columns, y = rows
    virtual Vec2i size() const = 0;

    /// Put rune `c` with `style` into the cell at `pos`.
    /// \returns    number of cells occupied by the rune (2 for full-width runes)
    /// \throws     core::CanvasError when `pos` is outside the area
    ///             or the rune doesn't fit into the rest of the row
    virtual int set_cell(Vec2i pos, char32_t c, const CellStyle& style) = 0;
};


} // namespace termtext::canvas

#endif // TERMTEXT_CANVAS_CANVAS_H
