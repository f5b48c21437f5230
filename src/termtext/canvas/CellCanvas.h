// CellCanvas.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CANVAS_CELLCANVAS_H
#define TERMTEXT_CANVAS_CELLCANVAS_H

#include "Canvas.h"
#include <termtext/core/TermCtl.h>

#include <vector>
#include <string>

namespace termtext::canvas {


/// In-memory canvas. Holds the cells until they are rendered to a terminal.
class CellCanvas: public Canvas {
public:
    struct Cell {
        char32_t rune = ' ';
        CellStyle style;
        bool continuation = false;  // right half of a full-width rune
    };

    explicit CellCanvas(Vec2i size);

    /// Change size, clearing all cells
    void resize(Vec2i size);

    /// Reset all cells to blank space with default style
    void clear();

    const Cell& cell(Vec2i pos) const;

    /// Text content of a row (UTF-8), continuation cells are skipped.
    /// Blank cells are included, use rstrip on the result if needed.
    std::string row_text(int row) const;

    /// Paint whole canvas to the terminal, starting at top-left corner.
    /// \returns false if writing to the terminal failed
    bool render(core::TermCtl& t) const;

    // impl Canvas
    Vec2i size() const override { return m_size; }
    int set_cell(Vec2i pos, char32_t c, const CellStyle& style) override;

private:
    size_t index(Vec2i pos) const { return size_t(pos.y) * size_t(m_size.x) + size_t(pos.x); }

    Vec2i m_size;
    std::vector<Cell> m_cells;
};


} // namespace termtext::canvas

#endif // TERMTEXT_CANVAS_CELLCANVAS_H
