// CellCanvas.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "CellCanvas.h"
#include <termtext/core/error.h>
#include <termtext/core/string.h>

#include <fmt/format.h>

#include <algorithm>

namespace termtext::canvas {

using namespace termtext::core;


CellCanvas::CellCanvas(Vec2i size)
{
    resize(size);
}


void CellCanvas::resize(Vec2i size)
{
    m_size = {std::max(size.x, 0), std::max(size.y, 0)};
    m_cells.assign(size_t(m_size.area()), Cell{});
}


void CellCanvas::clear()
{
    m_cells.assign(m_cells.size(), Cell{});
}


auto CellCanvas::cell(Vec2i pos) const -> const Cell&
{
    if (pos.x < 0 || pos.y < 0 || pos.x >= m_size.x || pos.y >= m_size.y)
        throw CanvasError(fmt::format("cell ({}, {}) is outside the canvas of size {}x{}",
                                      pos.x, pos.y, m_size.x, m_size.y));
    return m_cells[index(pos)];
}


std::string CellCanvas::row_text(int row) const
{
    std::string res;
    for (int x = 0; x != m_size.x; ++x) {
        const auto& c = cell({x, row});
        if (!c.continuation)
            res += to_utf8(c.rune);
    }
    return res;
}


int CellCanvas::set_cell(Vec2i pos, char32_t c, const CellStyle& style)
{
    if (pos.x < 0 || pos.y < 0 || pos.x >= m_size.x || pos.y >= m_size.y)
        throw CanvasError(fmt::format("cannot set cell ({}, {}), it is outside the canvas of size {}x{}",
                                      pos.x, pos.y, m_size.x, m_size.y));
    const int width = rune_width(c);
    if (pos.x + width > m_size.x)
        throw CanvasError(fmt::format("cannot set cell ({}, {}), full-width rune '{}' doesn't fit into canvas width {}",
                                      pos.x, pos.y, escape_utf8(c), m_size.x));

    // Overwriting half of a full-width rune destroys the other half
    if (m_cells[index(pos)].continuation)
        m_cells[index({pos.x - 1, pos.y})] = Cell{};
    const Vec2i after {pos.x + width, pos.y};
    if (after.x < m_size.x && m_cells[index(after)].continuation)
        m_cells[index(after)] = Cell{};

    m_cells[index(pos)] = Cell{c, style, false};
    for (int i = 1; i < width; ++i)
        m_cells[index({pos.x + i, pos.y})] = Cell{' ', style, true};
    return width;
}


bool CellCanvas::render(TermCtl& t) const
{
    std::string out;
    for (int y = 0; y != m_size.y; ++y) {
        out += t.move_to(unsigned(y), 0).normal().seq();
        CellStyle current;
        for (int x = 0; x != m_size.x; ++x) {
            const auto& c = m_cells[index({x, y})];
            if (c.continuation)
                continue;
            if (c.style != current) {
                t.normal();
                out += c.style.apply(t).seq();
                current = c.style;
            }
            out += to_utf8(c.rune);
        }
    }
    out += t.normal().seq();
    return t.write(out);
}


} // namespace termtext::canvas
