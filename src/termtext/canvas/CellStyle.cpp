// CellStyle.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "CellStyle.h"

namespace termtext::canvas {


TermCtl& CellStyle::apply(TermCtl& t) const
{
    if (fg != Color::Default)
        t.fg(fg);
    if (bg != Color::Default)
        t.bg(bg);
    using Mode = TermCtl::Mode;
    if (bold) t.mode(Mode::Bold);
    if (dim) t.mode(Mode::Dim);
    if (italic) t.mode(Mode::Italic);
    if (underline) t.mode(Mode::Underline);
    if (blink) t.mode(Mode::Blink);
    if (reverse) t.mode(Mode::Reverse);
    if (cross_out) t.mode(Mode::CrossOut);
    return t;
}


} // namespace termtext::canvas
