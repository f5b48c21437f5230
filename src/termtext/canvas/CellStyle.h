// CellStyle.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CANVAS_CELLSTYLE_H
#define TERMTEXT_CANVAS_CELLSTYLE_H

#include <termtext/core/TermCtl.h>

namespace termtext::canvas {

using core::TermCtl;


/// Rendering attributes of a single cell.
/// Default-constructed style means terminal default colors, no modes.
struct CellStyle {
    using Color = TermCtl::Color;

    Color fg = Color::Default;
    Color bg = Color::Default;

    bool bold : 1 = false;
    bool dim : 1 = false;
    bool italic : 1 = false;
    bool underline : 1 = false;
    bool blink : 1 = false;
    bool reverse : 1 = false;
    bool cross_out : 1 = false;

    bool operator==(const CellStyle& rhs) const = default;

    /// Append control sequences to `t` which switch the terminal
    /// from default attributes to this style.
    TermCtl& apply(TermCtl& t) const;
};


} // namespace termtext::canvas

#endif // TERMTEXT_CANVAS_CELLSTYLE_H
