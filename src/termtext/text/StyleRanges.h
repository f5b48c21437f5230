// StyleRanges.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_TEXT_STYLERANGES_H
#define TERMTEXT_TEXT_STYLERANGES_H

#include <termtext/canvas/CellStyle.h>

#include <vector>
#include <cstddef>

namespace termtext::text {

using canvas::CellStyle;


/// Half-open interval [start, end) of byte offsets into a text buffer
/// with attributes for the cells drawn from it.
struct StyleRange {
    size_t start;
    size_t end;
    CellStyle style;

    bool contains(size_t offset) const { return offset >= start && offset < end; }
};


/// Maps byte offsets in an append-only text buffer to style attributes.
///
/// Ranges are recorded in non-decreasing order of `start`, which is guaranteed
/// by the buffer growing only at its end. A range recorded at the same start
/// as the previous one replaces it.
class StyleRanges {
public:
    /// Record style for bytes [start, end), `start` must not precede
    /// the start of previously recorded range.
    void record(size_t start, size_t end, const CellStyle& style);

    /// Find the range in effect at `offset`: the last recorded range
    /// with start <= offset. Returns nullptr if there is none.
    const StyleRange* find(size_t offset) const;

    /// Style in effect at `offset`, default style if no range precedes it.
    CellStyle lookup(size_t offset) const;

    void clear() { m_ranges.clear(); }
    size_t size() const { return m_ranges.size(); }
    bool empty() const { return m_ranges.empty(); }

private:
    std::vector<StyleRange> m_ranges;  // ordered by start
};


} // namespace termtext::text

#endif // TERMTEXT_TEXT_STYLERANGES_H
