// StyleRanges.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "StyleRanges.h"

#include <algorithm>
#include <stdexcept>

namespace termtext::text {


void StyleRanges::record(size_t start, size_t end, const CellStyle& style)
{
    if (start >= end)
        throw std::invalid_argument("StyleRanges: empty range");
    if (!m_ranges.empty()) {
        auto& last = m_ranges.back();
        if (start < last.start)
            throw std::invalid_argument("StyleRanges: ranges must be recorded in order");
        if (start == last.start) {
            last = {start, end, style};
            return;
        }
    }
    m_ranges.push_back({start, end, style});
}


const StyleRange* StyleRanges::find(size_t offset) const
{
    auto it = std::upper_bound(m_ranges.begin(), m_ranges.end(), offset,
            [](size_t ofs, const StyleRange& r) { return ofs < r.start; });
    if (it == m_ranges.begin())
        return nullptr;
    return &*std::prev(it);
}


CellStyle StyleRanges::lookup(size_t offset) const
{
    const auto* range = find(offset);
    if (range == nullptr)
        return {};
    return range->style;
}


} // namespace termtext::text
