// ScrollTracker.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "ScrollTracker.h"

#include <algorithm>

namespace termtext::widgets {


size_t ScrollTracker::first_line(size_t lines, size_t height)
{
    m_lines = lines;
    m_height = height;
    if (lines <= height) {
        // everything fits
        m_first = 0;
    } else if (m_roll_content && m_follow_tail) {
        m_first = max_first();
    } else {
        m_first = std::min(m_first, max_first());
    }
    return m_first;
}


void ScrollTracker::reset()
{
    m_first = 0;
    m_lines = 0;
    m_height = 0;
    m_follow_tail = true;
}


void ScrollTracker::scroll_up(size_t n)
{
    if (!m_enabled || m_first == 0)
        return;
    m_first = n > m_first ? 0 : m_first - n;
    m_follow_tail = false;
}


void ScrollTracker::scroll_down(size_t n)
{
    if (!m_enabled || m_lines <= m_height)
        return;
    m_first = std::min(max_first(), m_first + n);
    if (m_first == max_first())
        m_follow_tail = true;
}


size_t ScrollTracker::page_step() const
{
    const auto step = m_page_size != 0 ? m_page_size : m_height;
    return std::max(step, size_t(1));
}


} // namespace termtext::widgets
