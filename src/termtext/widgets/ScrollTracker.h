// ScrollTracker.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_WIDGETS_SCROLLTRACKER_H
#define TERMTEXT_WIDGETS_SCROLLTRACKER_H

#include <cstddef>

namespace termtext::widgets {


/// Tracks the first visible line of a scrollable content.
///
/// The scroll commands are clamped to [0, lines - height], where `lines`
/// and `height` are the values seen by the last call to `first_line()`.
/// Scrolling past either end is a no-op.
class ScrollTracker {
public:
    /// \param enabled      when false, all scroll commands are ignored
    /// \param roll_content keep the last line visible while the view is at the bottom
    /// \param page_size    lines per page, 0 = viewport height
    explicit ScrollTracker(bool enabled = true, bool roll_content = false, size_t page_size = 0)
        : m_enabled(enabled), m_roll_content(roll_content), m_page_size(page_size) {}

    void up_one_line() { scroll_up(1); }
    void down_one_line() { scroll_down(1); }
    void up_one_page() { scroll_up(page_step()); }
    void down_one_page() { scroll_down(page_step()); }

    /// Evaluate the first visible line for content of `lines`
    /// shown in viewport of `height` lines. Remembers both values
    /// for following scroll commands.
    size_t first_line(size_t lines, size_t height);

    /// First line as of last evaluation or scroll command
    size_t first() const { return m_first; }

    /// Is the view anchored at the end of content? (only with roll_content)
    bool is_following_tail() const { return m_roll_content && m_follow_tail; }

    /// Back to initial state (top of content, or following the tail)
    void reset();

private:
    void scroll_up(size_t n);
    void scroll_down(size_t n);
    size_t page_step() const;
    size_t max_first() const { return m_lines > m_height ? m_lines - m_height : 0; }

    size_t m_first = 0;
    size_t m_lines = 0;
    size_t m_height = 0;
    bool m_follow_tail = true;
    bool m_enabled;
    bool m_roll_content;
    size_t m_page_size;
};


} // namespace termtext::widgets

#endif // TERMTEXT_WIDGETS_SCROLLTRACKER_H
