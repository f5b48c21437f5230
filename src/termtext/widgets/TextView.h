// TextView.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_WIDGETS_TEXTVIEW_H
#define TERMTEXT_WIDGETS_TEXTVIEW_H

#include "Event.h"
#include "TextViewOptions.h"
#include "ScrollTracker.h"
#include <termtext/canvas/Canvas.h>
#include <termtext/text/LineIndex.h>
#include <termtext/text/StyleRanges.h>

#include <mutex>
#include <string>
#include <string_view>

namespace termtext::widgets {


/// What the widget needs from the host
struct Capabilities {
    Vec2i min_size {1, 1};  // at least one full-width rune
    bool want_keyboard = true;
    bool want_mouse = true;
};


/// Scrollable view of styled text.
///
/// Text is appended by `write`. Each line is either trimmed or wrapped
/// at the canvas width, according to the options. The content can be scrolled
/// by keyboard and mouse (see KeyBindings, MouseBindings), with markers
/// shown on the canvas when there is more content above or below.
///
/// All public methods are thread-safe.
class TextView {
public:
    explicit TextView(TextViewOptions options = {});
    TextView(const TextView&) = delete;
    TextView& operator=(const TextView&) = delete;

    /// Append `text` for display. The text may contain newlines,
    /// but no other control or space characters except ' '.
    /// \throws core::ValidationError for empty or invalid text,
    ///         the content is left unchanged in that case
    void write(std::string_view text, const WriteOptions& opts = {});

    /// Drop all content and return to the initial scroll position.
    void reset();

    /// Draw the content onto `canvas`. Does nothing if there is no content.
    /// \throws core::CanvasError propagated from the canvas
    void draw(canvas::Canvas& canvas);

    /// Scroll according to the key bindings.
    /// \returns true if the event was handled
    bool key_event(const KeyEvent& ev);

    /// Scroll according to the mouse bindings.
    /// \returns true if the event was handled
    bool mouse_button_event(const MouseBtnEvent& ev);

    Capabilities capabilities() const;

    /// Copy of the current content
    std::string content() const;

    /// Number of visual lines as of the last draw
    size_t line_count() const;

    /// First visible line as of the last draw or scroll
    size_t first_line() const;

private:
    void clear_content();
    bool apply(ScrollAction action);

    mutable std::mutex m_mutex;
    const TextViewOptions m_options;
    std::string m_buffer;
    text::StyleRanges m_styles;
    text::LineIndex m_lines;
    ScrollTracker m_scroll;
    int m_last_width = 0;
    bool m_new_text = false;
};


} // namespace termtext::widgets

#endif // TERMTEXT_WIDGETS_TEXTVIEW_H
