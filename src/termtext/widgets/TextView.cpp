// TextView.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "TextView.h"
#include "TextRenderer.h"
#include <termtext/core/error.h>
#include <termtext/core/string.h>
#include <termtext/core/log.h>

#include <fmt/format.h>

namespace termtext::widgets {

using namespace termtext::core;


static void validate_text(std::string_view text)
{
    if (text.empty())
        throw ValidationError("the text cannot be empty");

    const auto invalid = utf8_invalid_offset(text);
    if (invalid != std::string_view::npos)
        throw ValidationError(fmt::format(
                "the provided text \"{}\" is not valid UTF-8 (at offset {})",
                escape_utf8(text.substr(0, invalid)), invalid));

    size_t pos = 0;
    while (pos < text.size()) {
        const auto [len, c] = utf8_codepoint_and_length(text.substr(pos));
        pos += size_t(len);
        if (c == ' ' || c == '\n')
            continue;
        if (is_control(c))
            throw ValidationError(fmt::format(
                    "the provided text \"{}\" cannot contain control characters, found: '{}'",
                    escape_utf8(text), escape_utf8(c)));
        if (is_space(c))
            throw ValidationError(fmt::format(
                    "the provided text \"{}\" cannot contain space character '{}'",
                    escape_utf8(text), escape_utf8(c)));
    }
}


TextView::TextView(TextViewOptions options)
    : m_options(options),
      m_scroll(!options.disable_scrolling, options.roll_content, options.page_size)
{}


void TextView::write(std::string_view text, const WriteOptions& opts)
{
    std::lock_guard<std::mutex> lock_guard(m_mutex);

    validate_text(text);
    if (opts.replace)
        clear_content();

    const size_t pos = m_buffer.size();
    m_styles.record(pos, pos + text.size(), opts.style);
    m_buffer.append(text);
    m_new_text = true;
}


void TextView::reset()
{
    std::lock_guard<std::mutex> lock_guard(m_mutex);
    clear_content();
    log::debug("TextView: reset");
}


void TextView::clear_content()
{
    m_buffer.clear();
    m_styles.clear();
    m_lines.clear();
    m_scroll.reset();
    m_last_width = 0;
    m_new_text = true;
}


void TextView::draw(canvas::Canvas& canvas)
{
    std::lock_guard<std::mutex> lock_guard(m_mutex);

    const Vec2i size = canvas.size();
    if (size.x < 1 || size.y < 1)
        return;

    if (m_new_text || m_last_width != size.x) {
        m_lines = text::find_lines(m_buffer, size.x, m_options.wrap, m_options.rune_width);
        log::debug("TextView: relayout {} bytes at width {}: {} lines",
                   m_buffer.size(), size.x, m_lines.size());
    }
    m_last_width = size.x;

    if (m_lines.empty())
        return;

    const size_t first = m_scroll.first_line(m_lines.size(), size_t(size.y));
    TextRenderer renderer(m_buffer, m_lines, m_styles, m_options.wrap, m_options.rune_width);
    renderer.draw(canvas, first);
    m_new_text = false;
}


bool TextView::key_event(const KeyEvent& ev)
{
    std::lock_guard<std::mutex> lock_guard(m_mutex);
    if (m_options.disable_scrolling)
        return false;
    return apply(m_options.keys.action(ev.key));
}


bool TextView::mouse_button_event(const MouseBtnEvent& ev)
{
    std::lock_guard<std::mutex> lock_guard(m_mutex);
    if (m_options.disable_scrolling)
        return false;
    return apply(m_options.mouse.action(ev.button));
}


bool TextView::apply(ScrollAction action)
{
    switch (action) {
        case ScrollAction::LineUp: m_scroll.up_one_line(); return true;
        case ScrollAction::LineDown: m_scroll.down_one_line(); return true;
        case ScrollAction::PageUp: m_scroll.up_one_page(); return true;
        case ScrollAction::PageDown: m_scroll.down_one_page(); return true;
        case ScrollAction::None: break;
    }
    return false;
}


Capabilities TextView::capabilities() const
{
    return {
        .min_size = {1, 1},
        .want_keyboard = !m_options.disable_scrolling,
        .want_mouse = !m_options.disable_scrolling,
    };
}


std::string TextView::content() const
{
    std::lock_guard<std::mutex> lock_guard(m_mutex);
    return m_buffer;
}


size_t TextView::line_count() const
{
    std::lock_guard<std::mutex> lock_guard(m_mutex);
    return m_lines.size();
}


size_t TextView::first_line() const
{
    std::lock_guard<std::mutex> lock_guard(m_mutex);
    return m_scroll.first();
}


} // namespace termtext::widgets
