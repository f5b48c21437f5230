// TextViewOptions.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_WIDGETS_TEXTVIEWOPTIONS_H
#define TERMTEXT_WIDGETS_TEXTVIEWOPTIONS_H

#include "Event.h"
#include <termtext/canvas/CellStyle.h>
#include <termtext/text/LineIndex.h>

#include <optional>
#include <string>
#include <filesystem>
#include <cstddef>

namespace termtext::widgets {

namespace fs = std::filesystem;
using text::WrapMode;
using text::RuneWidthFn;


enum class ScrollAction {
    None,
    LineUp,
    LineDown,
    PageUp,
    PageDown,
};


struct KeyBindings {
    Key line_up = Key::Up;
    Key line_down = Key::Down;
    Key page_up = Key::PageUp;
    Key page_down = Key::PageDown;

    ScrollAction action(Key key) const {
        if (key == line_up) return ScrollAction::LineUp;
        if (key == line_down) return ScrollAction::LineDown;
        if (key == page_up) return ScrollAction::PageUp;
        if (key == page_down) return ScrollAction::PageDown;
        return ScrollAction::None;
    }
};


struct MouseBindings {
    MouseButton line_up = MouseButton::WheelUp;
    MouseButton line_down = MouseButton::WheelDown;

    ScrollAction action(MouseButton button) const {
        if (button == line_up) return ScrollAction::LineUp;
        if (button == line_down) return ScrollAction::LineDown;
        return ScrollAction::None;
    }
};


/// Construction options of TextView. Fixed for the lifetime of the widget.
struct TextViewOptions {
    WrapMode wrap = WrapMode::None;
    bool roll_content = false;      // keep the newest line visible while at bottom
    bool disable_scrolling = false;  // ignore keyboard and mouse
    size_t page_size = 0;           // lines per page, 0 = canvas height
    KeyBindings keys;
    MouseBindings mouse;
    RuneWidthFn rune_width = text::default_rune_width;
};


/// Per-write options
struct WriteOptions {
    canvas::CellStyle style;
    bool replace = false;  // reset the content before writing
};


/// Read TextViewOptions from config string. Example:
/// ```
/// wrap "runes"        // "none" | "runes"
/// roll_content        // same as `roll_content true`
/// page_size 10
/// keys { line_up "Up"; line_down "Down"; page_up "PageUp"; page_down "PageDown" }
/// mouse { line_up "WheelUp"; line_down "WheelDown" }
/// ```
/// Unknown items and invalid values are logged and ignored.
/// \returns nullopt on syntax error
std::optional<TextViewOptions> parse_options(const std::string& str);

/// Same as `parse_options`, but reads the config from a file.
/// \returns nullopt if the file cannot be read or contains syntax error
std::optional<TextViewOptions> load_options(const fs::path& path);


} // namespace termtext::widgets

#endif // TERMTEXT_WIDGETS_TEXTVIEWOPTIONS_H
