// Event.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_WIDGETS_EVENT_H
#define TERMTEXT_WIDGETS_EVENT_H

#include <termtext/core/geometry.h>

#include <optional>
#include <string_view>
#include <iterator>
#include <cstdint>

namespace termtext::widgets {

using core::Vec2i;


enum class Key : uint8_t {
    Unknown,
    Character,  // printable char, see KeyEvent::unicode
    Escape, Enter, Backspace, Tab,
    Insert, Delete, Home, End, PageUp, PageDown,
    Left, Right, Up, Down,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    _Last = F12
};
static constexpr const char* c_key_names[] = {
    "Unknown",
    "Character",
    "Escape", "Enter", "Backspace", "Tab",
    "Insert", "Delete", "Home", "End", "PageUp", "PageDown",
    "Left", "Right", "Up", "Down",
    "F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12",
};
static_assert(std::size(c_key_names) == size_t(Key::_Last) + 1);

/// Key by name as listed in `c_key_names`, Key::Unknown if not found
constexpr Key parse_key(std::string_view name) {
    for (size_t i = 0; i != std::size(c_key_names); ++i) {
        if (name == c_key_names[i])
            return Key(i);
    }
    return Key::Unknown;
}


struct ModKey {
    bool shift : 1 = false;
    bool alt : 1 = false;
    bool ctrl : 1 = false;

    bool operator==(const ModKey& rhs) const = default;
};


struct KeyEvent {
    Key key;
    ModKey mod {};
    char32_t unicode = 0;  // only for Key::Character
};


enum class MouseButton {
    Left,
    Middle,
    Right,
    WheelUp,
    WheelDown,
    _Last = WheelDown
};
static constexpr const char* c_mouse_button_names[] = {
    "Left", "Middle", "Right", "WheelUp", "WheelDown",
};
static_assert(std::size(c_mouse_button_names) == size_t(MouseButton::_Last) + 1);

constexpr std::optional<MouseButton> parse_mouse_button(std::string_view name) {
    for (size_t i = 0; i != std::size(c_mouse_button_names); ++i) {
        if (name == c_mouse_button_names[i])
            return MouseButton(i);
    }
    return {};
}

/// Translate xterm button number (modifier bits stripped).
/// Returns nullopt for buttons which are not tracked (extra buttons, motion).
constexpr std::optional<MouseButton> mouse_button_from_code(int code) {
    switch (code) {
        case 0: return MouseButton::Left;
        case 1: return MouseButton::Middle;
        case 2: return MouseButton::Right;
        case 64: return MouseButton::WheelUp;
        case 65: return MouseButton::WheelDown;
        default: return {};
    }
}


struct MouseBtnEvent {
    MouseButton button;
    Vec2i pos {};  // relative to the widget
};


} // namespace termtext::widgets

#endif // TERMTEXT_WIDGETS_EVENT_H
