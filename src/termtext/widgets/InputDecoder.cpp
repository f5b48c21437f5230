// InputDecoder.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

// Sequences: https://invisible-island.net/xterm/ctlseqs/ctlseqs.html
// (PC-Style Function Keys, SGR Mouse Mode)

#include "InputDecoder.h"
#include <termtext/core/string.h>

#include <vector>
#include <cstdint>

namespace termtext::widgets {

using core::utf8_codepoint_and_length;


namespace {

constexpr char c_esc = '\x1b';

// Larger parameters are not used by any key or mouse report
constexpr int c_max_param = 9999;

// Longer sequences are garbage, don't wait for the final byte forever
constexpr size_t c_max_csi_length = 32;


// CSI [marker] [param] [; param]... final
struct Csi {
    size_t length = 0;  // including ESC [, 0 = incomplete
    bool valid = false;
    char marker = 0;    // private marker: < = > ?
    char final = 0;
    std::vector<int> params;  // -1 = omitted

    int param(size_t i) const { return i < params.size() ? params[i] : -1; }
};


// `body` is the input following ESC [
Csi parse_csi(std::string_view body)
{
    Csi csi;
    size_t i = 0;
    if (!body.empty() && body[0] >= '<' && body[0] <= '?')
        csi.marker = body[i++];

    int value = -1;
    bool too_large = false;
    for (; i < body.size() && i < c_max_csi_length; ++i) {
        const auto c = uint8_t(body[i]);
        if (c >= '0' && c <= '9') {
            value = (value < 0 ? 0 : value * 10) + (c - '0');
            if (value > c_max_param) {
                too_large = true;
                value = c_max_param;
            }
        } else if (c == ';') {
            csi.params.push_back(value);
            value = -1;
        } else if (c >= 0x40 && c <= 0x7e) {
            if (value >= 0 || !csi.params.empty())
                csi.params.push_back(value);
            csi.final = char(c);
            csi.length = 2 + i + 1;
            csi.valid = !too_large;
            return csi;
        } else {
            // unexpected byte ends the sequence, it's not consumed
            csi.length = 2 + i;
            return csi;
        }
    }
    if (i == c_max_csi_length)
        csi.length = 2 + i;
    return csi;
}


// Final byte of CSI 1;<mod> X or SS3 X
Key letter_key(char c)
{
    switch (c) {
        case 'A': return Key::Up;
        case 'B': return Key::Down;
        case 'C': return Key::Right;
        case 'D': return Key::Left;
        case 'H': return Key::Home;
        case 'F': return Key::End;
        case 'P': return Key::F1;
        case 'Q': return Key::F2;
        case 'R': return Key::F3;
        case 'S': return Key::F4;
        default: return Key::Unknown;
    }
}


// Number in CSI <n> ~
Key tilde_key(int n)
{
    switch (n) {
        case 1: case 7: return Key::Home;
        case 2: return Key::Insert;
        case 3: return Key::Delete;
        case 4: case 8: return Key::End;
        case 5: return Key::PageUp;
        case 6: return Key::PageDown;
        case 15: return Key::F5;
        case 17: return Key::F6;
        case 18: return Key::F7;
        case 19: return Key::F8;
        case 20: return Key::F9;
        case 21: return Key::F10;
        case 23: return Key::F11;
        case 24: return Key::F12;
        default: return Key::Unknown;
    }
}


// xterm encodes modifiers as 1 + bits (Shift = 1, Alt = 2, Ctrl = 4)
ModKey modifiers(int param)
{
    ModKey mod;
    if (param < 2)
        return mod;
    const int bits = param - 1;
    mod.shift = (bits & 1) != 0;
    mod.alt = (bits & 2) != 0;
    mod.ctrl = (bits & 4) != 0;
    return mod;
}


DecodedInput decode_csi(std::string_view bytes)
{
    const Csi csi = parse_csi(bytes.substr(2));
    DecodedInput res {csi.length};
    if (csi.length == 0 || !csi.valid)
        return res;

    if (csi.marker == '<') {
        // SGR mouse: CSI < button ; column ; row M (m = release)
        if (csi.final != 'M' || csi.params.size() != 3)
            return res;
        const int column = csi.params[1];
        const int row = csi.params[2];
        if (csi.params[0] < 0 || column < 1 || row < 1)
            return res;
        const int code = csi.params[0] & ~0x1c;  // strip Shift, Alt, Ctrl
        if (const auto button = mouse_button_from_code(code))
            res.mouse = MouseBtnEvent{*button, {column - 1, row - 1}};
        return res;
    }
    if (csi.marker != 0)
        return res;

    const Key key = csi.final == '~' ? tilde_key(csi.param(0)) : letter_key(csi.final);
    if (key != Key::Unknown)
        res.key = KeyEvent{key, modifiers(csi.param(1))};
    return res;
}


DecodedInput decode_ss3(std::string_view bytes)
{
    if (bytes.size() < 3)
        return {};
    const Key key = letter_key(bytes[2]);
    if (key == Key::Unknown)
        return {3};
    return {3, KeyEvent{key}};
}


// Single byte keys, control chars and UTF-8
DecodedInput decode_plain(std::string_view bytes, ModKey mod)
{
    const auto b = uint8_t(bytes[0]);
    switch (b) {
        case '\r':
        case '\n':
            return {1, KeyEvent{Key::Enter, mod}};
        case '\t':
            return {1, KeyEvent{Key::Tab, mod}};
        case '\b':
        case 0x7f:
            return {1, KeyEvent{Key::Backspace, mod}};
        default:
            break;
    }
    if (b < 0x20) {
        // Ctrl+A = 0x01 ... Ctrl+Z = 0x1a
        mod.ctrl = true;
        const char32_t c = (b >= 1 && b <= 26) ? U'a' + (b - 1) : U'@' + b;
        return {1, KeyEvent{Key::Character, mod, c}};
    }

    const auto [len, c] = utf8_codepoint_and_length(bytes);
    if (len == 0)
        return {};
    if (len < 0)
        return {1};  // skip a byte of broken UTF-8
    return {size_t(len), KeyEvent{Key::Character, mod, c}};
}

} // namespace


DecodedInput decode_input(std::string_view bytes)
{
    if (bytes.empty())
        return {};
    if (bytes[0] != c_esc)
        return decode_plain(bytes, {});
    if (bytes.size() == 1)
        return {1, KeyEvent{Key::Escape}};

    switch (bytes[1]) {
        case '[':
            return decode_csi(bytes);
        case 'O':
            return decode_ss3(bytes);
        case c_esc:
            return {2, KeyEvent{Key::Escape, ModKey{.alt = true}}};
        default:
            break;
    }

    // ESC + key = Alt + key
    auto res = decode_plain(bytes.substr(1), ModKey{.alt = true});
    if (res.length != 0)
        res.length += 1;
    return res;
}


} // namespace termtext::widgets
