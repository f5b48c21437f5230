// InputDecoder.h created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_WIDGETS_INPUTDECODER_H
#define TERMTEXT_WIDGETS_INPUTDECODER_H

#include "Event.h"

#include <optional>
#include <string_view>
#include <cstddef>

namespace termtext::widgets {


struct DecodedInput {
    size_t length = 0;  // bytes consumed, 0 = incomplete (read more)
    std::optional<KeyEvent> key;
    std::optional<MouseBtnEvent> mouse;
};

/// Decode one key press or mouse button press from the start of `bytes`,
/// as read from a terminal in raw mode with SGR mouse reports enabled.
///
/// ESC followed by a key means Alt + key. A lone ESC is the Escape key,
/// so the caller should pass partial input only after a read timeout.
/// Mouse releases, unknown and malformed sequences are consumed
/// without producing an event.
DecodedInput decode_input(std::string_view bytes);


} // namespace termtext::widgets

#endif // TERMTEXT_WIDGETS_INPUTDECODER_H
