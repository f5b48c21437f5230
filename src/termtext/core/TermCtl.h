// TermCtl.h created on 2018-07-09 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CORE_TERMCTL_H
#define TERMTEXT_CORE_TERMCTL_H

#include <string>
#include <string_view>
#include <functional>
#include <utility>
#include <cstdint>

namespace termtext::core {


/// Builds ANSI control sequences for a terminal output stream.
///
/// The builder methods append to an internal buffer, which is taken
/// with `seq()` or sent to the terminal by `write()`. When the stream
/// is not a TTY, the builders append nothing, so the output stays plain text.
class TermCtl {
public:
    enum class IsTty {
        Auto,    // detect with isatty()
        Always,
        Never,
    };

    static TermCtl& stdout_instance(IsTty is_tty = IsTty::Auto);
    static TermCtl& stderr_instance(IsTty is_tty = IsTty::Auto);

    explicit TermCtl(int fd, IsTty is_tty = IsTty::Auto);

    bool is_tty() const { return m_tty; }

    struct Size {
        uint16_t rows = 0;
        uint16_t cols = 0;
    };
    /// Window size of the terminal, {0, 0} if unknown
    Size size() const;

    enum class Color: uint8_t {
        Black, Red, Green, Yellow, Blue, Magenta, Cyan, White,
        Default = 9,
        BrightBlack = 10, BrightRed, BrightGreen, BrightYellow,
        BrightBlue, BrightMagenta, BrightCyan, BrightWhite,
    };

    enum class Mode: uint8_t {
        Normal,  // all attributes off
        Bold,
        Dim,
        Italic,
        Underline,
        Blink,
        Reverse,
        CrossOut,
    };

    TermCtl& fg(Color color);
    TermCtl& bg(Color color);
    TermCtl& mode(Mode mode);
    TermCtl& normal() { return mode(Mode::Normal); }

    TermCtl& move_to(unsigned row, unsigned column);  // 0-based
    TermCtl& hide_cursor();
    TermCtl& show_cursor();
    TermCtl& clear_screen();

    /// Take the sequences appended so far
    std::string seq() { return std::exchange(m_seq, {}); }

    /// Send the appended sequences
    bool write() { return write(seq()); }

    /// Send `data` to the terminal, or to the write callback if one is set
    /// \returns false if the terminal write failed (see errno)
    bool write(std::string_view data);

    using WriteCallback = std::function<void(std::string_view data)>;
    void set_write_callback(WriteCallback cb) { m_write_cb = std::move(cb); }

private:
    TermCtl& csi(std::string_view params);
    TermCtl& sgr(int code);

    std::string m_seq;
    WriteCallback m_write_cb;
    int m_fd;
    bool m_tty;
};


} // namespace termtext::core

#endif // TERMTEXT_CORE_TERMCTL_H
