// TermCtl.cpp created on 2018-07-09 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

// Sequences: https://invisible-island.net/xterm/ctlseqs/ctlseqs.html

#include "TermCtl.h"
#include <termtext/core/sys.h>

#include <fmt/format.h>

#include <sys/ioctl.h>
#include <unistd.h>

namespace termtext::core {


// SGR parameter for each Mode
static constexpr int c_mode_sgr[] = {0, 1, 2, 3, 4, 5, 7, 9};

// `base` is 30 for foreground, 40 for background
static int color_sgr(TermCtl::Color color, int base)
{
    using Color = TermCtl::Color;
    const int n = int(color);
    if (color >= Color::BrightBlack)
        return base + 60 + n - int(Color::BrightBlack);
    return base + n;  // includes Default = 39 / 49
}


TermCtl& TermCtl::stdout_instance(IsTty is_tty)
{
    static TermCtl instance(STDOUT_FILENO, is_tty);
    return instance;
}


TermCtl& TermCtl::stderr_instance(IsTty is_tty)
{
    static TermCtl instance(STDERR_FILENO, is_tty);
    return instance;
}


TermCtl::TermCtl(int fd, IsTty is_tty)
    : m_fd(fd),
      m_tty(is_tty == IsTty::Always || (is_tty == IsTty::Auto && ::isatty(fd) == 1))
{}


auto TermCtl::size() const -> Size
{
    struct winsize ws {};
    if (::ioctl(m_fd, TIOCGWINSZ, &ws) != 0)
        return {};
    return {ws.ws_row, ws.ws_col};
}


TermCtl& TermCtl::csi(std::string_view params)
{
    if (m_tty) {
        m_seq += "\x1b[";
        m_seq += params;
    }
    return *this;
}


TermCtl& TermCtl::sgr(int code)
{
    if (m_tty)
        m_seq += fmt::format("\x1b[{}m", code);
    return *this;
}


TermCtl& TermCtl::fg(Color color) { return sgr(color_sgr(color, 30)); }
TermCtl& TermCtl::bg(Color color) { return sgr(color_sgr(color, 40)); }
TermCtl& TermCtl::mode(Mode mode) { return sgr(c_mode_sgr[size_t(mode)]); }


TermCtl& TermCtl::move_to(unsigned row, unsigned column)
{
    if (!m_tty)
        return *this;
    return csi(fmt::format("{};{}H", row + 1, column + 1));
}


TermCtl& TermCtl::hide_cursor() { return csi("?25l"); }
TermCtl& TermCtl::show_cursor() { return csi("?25h"); }
TermCtl& TermCtl::clear_screen() { return csi("H").csi("2J"); }


bool TermCtl::write(std::string_view data)
{
    if (m_write_cb) {
        m_write_cb(data);
        return true;
    }
    return write_all(m_fd, data);
}


} // namespace termtext::core
