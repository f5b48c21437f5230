// demo_text_view.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

// A minimal pager: shows a file (or built-in text) in a TextView
// that fills the terminal. Options are read from the file named
// by TERMTEXT_CONFIG, if set.

#include <termtext/widgets/TextView.h>
#include <termtext/widgets/InputDecoder.h>
#include <termtext/canvas/CellCanvas.h>
#include <termtext/core/TermCtl.h>
#include <termtext/core/error.h>
#include <termtext/core/log.h>
#include <termtext/core/sys.h>

#include <magic_enum/magic_enum.hpp>

#include <termios.h>
#include <poll.h>
#include <unistd.h>

#include <fstream>
#include <string>
#include <chrono>
#include <cerrno>
#include <cstdlib>

using namespace termtext::widgets;
using namespace termtext::canvas;
using namespace termtext::core;
using namespace std::chrono_literals;


static const char* c_sample_text =
        "termtext TextView demo\n"
        "\n"
        "Scroll with Up / Down / PageUp / PageDown or the mouse wheel.\n"
        "Press q or Escape to quit.\n"
        "\n"
        "Long lines are trimmed by default, set `wrap \"runes\"` in the config file "
        "named by TERMTEXT_CONFIG to wrap them instead.\n"
        "Full-width runes take two cells: 河北梆子\n";


// Full-screen terminal state for the lifetime of the object:
// raw input, alternate screen, hidden cursor, optional mouse reporting.
class TerminalSession {
public:
    TerminalSession(TermCtl& out, bool mouse) : m_out(out), m_mouse(mouse)
    {
        if (::tcgetattr(STDIN_FILENO, &m_saved) != 0)
            throw Error(fmt::format("cannot get terminal attributes: {}", error_str()));
        struct termios raw = m_saved;
        ::cfmakeraw(&raw);
        if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0)
            throw Error(fmt::format("cannot switch terminal to raw mode: {}", error_str()));

        std::string setup = "\x1b[?1049h";  // alternate screen
        if (m_mouse)
            setup += "\x1b[?1000h\x1b[?1006h";  // button reports, SGR encoding
        setup += m_out.hide_cursor().clear_screen().seq();
        if (!m_out.write(setup))
            log::warning("terminal setup failed: {}", error_str());
    }

    ~TerminalSession()
    {
        std::string restore = m_out.normal().show_cursor().seq();
        if (m_mouse)
            restore += "\x1b[?1006l\x1b[?1000l";
        restore += "\x1b[?1049l";
        if (!m_out.write(restore))
            log::warning("terminal restore failed: {}", error_str());
        if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &m_saved) != 0)
            log::error("cannot restore terminal attributes: {}", error_str());
    }

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    /// Whatever is available on stdin, empty after `timeout` without input
    std::string read(std::chrono::milliseconds timeout)
    {
        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, int(timeout.count()));
        if (ready == 0 || (ready < 0 && errno == EINTR))
            return {};  // timeout or signal (SIGWINCH), the caller redraws
        if (ready < 0)
            throw Error(fmt::format("poll stdin: {}", error_str()));

        char buf[256];
        const ssize_t n = ::read(STDIN_FILENO, buf, sizeof buf);
        if (n < 0 && (errno == EINTR || errno == EAGAIN))
            return {};
        if (n < 0)
            throw Error(fmt::format("read stdin: {}", error_str()));
        if (n == 0)
            throw Error("stdin closed");
        return {buf, size_t(n)};
    }

private:
    TermCtl& m_out;
    struct termios m_saved {};
    bool m_mouse;
};


// Expand tabs and drop CR, the rest is validated by TextView
static std::string sanitize_line(const std::string& line)
{
    std::string res;
    for (const char c : line) {
        if (c == '\t')
            res.append(4, ' ');
        else if (c != '\r')
            res.push_back(c);
    }
    return res;
}


static bool write_file(TextView& view, const char* filename)
{
    std::ifstream f(filename);
    if (!f) {
        log::error("Cannot open {}: {}", filename, error_str());
        return false;
    }
    WriteOptions odd;
    WriteOptions even;
    even.style.fg = CellStyle::Color::Cyan;
    std::string line;
    unsigned n = 0;
    while (std::getline(f, line)) {
        ++n;
        try {
            view.write(sanitize_line(line) + '\n', n % 2 ? odd : even);
        } catch (const ValidationError& e) {
            log::warning("{}:{}: {}", filename, n, e.what());
            WriteOptions err;
            err.style.fg = CellStyle::Color::Red;
            view.write(fmt::format("<line {} skipped>\n", n), err);
        }
    }
    return true;
}


static Vec2i terminal_size(const TermCtl& t)
{
    const auto size = t.size();
    if (size.cols == 0 || size.rows == 0)
        return {80, 24};
    return {size.cols, size.rows};
}


// Feed complete events from `buf` to the view.
// Returns false when the user asks to quit.
static bool handle_input(TextView& view, std::string& buf)
{
    while (!buf.empty()) {
        const auto in = decode_input(buf);
        if (in.length == 0)
            break;  // wait for the rest
        buf.erase(0, in.length);

        if (in.mouse)
            view.mouse_button_event(*in.mouse);
        if (!in.key)
            continue;

        const KeyEvent& ev = *in.key;
        log::debug("key: {}{}{}{}", ev.mod.ctrl ? "Ctrl+" : "", ev.mod.alt ? "Alt+" : "",
                   ev.mod.shift ? "Shift+" : "", magic_enum::enum_name(ev.key));
        if (ev.key == Key::Escape || (ev.key == Key::Character && ev.unicode == U'q'))
            return false;
        view.key_event(ev);
    }
    return true;
}


int main(int argc, const char* argv[])
{
    Logger::init(Logger::Level::Warning);

    TermCtl& t = TermCtl::stdout_instance();
    if (!t.is_tty() || ::isatty(STDIN_FILENO) != 1) {
        log::error("demo_text_view: stdin and stdout must be a terminal");
        return 1;
    }

    TextViewOptions options;
    if (const char* config = std::getenv("TERMTEXT_CONFIG")) {
        auto loaded = load_options(config);
        if (!loaded)
            return 1;
        options = *loaded;
    }

    TextView view(options);
    if (argc > 1) {
        if (!write_file(view, argv[1]))
            return 1;
    } else {
        view.write(c_sample_text);
    }

    try {
        TerminalSession session(t, view.capabilities().want_mouse);
        CellCanvas canvas(terminal_size(t));
        std::string input;
        for (;;) {
            const Vec2i size = terminal_size(t);
            if (size != canvas.size())
                canvas.resize(size);
            else
                canvas.clear();
            view.draw(canvas);
            if (!canvas.render(t))
                throw Error(fmt::format("cannot write to terminal: {}", error_str()));

            // the timeout picks up terminal resize
            input += session.read(200ms);
            if (!handle_input(view, input))
                break;
        }
    } catch (const Error& e) {
        log::error("demo_text_view: {}", e.what());
        return 1;
    }
    return 0;
}
