// log_termctl.cpp created on 2021-03-27 as part of termtext project
//
// Copyright 2021 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "log.h"
#include <termtext/core/TermCtl.h>
#include <termtext/core/string.h>
#include <termtext/core/sys.h>

#include <fmt/chrono.h>

#include <string>
#include <ctime>

namespace termtext::core {

using Color = TermCtl::Color;
using Mode = TermCtl::Mode;


namespace {

struct LevelLook {
    const char* label;
    Color color;
    bool bold;
};

// indexed by Logger::Level
constexpr LevelLook c_level_look[] = {
    {"TRACE", Color::Blue, false},
    {"DEBUG", Color::White, false},
    {"INFO ", Color::White, true},
    {"WARN ", Color::Yellow, true},
    {"ERROR", Color::Red, true},
};

} // namespace


Logger::Logger(Level level) : m_level(level)
{
    if (m_level > Level::Info)
        return;
    TermCtl& t = TermCtl::stderr_instance();
    std::string header = t.mode(Mode::Underline).seq();
    header += "   Date      Time    TID    Level  Message   ";
    header += t.normal().seq();
    header += '\n';
    (void) t.write(header);  // stderr is the last resort, nowhere to report
}


void Logger::default_handler(Level level, std::string_view message)
{
    if (level >= Level::None)
        return;
    const LevelLook& look = c_level_look[size_t(level)];

    TermCtl& t = TermCtl::stderr_instance();
    const std::string cyan = t.fg(Color::Cyan).seq();
    const std::string bold = t.mode(Mode::Bold).seq();
    const std::string reset = t.normal().seq();
    std::string text_style = look.bold ? bold : std::string{};
    text_style += t.fg(look.color).seq();

    const std::tm now = local_time(std::time(nullptr));
    const uint64_t tid = thread_id() & 0xFFFFFF;  // 6 hex digits

    std::string out;
    bool first = true;
    for (const auto line : split(message, '\n')) {
        if (first)
            out += fmt::format("{:%F %T} {}{:6x}{}  {}{}{}  ", now, cyan, tid, reset, bold, look.label, reset);
        else
            out += fmt::format("{:28}{}...{}    ", "", bold, reset);
        out += text_style;
        out += line;
        out += reset;
        out += '\n';
        first = false;
    }
    (void) t.write(out);
}


} // namespace termtext::core
