// log.h created on 2018-03-01 as part of termtext project
//
// Copyright 2018 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CORE_LOG_H
#define TERMTEXT_CORE_LOG_H

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace termtext::core {


/// Process-wide logger. Messages are formatted by the `log::` functions
/// below and passed to a handler, which prints them to stderr by default.
class Logger
{
public:
    enum class Level {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        None,  // nothing is logged
    };

    using Handler = void (*)(Level level, std::string_view message);

    /// The shared instance, created on first use with `initial_level`.
    /// Call this early in main() to choose the level and to make sure
    /// the logger outlives static objects which log from destructors.
    static Logger& default_instance(Level initial_level = Level::Trace);
    static void init(Level level) { default_instance(level); }

    explicit Logger(Level level);

    Level level() const { return m_level; }
    void set_level(Level level) { m_level = level; }
    bool enabled(Level level) const { return level >= m_level && level != Level::None; }

    /// Prints a colored line with time, thread id and level for each line of `message`.
    static void default_handler(Level level, std::string_view message);
    void set_handler(Handler handler) { m_handler = handler; }
    void reset_handler() { m_handler = default_handler; }

    void log(Level level, std::string_view message);

private:
    Level m_level;
    Handler m_handler = default_handler;
};


namespace log {

template <typename... T>
void message(Logger::Level level, fmt::format_string<T...> fmt, T&&... args) {
    Logger& logger = Logger::default_instance();
    if (!logger.enabled(level))
        return;  // don't format what would be dropped
    logger.log(level, fmt::format(fmt, std::forward<T>(args)...));
}

template <typename... T>
void trace(fmt::format_string<T...> fmt, T&&... args) {
    message(Logger::Level::Trace, fmt, std::forward<T>(args)...);
}

template <typename... T>
void debug(fmt::format_string<T...> fmt, T&&... args) {
    message(Logger::Level::Debug, fmt, std::forward<T>(args)...);
}

template <typename... T>
void info(fmt::format_string<T...> fmt, T&&... args) {
    message(Logger::Level::Info, fmt, std::forward<T>(args)...);
}

template <typename... T>
void warning(fmt::format_string<T...> fmt, T&&... args) {
    message(Logger::Level::Warning, fmt, std::forward<T>(args)...);
}

template <typename... T>
void error(fmt::format_string<T...> fmt, T&&... args) {
    message(Logger::Level::Error, fmt, std::forward<T>(args)...);
}

} // namespace log


} // namespace termtext::core

#endif // TERMTEXT_CORE_LOG_H
