// ConfigParser.h created on 2023-11-08 as part of termtext project
//
// Copyright 2023 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef TERMTEXT_CONFIG_CONFIGPARSER_H
#define TERMTEXT_CONFIG_CONFIGPARSER_H

#include <string>
#include <filesystem>
#include <cstdint>

namespace termtext::config {

namespace fs = std::filesystem;


/// Event-driven reader of small config files:
/// ```
/// name "text"          // string, no escapes, must stay on one line
/// count -12            // integer
/// enabled false        // true | false
/// flag                 // no value = true
/// group { a 1; b 2 }   // items are separated by newline or ';'
/// ```
/// The value has to follow the name on the same line.
class ConfigParser {
public:
    virtual ~ConfigParser() = default;

    /// Run the callbacks below for each item.
    /// Syntax errors and unreadable files are logged.
    /// \returns false on error (some callbacks may already have been called)
    bool parse_file(const fs::path& path);
    bool parse_string(const std::string& str);

    // callbacks
    virtual void name(const std::string& name) = 0;
    virtual void begin_group() = 0;
    virtual void end_group() = 0;
    virtual void bool_value(bool value) = 0;
    virtual void int_value(int64_t value) = 0;
    virtual void string_value(std::string value) = 0;
};


} // namespace termtext::config

#endif // TERMTEXT_CONFIG_CONFIGPARSER_H
