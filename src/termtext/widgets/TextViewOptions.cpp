// TextViewOptions.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "TextViewOptions.h"
#include <termtext/config/ConfigParser.h>
#include <termtext/core/log.h>

#include <fmt/std.h>

#include <vector>

namespace termtext::widgets {

using namespace termtext::core;


namespace {

class OptionsReader : public config::ConfigParser {
public:
    explicit OptionsReader(TextViewOptions& options) : m_options(options) {}

protected:
    void name(const std::string& name) override { m_name = name; }

    void begin_group() override {
        m_groups.push_back(m_name);
        if (m_groups.size() > 1 || (m_name != "keys" && m_name != "mouse"))
            log::warning("Config: unknown group: {}", m_name);
    }

    void end_group() override { m_groups.pop_back(); }

    void bool_value(bool value) override {
        if (!m_groups.empty())
            return unexpected("bool");
        if (m_name == "roll_content")
            m_options.roll_content = value;
        else if (m_name == "disable_scrolling")
            m_options.disable_scrolling = value;
        else
            unexpected("bool");
    }

    void int_value(int64_t value) override {
        if (!m_groups.empty() || m_name != "page_size")
            return unexpected("int");
        if (value < 0) {
            log::warning("Config: page_size must not be negative: {}", value);
            return;
        }
        m_options.page_size = size_t(value);
    }

    void string_value(std::string value) override {
        if (m_groups.empty()) {
            if (m_name != "wrap")
                return unexpected("string");
            if (value == "none")
                m_options.wrap = WrapMode::None;
            else if (value == "runes")
                m_options.wrap = WrapMode::AtRunes;
            else
                log::warning("Config: unknown wrap mode: \"{}\"", value);
            return;
        }
        if (m_groups.size() != 1)
            return;
        if (m_groups.back() == "keys")
            key_binding(value);
        else if (m_groups.back() == "mouse")
            mouse_binding(value);
    }

private:
    void key_binding(const std::string& value) {
        Key* target = nullptr;
        if (m_name == "line_up") target = &m_options.keys.line_up;
        else if (m_name == "line_down") target = &m_options.keys.line_down;
        else if (m_name == "page_up") target = &m_options.keys.page_up;
        else if (m_name == "page_down") target = &m_options.keys.page_down;
        else return unexpected("string");

        const auto key = parse_key(value);
        if (key == Key::Unknown || key == Key::Character) {
            log::warning("Config: unknown key name: \"{}\"", value);
            return;
        }
        *target = key;
    }

    void mouse_binding(const std::string& value) {
        MouseButton* target = nullptr;
        if (m_name == "line_up") target = &m_options.mouse.line_up;
        else if (m_name == "line_down") target = &m_options.mouse.line_down;
        else return unexpected("string");

        const auto button = parse_mouse_button(value);
        if (!button) {
            log::warning("Config: unknown mouse button: \"{}\"", value);
            return;
        }
        *target = *button;
    }

    void unexpected(const char* type) {
        if (m_groups.empty())
            log::warning("Config: unknown item or wrong type ({}): {}", type, m_name);
        else
            log::warning("Config: unknown item or wrong type ({}): {}.{}", type, m_groups.back(), m_name);
    }

    TextViewOptions& m_options;
    std::string m_name;
    std::vector<std::string> m_groups;
};

} // namespace


std::optional<TextViewOptions> parse_options(const std::string& str)
{
    TextViewOptions options;
    OptionsReader reader(options);
    if (!reader.parse_string(str))
        return {};
    return options;
}


std::optional<TextViewOptions> load_options(const fs::path& path)
{
    TextViewOptions options;
    OptionsReader reader(options);
    if (!reader.parse_file(path))
        return {};
    log::debug("Loaded TextView options from {}", path);
    return options;
}


} // namespace termtext::widgets
