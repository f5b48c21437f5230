// test_config.cpp created on 2023-11-08 as part of termtext project
//
// Copyright 2023 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include <catch2/catch.hpp>

#include <termtext/config/ConfigParser.h>
#include <termtext/widgets/TextViewOptions.h>
#include <termtext/core/string.h>
#include <termtext/core/log.h>

#include <fstream>
#include <string>
#include <vector>

using namespace termtext::config;
using namespace termtext::widgets;
using namespace termtext::core;


// Flattens parsed items to "group.name=value" lines
class ItemRecorder : public ConfigParser {
public:
    std::vector<std::string> items;
    bool ok = true;

    explicit ItemRecorder(const std::string& source) { ok = parse_string(source); }

    void name(const std::string& name) override { m_name = name; }
    void begin_group() override { m_path.push_back(m_name); }
    void end_group() override { m_path.pop_back(); }
    void bool_value(bool value) override { add(value ? "true" : "false"); }
    void int_value(int64_t value) override { add(std::to_string(value)); }
    void string_value(std::string value) override { add('\'' + escape_utf8(value) + '\''); }

private:
    void add(const std::string& value) {
        std::string key;
        for (const auto& group : m_path)
            key += group + '.';
        items.push_back(key + m_name + '=' + value);
    }

    std::vector<std::string> m_path;
    std::string m_name;
};

using Items = std::vector<std::string>;


TEST_CASE( "Config values", "[ConfigParser]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    CHECK(ItemRecorder("").items.empty());
    CHECK(ItemRecorder("enabled false").items == Items{"enabled=false"});
    CHECK(ItemRecorder("verbose").items == Items{"verbose=true"});
    CHECK(ItemRecorder("verbose  // no value\ncount 2").items == Items{"verbose=true", "count=2"});
    CHECK(ItemRecorder("count 4096").items == Items{"count=4096"});
    CHECK(ItemRecorder("offset -7").items == Items{"offset=-7"});
    CHECK(ItemRecorder("title \"x y \u21e7\"").items == Items{"title='x y \u21e7'"});
    CHECK(ItemRecorder("title \"\"").items == Items{"title=''"});
    CHECK(ItemRecorder("a 1; b true\nc \"z\"").items == Items{"a=1", "b=true", "c='z'"});
}


TEST_CASE( "Config groups", "[ConfigParser]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    ItemRecorder empty("outer {}");
    CHECK(empty.ok);
    CHECK(empty.items.empty());

    ItemRecorder nested(
            "outer {\n"
            "    a 1\n"
            "    inner { b \"two\"; c }\n"
            "    d false\n"
            "}\n"
            "e 5");
    CHECK(nested.ok);
    CHECK(nested.items == Items{"outer.a=1", "outer.inner.b='two'", "outer.inner.c=true",
                                "outer.d=false", "e=5"});
}


TEST_CASE( "Config syntax errors", "[ConfigParser]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    CHECK_FALSE(ItemRecorder("count 99999999999999999999").ok);
    CHECK_FALSE(ItemRecorder("title \"open").ok);
    CHECK_FALSE(ItemRecorder("title \"a\nb\"").ok);
    CHECK_FALSE(ItemRecorder("ratio 4.56").ok);
    CHECK_FALSE(ItemRecorder("outer { a 1").ok);
    CHECK_FALSE(ItemRecorder("2nd 2").ok);

    // items before the error were already reported
    ItemRecorder partial("a 1; b 1 2");
    CHECK_FALSE(partial.ok);
    CHECK(partial.items == Items{"a=1", "b=1"});
}


TEST_CASE( "TextView options", "[TextViewOptions]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    SECTION( "defaults" ) {
        auto o = parse_options("");
        REQUIRE(o);
        CHECK(o->wrap == WrapMode::None);
        CHECK_FALSE(o->roll_content);
        CHECK_FALSE(o->disable_scrolling);
        CHECK(o->page_size == 0);
        CHECK(o->keys.line_up == Key::Up);
        CHECK(o->keys.line_down == Key::Down);
        CHECK(o->keys.page_up == Key::PageUp);
        CHECK(o->keys.page_down == Key::PageDown);
        CHECK(o->mouse.line_up == MouseButton::WheelUp);
        CHECK(o->mouse.line_down == MouseButton::WheelDown);
    }

    SECTION( "all items" ) {
        auto o = parse_options(
                "wrap \"runes\"\n"
                "roll_content\n"
                "disable_scrolling false\n"
                "page_size 5\n"
                "keys { line_up \"F1\"; line_down \"F2\"; page_up \"Home\"; page_down \"End\" }\n"
                "mouse {\n"
                "    line_up \"Left\"\n"
                "    line_down \"Right\"\n"
                "}\n");
        REQUIRE(o);
        CHECK(o->wrap == WrapMode::AtRunes);
        CHECK(o->roll_content);
        CHECK_FALSE(o->disable_scrolling);
        CHECK(o->page_size == 5);
        CHECK(o->keys.line_up == Key::F1);
        CHECK(o->keys.line_down == Key::F2);
        CHECK(o->keys.page_up == Key::Home);
        CHECK(o->keys.page_down == Key::End);
        CHECK(o->mouse.line_up == MouseButton::Left);
        CHECK(o->mouse.line_down == MouseButton::Right);
    }

    SECTION( "invalid items are ignored" ) {
        auto o = parse_options(
                "wrap \"words\"\n"
                "page_size -1\n"
                "roll_content 1\n"
                "unknown_item 42\n"
                "keys { line_up \"Foo\"; line_down \"Character\"; other \"Up\" }\n"
                "mouse { line_up \"Wheel\" }\n"
                "other_group { x 1 }\n");
        REQUIRE(o);
        CHECK(o->wrap == WrapMode::None);
        CHECK(o->page_size == 0);
        CHECK_FALSE(o->roll_content);
        CHECK(o->keys.line_up == Key::Up);
        CHECK(o->keys.line_down == Key::Down);
        CHECK(o->mouse.line_up == MouseButton::WheelUp);
    }

    SECTION( "syntax error" ) {
        CHECK_FALSE(parse_options("wrap {"));
        CHECK_FALSE(parse_options("page_size 1 2"));
    }

    SECTION( "load from file" ) {
        const auto path = fs::temp_directory_path() / "termtext_test_options.conf";
        {
            std::ofstream f(path);
            f << "wrap \"runes\"  // wrap long lines\n"
                 "disable_scrolling\n";
        }
        auto o = load_options(path);
        fs::remove(path);
        REQUIRE(o);
        CHECK(o->wrap == WrapMode::AtRunes);
        CHECK(o->disable_scrolling);

        CHECK_FALSE(load_options(path));
    }
}
