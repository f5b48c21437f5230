// test_text.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include <catch2/catch.hpp>

#include <termtext/text/StyleRanges.h>
#include <termtext/text/LineIndex.h>
#include <termtext/core/string.h>

#include <stdexcept>

using namespace termtext::text;
using namespace termtext::core;
using Color = termtext::canvas::CellStyle::Color;


static CellStyle fg_style(Color c)
{
    CellStyle s;
    s.fg = c;
    return s;
}


TEST_CASE( "lookup in recorded ranges", "[StyleRanges]" )
{
    StyleRanges sr;
    CHECK(sr.empty());
    CHECK(sr.find(0) == nullptr);
    CHECK(sr.lookup(10) == CellStyle{});

    sr.record(0, 3, fg_style(Color::Red));
    sr.record(3, 5, fg_style(Color::Green));
    sr.record(5, 6, CellStyle{});
    CHECK(sr.size() == 3);

    CHECK(sr.lookup(0).fg == Color::Red);
    CHECK(sr.lookup(2).fg == Color::Red);
    CHECK(sr.lookup(3).fg == Color::Green);
    CHECK(sr.lookup(4).fg == Color::Green);
    CHECK(sr.lookup(5) == CellStyle{});

    // past the end, the last range still applies
    REQUIRE(sr.find(100) != nullptr);
    CHECK(sr.find(100)->start == 5);
    CHECK_FALSE(sr.find(100)->contains(100));

    sr.clear();
    CHECK(sr.empty());
    CHECK(sr.find(0) == nullptr);
}


TEST_CASE( "recording order", "[StyleRanges]" )
{
    StyleRanges sr;
    sr.record(2, 4, fg_style(Color::Red));
    CHECK(sr.lookup(0) == CellStyle{});  // before first range
    CHECK(sr.lookup(2).fg == Color::Red);

    // same start - replaces previous
    sr.record(2, 6, fg_style(Color::Blue));
    CHECK(sr.size() == 1);
    CHECK(sr.lookup(5).fg == Color::Blue);

    CHECK_THROWS_AS(sr.record(1, 3, CellStyle{}), std::invalid_argument);
    CHECK_THROWS_AS(sr.record(7, 7, CellStyle{}), std::invalid_argument);
    CHECK(sr.size() == 1);
}


TEST_CASE( "newlines", "[LineIndex]" )
{
    CHECK(find_lines("", 5, WrapMode::None).empty());
    CHECK(find_lines("abc", 5, WrapMode::None) == LineIndex{0});
    CHECK(find_lines("ab\ncd", 5, WrapMode::AtRunes) == LineIndex{0, 3});
    CHECK(find_lines("ab\n", 5, WrapMode::None) == LineIndex{0, 3});
    CHECK(find_lines("\n\n", 5, WrapMode::None) == LineIndex{0, 1, 2});
    CHECK(find_lines("河\n北", 1, WrapMode::None) == LineIndex{0, 4});
}


TEST_CASE( "wrapping", "[LineIndex]" )
{
    CHECK(find_lines("abcdef", 3, WrapMode::AtRunes) == LineIndex{0, 3});
    CHECK(find_lines("abcdefg", 3, WrapMode::AtRunes) == LineIndex{0, 3, 6});
    CHECK(find_lines("abcdef", 3, WrapMode::None) == LineIndex{0});
    CHECK(find_lines("abc\ndef", 3, WrapMode::AtRunes) == LineIndex{0, 4});
    CHECK(find_lines("abcd\nef", 3, WrapMode::AtRunes) == LineIndex{0, 3, 5});
    CHECK(find_lines("a", 1, WrapMode::AtRunes) == LineIndex{0});

    // full-width runes (3 bytes, 2 cells each)
    CHECK(find_lines("a河", 2, WrapMode::AtRunes) == LineIndex{0, 1});
    CHECK(find_lines("河北", 4, WrapMode::AtRunes) == LineIndex{0});
    CHECK(find_lines("河北", 3, WrapMode::AtRunes) == LineIndex{0, 3});
    // wider than canvas - gets its own line
    CHECK(find_lines("河b", 1, WrapMode::AtRunes) == LineIndex{0, 3});
    CHECK(find_lines("a河b", 1, WrapMode::AtRunes) == LineIndex{0, 1, 4});
}


TEST_CASE( "wrapped lines fit the width", "[LineIndex]" )
{
    const std::string text = "The quick brown 狐狸 jumps over\nthe lazy 狗. 河北梆子 abc";
    for (int width = 1; width <= 12; ++width) {
        INFO("width " << width);
        const auto lines = find_lines(text, width, WrapMode::AtRunes);
        CHECK(lines == find_lines(text, width, WrapMode::AtRunes));  // deterministic
        for (size_t i = 0; i != lines.size(); ++i) {
            const size_t end = i + 1 < lines.size() ? lines[i + 1] : text.size();
            int cells = 0;
            int runes = 0;
            for (size_t pos = lines[i]; pos < end; ) {
                const auto [len, c] = utf8_codepoint_and_length(std::string_view(text).substr(pos));
                REQUIRE(len > 0);
                pos += size_t(len);
                if (c == '\n')
                    break;
                cells += rune_width(c);
                ++runes;
            }
            // a single rune may be wider than the canvas
            if (runes > 1)
                CHECK(cells <= width);
        }
    }
}


static int double_width(char32_t) { return 2; }

TEST_CASE( "custom rune width", "[LineIndex]" )
{
    CHECK(find_lines("abcd", 4, WrapMode::AtRunes, double_width) == LineIndex{0, 2});
    CHECK(find_lines("abcd", 4, WrapMode::AtRunes) == LineIndex{0});
}


TEST_CASE( "invalid input", "[LineIndex]" )
{
    CHECK_THROWS_AS(find_lines("abc", 0, WrapMode::AtRunes), std::invalid_argument);
    CHECK_THROWS_AS(find_lines("abc", -1, WrapMode::None), std::invalid_argument);
    CHECK_THROWS_AS(find_lines("a\xff", 5, WrapMode::None), std::invalid_argument);
}


TEST_CASE( "wrap_needed", "[LineIndex]" )
{
    CHECK_FALSE(wrap_needed(WrapMode::None, 5, 1, 3));
    CHECK_FALSE(wrap_needed(WrapMode::AtRunes, 0, 2, 1));
    CHECK_FALSE(wrap_needed(WrapMode::AtRunes, 2, 1, 3));
    CHECK(wrap_needed(WrapMode::AtRunes, 3, 1, 3));
    CHECK(wrap_needed(WrapMode::AtRunes, 2, 2, 3));
}
