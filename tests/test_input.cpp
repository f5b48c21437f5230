// test_input.cpp created on 2026-10-19 as part of termtext project
//
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include <catch2/catch.hpp>

#include <termtext/widgets/InputDecoder.h>

#include <string>

using namespace termtext::widgets;


static Key key_of(std::string_view bytes)
{
    const auto in = decode_input(bytes);
    return in.key ? in.key->key : Key::Unknown;
}


TEST_CASE( "special keys", "[InputDecoder]" )
{
    CHECK(key_of("\x1b[A") == Key::Up);
    CHECK(key_of("\x1b[B") == Key::Down);
    CHECK(key_of("\x1bOB") == Key::Down);
    CHECK(key_of("\x1b[5~") == Key::PageUp);
    CHECK(key_of("\x1b[6~") == Key::PageDown);
    CHECK(key_of("\x1b[H") == Key::Home);
    CHECK(key_of("\x1b[4~") == Key::End);
    CHECK(key_of("\x1bOP") == Key::F1);
    CHECK(key_of("\x1b[24~") == Key::F12);
    CHECK(key_of("\r") == Key::Enter);
    CHECK(key_of("\t") == Key::Tab);
    CHECK(key_of("\x7f") == Key::Backspace);
    CHECK(key_of("\x1b") == Key::Escape);

    CHECK(decode_input("\x1b[A").length == 3);
    CHECK(decode_input("\x1b[5~rest").length == 4);

    // Ctrl + Up
    auto in = decode_input("\x1b[1;5A");
    REQUIRE(in.key);
    CHECK(in.key->key == Key::Up);
    CHECK(in.key->mod == ModKey{.ctrl = true});
    CHECK(in.length == 6);

    // unknown sequence is consumed
    in = decode_input("\x1b[99~");
    CHECK(in.length == 5);
    CHECK_FALSE(in.key);
    CHECK_FALSE(in.mouse);
}


TEST_CASE( "characters", "[InputDecoder]" )
{
    auto in = decode_input("q");
    REQUIRE(in.key);
    CHECK(in.key->key == Key::Character);
    CHECK(in.key->unicode == U'q');
    CHECK(in.key->mod == ModKey{});

    in = decode_input("\xe6\xb2\xb3" "x");
    REQUIRE(in.key);
    CHECK(in.key->unicode == U'河');
    CHECK(in.length == 3);

    in = decode_input("\x03");
    REQUIRE(in.key);
    CHECK(in.key->unicode == U'c');
    CHECK(in.key->mod == ModKey{.ctrl = true});

    in = decode_input("\x1bx");
    REQUIRE(in.key);
    CHECK(in.key->unicode == U'x');
    CHECK(in.key->mod == ModKey{.alt = true});
    CHECK(in.length == 2);

    in = decode_input("\x1b\x7f");
    REQUIRE(in.key);
    CHECK(in.key->key == Key::Backspace);
    CHECK(in.key->mod == ModKey{.alt = true});

    // broken UTF-8 byte is skipped
    in = decode_input("\xff" "a");
    CHECK(in.length == 1);
    CHECK_FALSE(in.key);
}


TEST_CASE( "incomplete input", "[InputDecoder]" )
{
    CHECK(decode_input("").length == 0);
    CHECK(decode_input("\xe6\xb2").length == 0);
    CHECK(decode_input("\x1b[").length == 0);
    CHECK(decode_input("\x1b[1;5").length == 0);
    CHECK(decode_input("\x1bO").length == 0);
    CHECK(decode_input("\x1b[<64;10").length == 0);
}


TEST_CASE( "mouse reports", "[InputDecoder]" )
{
    auto in = decode_input("\x1b[<64;10;5M");
    CHECK(in.length == 11);
    REQUIRE(in.mouse);
    CHECK(in.mouse->button == MouseButton::WheelUp);
    CHECK(in.mouse->pos == Vec2i{9, 4});
    CHECK_FALSE(in.key);

    // Ctrl + wheel down
    in = decode_input("\x1b[<81;1;1M");
    REQUIRE(in.mouse);
    CHECK(in.mouse->button == MouseButton::WheelDown);

    // release is consumed, but gives no event
    in = decode_input("\x1b[<0;1;1mrest");
    CHECK(in.length == 9);
    CHECK_FALSE(in.mouse);

    // motion with button 0 held (32) is not tracked
    in = decode_input("\x1b[<32;3;3M");
    CHECK(in.length == 10);
    CHECK_FALSE(in.mouse);
}


TEST_CASE( "malformed sequences", "[InputDecoder]" )
{
    // parameters out of range are rejected, not wrapped around
    auto in = decode_input("\x1b[<99999999999;1;1M");
    CHECK(in.length == 19);
    CHECK_FALSE(in.mouse);
    CHECK_FALSE(in.key);

    in = decode_input("\x1b[1;99999999999A");
    CHECK(in.length == 16);
    CHECK_FALSE(in.key);

    // the largest accepted parameter
    in = decode_input("\x1b[<64;9999;9999M");
    REQUIRE(in.mouse);
    CHECK(in.mouse->pos == Vec2i{9998, 9998});

    // non-ASCII byte inside the sequence ends it
    in = decode_input("\x1b[1\xc3\xa9");
    CHECK(in.length == 3);
    CHECK_FALSE(in.key);
    in = decode_input("\xc3\xa9");
    REQUIRE(in.key);
    CHECK(in.key->unicode == U'é');

    // endless parameters don't make the caller wait forever
    const std::string garbage = "\x1b[" + std::string(40, '1');
    in = decode_input(garbage);
    CHECK(in.length == 34);
    CHECK_FALSE(in.key);
}
