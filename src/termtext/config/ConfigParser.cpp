// ConfigParser.cpp created on 2023-11-08 as part of termtext project
//
// Copyright 2023 Radek Brich
// Copyright 2026 The termtext Authors
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "ConfigParser.h"
#include <termtext/core/log.h>

#include <tao/pegtl.hpp>
#include <fmt/std.h>

#include <charconv>
#include <system_error>

namespace termtext::config {

using namespace termtext::core;


namespace grammar {
using namespace tao::pegtl;

struct Comment: seq< two<'/'>, until<eolf> > {};
struct Gap: star< sor<space, Comment> > {};
struct ItemEnd: seq< star<blank>, sor< one<';'>, eolf, Comment, at<one<'}'>> > > {};

struct BoolLit: sor< TAO_PEGTL_KEYWORD("true"), TAO_PEGTL_KEYWORD("false") > {};
struct IntLit: seq< opt<one<'-'>>, plus<digit> > {};
struct StrChars: star< not_one<'"', '\n', '\r'> > {};
struct StrLit: if_must< one<'"'>, StrChars, one<'"'> > {};

struct Items;
struct Open: one<'{'> {};
struct Close: one<'}'> {};
struct Block: if_must< Open, Items, Gap, Close > {};

struct Name: identifier {};
struct Value: sor< BoolLit, IntLit, StrLit, Block > {};
struct Flag: at<ItemEnd> {};
struct Item: seq< Gap, Name, sor< seq<plus<blank>, Value>, Flag >, ItemEnd > {};
struct Items: star<Item> {};
struct Document: seq< Items, Gap, eof > {};


template<typename Rule>
struct Action: nothing<Rule> {};

template<>
struct Action<Name> {
    template<typename Input>
    static void apply(const Input& in, ConfigParser& out) { out.name(in.string()); }
};

template<>
struct Action<BoolLit> {
    template<typename Input>
    static void apply(const Input& in, ConfigParser& out) { out.bool_value(in.string_view() == "true"); }
};

template<>
struct Action<Flag> {
    static void apply0(ConfigParser& out) { out.bool_value(true); }
};

template<>
struct Action<IntLit> {
    template<typename Input>
    static void apply(const Input& in, ConfigParser& out) {
        int64_t value = 0;
        const auto [end, ec] = std::from_chars(in.begin(), in.end(), value);
        if (ec != std::errc{} || end != in.end())
            throw parse_error("integer out of range", in);
        out.int_value(value);
    }
};

template<>
struct Action<StrChars> {
    template<typename Input>
    static void apply(const Input& in, ConfigParser& out) { out.string_value(in.string()); }
};

template<>
struct Action<Open> {
    static void apply0(ConfigParser& out) { out.begin_group(); }
};

template<>
struct Action<Close> {
    static void apply0(ConfigParser& out) { out.end_group(); }
};


// Error messages for failed `must` rules
template<typename Rule>
struct Control: normal<Rule> {
    template<typename Input, typename... States>
    static void raise(const Input& in, States&&...) {
        throw parse_error(fmt::format("expected {}", demangle<Rule>()), in);
    }
};


template<typename Input>
bool parse_config(Input& in, ConfigParser& parser)
{
    try {
        if (tao::pegtl::parse<Document, Action, Control>(in, parser))
            return true;
        log::error("{}: invalid config syntax", in.source());
    } catch (const parse_error& e) {
        const auto& pos = e.positions().front();
        log::error("{}\n{}\n{:>{}}", e.what(), in.line_at(pos), '^', pos.column);
    }
    return false;
}

} // namespace grammar


bool ConfigParser::parse_file(const fs::path& path)
{
    try {
        tao::pegtl::file_input<> in(path);
        return grammar::parse_config(in, *this);
    } catch (const std::system_error& e) {
        log::error("Cannot read config file {}: {}", path, e.what());
        return false;
    }
}


bool ConfigParser::parse_string(const std::string& str)
{
    tao::pegtl::memory_input<> in(str, "<string>");
    return grammar::parse_config(in, *this);
}


} // namespace termtext::config
