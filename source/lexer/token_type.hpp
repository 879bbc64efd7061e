#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    illegal,
    eof,

    // single character tokens
    ampersand,
    assign,
    asterisk,
    comma,
    dot,
    exclamation,
    greater_than,
    lbracket,
    less_than,
    lparen,
    minus,
    percent,
    pipe,
    plus,
    rbracket,
    rparen,
    semicolon,
    slash,

    // two character tokens
    equals,
    greater_equal,
    less_equal,
    shift_left,
    shift_right,
    logical_and,
    logical_or,

    // multi character tokens
    ident,
    integer,
    string,

    // keywords
    let,
    function,
    tru,
    fals,
    eval,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
