#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class binary_operator : std::uint8_t
{
    add,
    subtract,
    multiply,
    divide,
    equality,
    less_than,
    greater_than,
    less_than_equal,
    greater_than_equal,
    shift_left,
    shift_right,
    logical_and,
    logical_or,
    modulus,
};

auto operator<<(std::ostream& ostrm, binary_operator oper) -> std::ostream&;

template<>
struct fmt::formatter<binary_operator> : ostream_formatter
{
};
