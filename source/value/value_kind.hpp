#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class value_kind : std::uint8_t
{
    integer,
    boolean,
    string,
    list,
};

auto operator<<(std::ostream& ostrm, value_kind kind) -> std::ostream&;

template<>
struct fmt::formatter<value_kind> : ostream_formatter
{
};
