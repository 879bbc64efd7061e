#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <value/value_kind.hpp>

enum class error_kind : std::uint8_t
{
    unexpected_type,
    index_unindexable,
    syntax_error,
    type_mismatch,
    division_by_zero,
    integer_overflow,
    invalid_shift,
    unknown_variable,
    unknown_function,
    arity_mismatch,
    index_out_of_range,
    recursion_limit,
};

auto operator<<(std::ostream& ostrm, error_kind kind) -> std::ostream&;

template<>
struct fmt::formatter<error_kind> : ostream_formatter
{
};

struct error final : std::runtime_error
{
    error(error_kind knd,
          const std::string& message,
          std::optional<value_kind> expected_kind = {},
          std::optional<value_kind> actual_kind = {})
        : std::runtime_error {message}
        , kind {knd}
        , expected {expected_kind}
        , actual {actual_kind}
    {
    }

    error_kind kind;
    // only set for unexpected_type and index_unindexable
    std::optional<value_kind> expected;
    std::optional<value_kind> actual;
};

template<typename... T>
[[nodiscard]] auto make_error(error_kind kind, fmt::format_string<T...> fmt, T&&... args) -> error
{
    return error {kind, fmt::format(fmt, std::forward<T>(args)...)};
}

[[nodiscard]] auto unexpected_type(value_kind expected, value_kind actual) -> error;
[[nodiscard]] auto index_unindexable(value_kind actual) -> error;
[[nodiscard]] auto syntax_error(const std::string& message) -> error;
