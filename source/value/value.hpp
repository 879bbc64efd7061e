#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include <error.hpp>
#include <fmt/ostream.h>

#include "value_kind.hpp"

struct value;

using integer_value = std::int64_t;
using string_value = std::string;
using list_value = std::vector<value>;

template<typename T>
constexpr auto kind_of() -> value_kind;

template<>
constexpr auto kind_of<integer_value>() -> value_kind
{
    return value_kind::integer;
}

template<>
constexpr auto kind_of<bool>() -> value_kind
{
    return value_kind::boolean;
}

template<>
constexpr auto kind_of<string_value>() -> value_kind
{
    return value_kind::string;
}

template<>
constexpr auto kind_of<list_value>() -> value_kind
{
    return value_kind::list;
}

struct value
{
    using value_type = std::variant<integer_value, bool, string_value, list_value>;

    template<typename T>
    [[nodiscard]] auto is() const -> bool
    {
        return std::holds_alternative<T>(data);
    }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        if (!is<T>()) {
            throw unexpected_type(kind_of<T>(), type());
        }
        return std::get<T>(data);
    }

    [[nodiscard]] auto type() const -> value_kind;
    [[nodiscard]] auto inspect() const -> std::string;

    [[nodiscard]] auto add(const value& other) const -> value;
    [[nodiscard]] auto subtract(const value& other) const -> value;
    [[nodiscard]] auto multiply(const value& other) const -> value;
    [[nodiscard]] auto divide(const value& other) const -> value;
    [[nodiscard]] auto modulus(const value& other) const -> value;
    [[nodiscard]] auto equals(const value& other) const -> value;
    [[nodiscard]] auto less_than(const value& other) const -> value;
    [[nodiscard]] auto greater_than(const value& other) const -> value;
    [[nodiscard]] auto less_than_equal(const value& other) const -> value;
    [[nodiscard]] auto greater_than_equal(const value& other) const -> value;
    [[nodiscard]] auto shift_left(const value& other) const -> value;
    [[nodiscard]] auto shift_right(const value& other) const -> value;
    [[nodiscard]] auto logical_and(const value& other) const -> value;
    [[nodiscard]] auto logical_or(const value& other) const -> value;
    [[nodiscard]] auto logical_not() const -> value;

    value_type data {};
};

auto operator==(const value& lhs, const value& rhs) -> bool;
auto operator<<(std::ostream& ostrm, const value& val) -> std::ostream&;

template<>
struct fmt::formatter<value> : ostream_formatter
{
};
