#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "value.hpp"

#include <error.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <overloaded.hpp>

namespace
{
constexpr auto max_integer = std::numeric_limits<integer_value>::max();
constexpr auto min_integer = std::numeric_limits<integer_value>::min();
constexpr auto max_shift = 63;
constexpr std::size_t max_sequence_length = 1U << 28U;

[[noreturn]] auto type_mismatch(const value& lhs, std::string_view oper, const value& rhs) -> void
{
    throw make_error(error_kind::type_mismatch, "type mismatch: {} {} {}", lhs.type(), oper, rhs.type());
}

[[noreturn]] auto overflow(integer_value lhs, std::string_view oper, integer_value rhs) -> void
{
    throw make_error(error_kind::integer_overflow, "integer overflow: {} {} {}", lhs, oper, rhs);
}

auto checked_add(integer_value lhs, integer_value rhs) -> integer_value
{
    if ((rhs > 0 && lhs > max_integer - rhs) || (rhs < 0 && lhs < min_integer - rhs)) {
        overflow(lhs, "+", rhs);
    }
    return lhs + rhs;
}

auto checked_subtract(integer_value lhs, integer_value rhs) -> integer_value
{
    if ((rhs < 0 && lhs > max_integer + rhs) || (rhs > 0 && lhs < min_integer + rhs)) {
        overflow(lhs, "-", rhs);
    }
    return lhs - rhs;
}

auto checked_multiply(integer_value lhs, integer_value rhs) -> integer_value
{
    if (lhs == 0 || rhs == 0) {
        return 0;
    }
    const auto overflows = [&]
    {
        if (lhs > 0) {
            return rhs > 0 ? lhs > max_integer / rhs : rhs < min_integer / lhs;
        }
        return rhs > 0 ? lhs < min_integer / rhs : lhs < max_integer / rhs;
    }();
    if (overflows) {
        overflow(lhs, "*", rhs);
    }
    return lhs * rhs;
}

auto checked_divisor(integer_value lhs, integer_value rhs, std::string_view oper) -> integer_value
{
    if (rhs == 0) {
        throw make_error(error_kind::division_by_zero, "division by zero");
    }
    if (lhs == min_integer && rhs == -1) {
        overflow(lhs, oper, rhs);
    }
    return rhs;
}

auto checked_shift(integer_value amount) -> int
{
    if (amount < 0 || amount > max_shift) {
        throw make_error(error_kind::invalid_shift, "invalid shift amount: {}", amount);
    }
    return static_cast<int>(amount);
}

template<typename T>
auto multiply_sequence_helper(const T& source, integer_value count) -> T
{
    T target;
    if (count <= 0 || source.empty()) {
        return target;
    }
    if (static_cast<std::uint64_t>(count) > max_sequence_length / source.size()) {
        throw make_error(
            error_kind::integer_overflow, "sequence too long: {} elements repeated {} times", source.size(), count);
    }
    target.reserve(source.size() * static_cast<std::size_t>(count));
    for (integer_value i = 0; i < count; i++) {
        std::copy(source.cbegin(), source.cend(), std::back_inserter(target));
    }
    return target;
}

template<typename Compare>
auto compare_helper(const value& lhs, std::string_view oper, const value& rhs, Compare cmp) -> value
{
    return std::visit(
        overloaded {
            [&](const integer_value left, const integer_value right) -> value { return {cmp(left, right)}; },
            [&](const string_value& left, const string_value& right) -> value { return {cmp(left, right)}; },
            [&](const auto&, const auto&) -> value { type_mismatch(lhs, oper, rhs); },
        },
        lhs.data,
        rhs.data);
}

template<typename Operation>
auto integer_helper(const value& lhs, std::string_view oper, const value& rhs, Operation operation) -> value
{
    if (!lhs.is<integer_value>() || !rhs.is<integer_value>()) {
        type_mismatch(lhs, oper, rhs);
    }
    return {operation(lhs.as<integer_value>(), rhs.as<integer_value>())};
}

template<typename Operation>
auto boolean_helper(const value& lhs, std::string_view oper, const value& rhs, Operation operation) -> value
{
    if (!lhs.is<bool>() || !rhs.is<bool>()) {
        type_mismatch(lhs, oper, rhs);
    }
    return {operation(lhs.as<bool>(), rhs.as<bool>())};
}
}  // namespace

auto operator<<(std::ostream& ostrm, value_kind kind) -> std::ostream&
{
    using enum value_kind;
    switch (kind) {
        case integer:
            return ostrm << "int";
        case boolean:
            return ostrm << "bool";
        case string:
            return ostrm << "str";
        case list:
            return ostrm << "list";
    }
    return ostrm << "unknown " << static_cast<int>(kind);
}

auto value::type() const -> value_kind
{
    return std::visit([]<typename T>(const T& /*val*/) { return kind_of<T>(); }, data);
}

auto value::inspect() const -> std::string
{
    return std::visit(
        overloaded {
            [](const integer_value val) -> std::string { return std::to_string(val); },
            [](const bool val) -> std::string { return val ? "true" : "false"; },
            [](const string_value& val) -> std::string { return fmt::format(R"("{}")", val); },
            [](const list_value& val) -> std::string
            {
                std::vector<std::string> elements;
                std::transform(val.cbegin(),
                               val.cend(),
                               std::back_inserter(elements),
                               [](const value& element) { return element.inspect(); });
                return fmt::format("[{}]", fmt::join(elements, ", "));
            },
        },
        data);
}

auto value::add(const value& other) const -> value
{
    return std::visit(
        overloaded {
            [](const integer_value lhs, const integer_value rhs) -> value { return {checked_add(lhs, rhs)}; },
            [](const string_value& lhs, const string_value& rhs) -> value { return {lhs + rhs}; },
            [](const list_value& lhs, const list_value& rhs) -> value
            {
                list_value result {lhs};
                std::copy(rhs.cbegin(), rhs.cend(), std::back_inserter(result));
                return {std::move(result)};
            },
            [&](const auto&, const auto&) -> value { type_mismatch(*this, "+", other); },
        },
        data,
        other.data);
}

auto value::subtract(const value& other) const -> value
{
    return integer_helper(*this, "-", other, checked_subtract);
}

auto value::multiply(const value& other) const -> value
{
    return std::visit(
        overloaded {
            [](const integer_value lhs, const integer_value rhs) -> value { return {checked_multiply(lhs, rhs)}; },
            [](const string_value& lhs, const integer_value rhs) -> value
            { return {multiply_sequence_helper(lhs, rhs)}; },
            [](const integer_value lhs, const string_value& rhs) -> value
            { return {multiply_sequence_helper(rhs, lhs)}; },
            [](const list_value& lhs, const integer_value rhs) -> value
            { return {multiply_sequence_helper(lhs, rhs)}; },
            [](const integer_value lhs, const list_value& rhs) -> value
            { return {multiply_sequence_helper(rhs, lhs)}; },
            [&](const auto&, const auto&) -> value { type_mismatch(*this, "*", other); },
        },
        data,
        other.data);
}

auto value::divide(const value& other) const -> value
{
    return integer_helper(*this,
                          "/",
                          other,
                          [](integer_value lhs, integer_value rhs) { return lhs / checked_divisor(lhs, rhs, "/"); });
}

auto value::modulus(const value& other) const -> value
{
    return integer_helper(*this,
                          "%",
                          other,
                          [](integer_value lhs, integer_value rhs) { return lhs % checked_divisor(lhs, rhs, "%"); });
}

auto value::equals(const value& other) const -> value
{
    return {*this == other};
}

auto value::less_than(const value& other) const -> value
{
    return compare_helper(*this, "<", other, [](const auto& lhs, const auto& rhs) { return lhs < rhs; });
}

auto value::greater_than(const value& other) const -> value
{
    return compare_helper(*this, ">", other, [](const auto& lhs, const auto& rhs) { return lhs > rhs; });
}

auto value::less_than_equal(const value& other) const -> value
{
    return compare_helper(*this, "<=", other, [](const auto& lhs, const auto& rhs) { return lhs <= rhs; });
}

auto value::greater_than_equal(const value& other) const -> value
{
    return compare_helper(*this, ">=", other, [](const auto& lhs, const auto& rhs) { return lhs >= rhs; });
}

auto value::shift_left(const value& other) const -> value
{
    return integer_helper(*this,
                          "<<",
                          other,
                          [](integer_value lhs, integer_value rhs)
                          { return static_cast<integer_value>(static_cast<std::uint64_t>(lhs) << checked_shift(rhs)); });
}

auto value::shift_right(const value& other) const -> value
{
    return integer_helper(
        *this, ">>", other, [](integer_value lhs, integer_value rhs) { return lhs >> checked_shift(rhs); });
}

auto value::logical_and(const value& other) const -> value
{
    return boolean_helper(*this, "&&", other, [](bool lhs, bool rhs) { return lhs && rhs; });
}

auto value::logical_or(const value& other) const -> value
{
    return boolean_helper(*this, "||", other, [](bool lhs, bool rhs) { return lhs || rhs; });
}

auto value::logical_not() const -> value
{
    return {!as<bool>()};
}

auto operator==(const value& lhs, const value& rhs) -> bool
{
    return std::visit(
        overloaded {
            [](const integer_value val1, const integer_value val2) { return val1 == val2; },
            [](const bool val1, const bool val2) { return val1 == val2; },
            [](const string_value& val1, const string_value& val2) { return val1 == val2; },
            [](const list_value& arr1, const list_value& arr2)
            { return arr1.size() == arr2.size() && std::equal(arr1.cbegin(), arr1.cend(), arr2.cbegin()); },
            [](const auto&, const auto&) { return false; },
        },
        lhs.data,
        rhs.data);
}

auto operator<<(std::ostream& ostrm, const value& val) -> std::ostream&
{
    return ostrm << val.inspect();
}
