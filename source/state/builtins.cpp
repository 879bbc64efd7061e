#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <error.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <overloaded.hpp>
#include <value/value.hpp>

#include "state.hpp"

namespace
{
auto to_display_string(const value& val) -> std::string
{
    if (val.is<string_value>()) {
        return val.as<string_value>();
    }
    return val.inspect();
}

auto print(state& st, std::vector<value>&& arguments) -> value
{
    for (bool first = true; const auto& arg : arguments) {
        if (!first) {
            fmt::print(st.output(), " ");
        }
        fmt::print(st.output(), "{}", to_display_string(arg));
        first = false;
    }
    fmt::print(st.output(), "\n");
    return {static_cast<integer_value>(arguments.size())};
}

auto type(state& /*st*/, std::vector<value>&& arguments) -> value
{
    return {fmt::format("{}", arguments[0].type())};
}

auto str(state& /*st*/, std::vector<value>&& arguments) -> value
{
    return {to_display_string(arguments[0])};
}

auto parse_integer(const string_value& str) -> integer_value
{
    try {
        std::size_t consumed {};
        const auto result = std::stoll(str, &consumed);
        if (consumed != str.size()) {
            throw make_error(error_kind::unexpected_type, "could not parse {} as integer", str);
        }
        return static_cast<integer_value>(result);
    } catch (const std::invalid_argument&) {
        throw make_error(error_kind::unexpected_type, "could not parse {} as integer", str);
    } catch (const std::out_of_range&) {
        throw make_error(error_kind::integer_overflow, "integer overflow: {}", str);
    }
}

auto integer(state& /*st*/, std::vector<value>&& arguments) -> value
{
    return std::visit(
        overloaded {
            [](const integer_value val) -> value { return {val}; },
            [](const bool val) -> value { return {static_cast<integer_value>(val ? 1 : 0)}; },
            [](const string_value& val) -> value { return {parse_integer(val)}; },
            [](const list_value& /*val*/) -> value { throw unexpected_type(value_kind::integer, value_kind::list); },
        },
        arguments[0].data);
}

auto push(state& /*st*/, std::vector<value>&& arguments) -> value
{
    auto list = arguments[0].as<list_value>();
    list.push_back(std::move(arguments[1]));
    return {std::move(list)};
}
}  // namespace

auto register_builtins(state& st) -> void
{
    st.define_builtin("print", {}, print);
    st.define_builtin("type", 1, type);
    st.define_builtin("str", 1, str);
    st.define_builtin("int", 1, integer);
    st.define_builtin("push", 2, push);
}
