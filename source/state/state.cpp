#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "state.hpp"

#include <ast/expression.hpp>
#include <error.hpp>
#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <overloaded.hpp>
#include <value/value.hpp>
#include <value/value_ref.hpp>

namespace
{
[[noreturn]] auto arity_mismatch(const std::string& name, std::size_t expected, std::size_t got) -> void
{
    throw make_error(
        error_kind::arity_mismatch, "wrong number of arguments to {}(): expected={}, got={}", name, expected, got);
}

auto checked_index(integer_value index, std::size_t length, value_kind kind) -> std::size_t
{
    if (index < 0 || static_cast<std::size_t>(index) >= length) {
        throw make_error(
            error_kind::index_out_of_range, "index {} out of range for {} of length {}", index, kind, length);
    }
    return static_cast<std::size_t>(index);
}
}  // namespace

depth_guard::depth_guard(state& st)
    : m_state {st}
{
    if (m_state.m_depth >= m_state.m_max_depth) {
        throw make_error(
            error_kind::recursion_limit, "maximum recursion depth of {} exceeded", m_state.m_max_depth);
    }
    m_state.m_depth++;
}

depth_guard::~depth_guard()
{
    m_state.m_depth--;
}

state::state(std::size_t max_depth, std::ostream& output)
    : m_frames(1)
    , m_max_depth {max_depth}
    , m_output {&output}
{
}

auto state::get(const std::string& name) const -> const value&
{
    if (const auto itr = m_frames.back().find(name); itr != m_frames.back().end()) {
        return itr->second;
    }
    if (const auto itr = m_frames.front().find(name); itr != m_frames.front().end()) {
        return itr->second;
    }
    throw make_error(error_kind::unknown_variable, "identifier not found: {}", name);
}

auto state::set(const std::string& name, value val) -> void
{
    m_frames.back().insert_or_assign(name, std::move(val));
}

auto state::list_index(const std::string& name, integer_value index) const -> value_ref
{
    const auto& val = get(name);
    return std::visit(
        overloaded {
            [&](const list_value& list) -> value_ref
            { return value_ref::borrowed(list[checked_index(index, list.size(), val.type())]); },
            [&](const string_value& str) -> value_ref
            { return value_ref::owned(value {str.substr(checked_index(index, str.size(), val.type()), 1)}); },
            [&](const auto&) -> value_ref { throw index_unindexable(val.type()); },
        },
        val.data);
}

auto state::call_function(const std::string& name, const expressions& arguments) -> value
{
    const auto itr = m_functions.find(name);
    if (itr == m_functions.end()) {
        throw make_error(error_kind::unknown_function, "function not found: {}", name);
    }
    return std::visit(
        overloaded {
            [&](const user_function& function) { return call_user_function(name, function, arguments); },
            [&](const builtin_function& function) { return call_builtin_function(name, function, arguments); },
        },
        itr->second);
}

auto state::define_function(const std::string& name, std::vector<std::string> parameters, expression_ptr body)
    -> void
{
    m_functions.insert_or_assign(name, user_function {.parameters = std::move(parameters), .body = std::move(body)});
}

auto state::define_builtin(const std::string& name, std::optional<std::size_t> arity, builtin_body body) -> void
{
    m_functions.insert_or_assign(name, builtin_function {.arity = arity, .body = std::move(body)});
}

auto state::has_function(const std::string& name) const -> bool
{
    return m_functions.contains(name);
}

auto state::enter() -> depth_guard
{
    return depth_guard {*this};
}

void state::debug() const
{
    for (const auto& [name, val] : m_frames.front()) {
        fmt::print(output(), "[{}] = {}\n", name, val.inspect());
    }
    for (const auto& [name, function] : m_functions) {
        if (const auto* user = std::get_if<user_function>(&function); user != nullptr) {
            fmt::print(output(), "[{}({})] = {}\n", name, fmt::join(user->parameters, ", "), user->body->string());
        }
    }
}

auto state::call_user_function(const std::string& name, const user_function& function, const expressions& arguments)
    -> value
{
    if (arguments.size() != function.parameters.size()) {
        arity_mismatch(name, function.parameters.size(), arguments.size());
    }
    auto values = evaluate_arguments(arguments);
    const auto guard = enter();

    frame locals;
    for (std::size_t i = 0; i < values.size(); i++) {
        locals.insert_or_assign(function.parameters[i], std::move(values[i]));
    }
    m_frames.push_back(std::move(locals));
    try {
        auto result = evaluate(*function.body, *this).into_owned();
        m_frames.pop_back();
        return result;
    } catch (...) {
        m_frames.pop_back();
        throw;
    }
}

auto state::call_builtin_function(const std::string& name,
                                  const builtin_function& function,
                                  const expressions& arguments) -> value
{
    if (function.arity && arguments.size() != *function.arity) {
        arity_mismatch(name, *function.arity, arguments.size());
    }
    return function.body(*this, evaluate_arguments(arguments));
}

auto state::evaluate_arguments(const expressions& arguments) -> std::vector<value>
{
    std::vector<value> values;
    values.reserve(arguments.size());
    for (const auto& argument : arguments) {
        values.push_back(evaluate(*argument, *this).into_owned());
    }
    return values;
}
