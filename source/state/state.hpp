#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <ast/expression.hpp>
#include <value/value.hpp>
#include <value/value_ref.hpp>

class state;

using builtin_body = std::function<value(state& st, std::vector<value>&& arguments)>;

struct user_function
{
    std::vector<std::string> parameters;
    expression_ptr body;
};

struct builtin_function
{
    // empty means variadic
    std::optional<std::size_t> arity;
    builtin_body body;
};

using callable = std::variant<user_function, builtin_function>;

// Counts one level of evaluation re-entry for as long as it lives.
class depth_guard final
{
  public:
    explicit depth_guard(state& st);
    depth_guard(const depth_guard&) = delete;
    depth_guard(depth_guard&&) = delete;
    auto operator=(const depth_guard&) -> depth_guard& = delete;
    auto operator=(depth_guard&&) -> depth_guard& = delete;
    ~depth_guard();

  private:
    state& m_state;
};

class state final
{
  public:
    static constexpr std::size_t default_max_depth = 1024;

    explicit state(std::size_t max_depth = default_max_depth, std::ostream& output = std::cout);
    state(const state&) = delete;
    state(state&&) = delete;
    auto operator=(const state&) -> state& = delete;
    auto operator=(state&&) -> state& = delete;
    ~state() = default;

    [[nodiscard]] auto get(const std::string& name) const -> const value&;
    auto set(const std::string& name, value val) -> void;
    [[nodiscard]] auto list_index(const std::string& name, integer_value index) const -> value_ref;

    auto call_function(const std::string& name, const expressions& arguments) -> value;
    auto define_function(const std::string& name, std::vector<std::string> parameters, expression_ptr body) -> void;
    auto define_builtin(const std::string& name, std::optional<std::size_t> arity, builtin_body body) -> void;
    [[nodiscard]] auto has_function(const std::string& name) const -> bool;

    [[nodiscard]] auto enter() -> depth_guard;
    [[nodiscard]] auto depth() const -> std::size_t { return m_depth; }
    [[nodiscard]] auto max_depth() const -> std::size_t { return m_max_depth; }
    [[nodiscard]] auto output() const -> std::ostream& { return *m_output; }

    void debug() const;

  private:
    friend class depth_guard;
    using frame = std::unordered_map<std::string, value>;

    auto call_user_function(const std::string& name, const user_function& function, const expressions& arguments)
        -> value;
    auto call_builtin_function(const std::string& name,
                               const builtin_function& function,
                               const expressions& arguments) -> value;
    auto evaluate_arguments(const expressions& arguments) -> std::vector<value>;

    // front is the global frame, back the innermost one
    std::deque<frame> m_frames;
    std::unordered_map<std::string, callable> m_functions;
    std::size_t m_depth {};
    std::size_t m_max_depth;
    std::ostream* m_output;
};

// print, type, str, int and push
auto register_builtins(state& st) -> void;
