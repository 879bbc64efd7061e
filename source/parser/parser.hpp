#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ast/binary_operator.hpp>
#include <ast/expression.hpp>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>

#include "command.hpp"

class parser final
{
  public:
    static constexpr std::size_t max_nesting_depth = 512;

    explicit parser(lexer lxr);
    parser(const parser&) = delete;
    parser(parser&&) = delete;
    auto operator=(const parser&) -> parser& = delete;
    auto operator=(parser&&) -> parser& = delete;
    ~parser() = default;

    // the whole input must be exactly one expression, optionally followed by a semicolon
    auto parse_expression_input() -> expression_ptr;
    auto parse_command() -> std::optional<command>;
    [[nodiscard]] auto errors() const -> const std::vector<std::string>&;

  private:
    using binary_parser = std::function<expression_ptr(expression_ptr)>;
    using unary_parser = std::function<expression_ptr()>;

    auto next_token() -> void;
    auto parse_let_command() -> std::optional<command>;
    auto parse_function_command() -> std::optional<command>;
    auto expect_end_of_input() -> bool;

    auto parse_expression(int precedence) -> expression_ptr;
    auto parse_nested_expression(int precedence) -> expression_ptr;
    auto enter_nesting() -> bool;
    auto parse_name() -> expression_ptr;
    auto parse_call_expression(std::string name) -> expression_ptr;
    auto parse_list_index_expression(std::string name) -> expression_ptr;
    auto parse_list_length_expression(std::string name) -> expression_ptr;
    auto parse_integer_literal() -> expression_ptr;
    auto parse_negative_integer_literal() -> expression_ptr;
    auto parse_boolean() -> expression_ptr;
    auto parse_string_literal() -> expression_ptr;
    auto parse_list_literal() -> expression_ptr;
    auto parse_not_expression() -> expression_ptr;
    auto parse_grouped_expression() -> expression_ptr;
    auto parse_eval_expression() -> expression_ptr;
    auto parse_binary_expression(expression_ptr left) -> expression_ptr;
    auto parse_function_parameters() -> std::optional<std::vector<std::string>>;

    auto parse_expression_list(token_type end) -> std::optional<expressions>;
    auto get(token_type type) -> bool;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    [[nodiscard]] auto peek_token_is(token_type type) const -> bool;
    auto peek_error(token_type type) -> void;
    auto register_binary(token_type type, binary_parser binary) -> void;
    auto register_unary(token_type type, unary_parser unary) -> void;
    auto no_unary_expression_error(const token& tok) -> void;
    [[nodiscard]] auto peek_precedence() const -> int;
    [[nodiscard]] auto current_precedence() const -> int;

    template<typename... T>
    auto new_error(fmt::format_string<T...> fmt, T&&... args)
    {
        m_errors.push_back(fmt::format(fmt, std::forward<T>(args)...));
    }

    lexer m_lxr;
    token m_current_token {};
    token m_peek_token {};
    std::vector<std::string> m_errors;
    std::size_t m_depth {};

    std::unordered_map<token_type, unary_parser> m_unary_parsers;
    std::unordered_map<token_type, binary_parser> m_binary_parsers;
};
