#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/binary_expression.hpp>
#include <ast/binary_operator.hpp>
#include <ast/call_expression.hpp>
#include <ast/eval_expression.hpp>
#include <ast/expression.hpp>
#include <ast/identifier.hpp>
#include <ast/list_index_expression.hpp>
#include <ast/list_length_expression.hpp>
#include <ast/literal.hpp>
#include <ast/not_expression.hpp>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <value/value.hpp>

#include "command.hpp"

namespace
{
enum precedence : std::uint8_t
{
    lowest,
    logical_or,
    logical_and,
    equals,
    lessgreater,
    shift,
    sum,
    product,
    prefix,
};

auto precedence_of_token(token_type type) -> std::uint8_t
{
    switch (type) {
        case token_type::logical_or:
            return logical_or;
        case token_type::logical_and:
            return logical_and;
        case token_type::equals:
            return equals;
        case token_type::less_than:
        case token_type::greater_than:
        case token_type::less_equal:
        case token_type::greater_equal:
            return lessgreater;
        case token_type::shift_left:
        case token_type::shift_right:
            return shift;
        case token_type::plus:
        case token_type::minus:
            return sum;
        case token_type::slash:
        case token_type::asterisk:
        case token_type::percent:
            return product;
        default:
            return lowest;
    }
}

auto binary_operator_of_token(token_type type) -> std::optional<binary_operator>
{
    using enum binary_operator;
    switch (type) {
        case token_type::plus:
            return add;
        case token_type::minus:
            return subtract;
        case token_type::asterisk:
            return multiply;
        case token_type::slash:
            return divide;
        case token_type::percent:
            return modulus;
        case token_type::equals:
            return equality;
        case token_type::less_than:
            return less_than;
        case token_type::greater_than:
            return greater_than;
        case token_type::less_equal:
            return less_than_equal;
        case token_type::greater_equal:
            return greater_than_equal;
        case token_type::shift_left:
            return shift_left;
        case token_type::shift_right:
            return shift_right;
        case token_type::logical_and:
            return logical_and;
        case token_type::logical_or:
            return logical_or;
        default:
            return std::nullopt;
    }
}

constexpr auto length_property = "length";
}  // namespace

parser::parser(lexer lxr)
    : m_lxr(lxr)
{
    next_token();
    next_token();
    using enum token_type;
    register_unary(ident, [this] { return parse_name(); });
    register_unary(integer, [this] { return parse_integer_literal(); });
    register_unary(minus, [this] { return parse_negative_integer_literal(); });
    register_unary(tru, [this] { return parse_boolean(); });
    register_unary(fals, [this] { return parse_boolean(); });
    register_unary(string, [this] { return parse_string_literal(); });
    register_unary(lbracket, [this] { return parse_list_literal(); });
    register_unary(exclamation, [this] { return parse_not_expression(); });
    register_unary(lparen, [this] { return parse_grouped_expression(); });
    register_unary(eval, [this] { return parse_eval_expression(); });
    for (const auto type : {plus,
                            minus,
                            asterisk,
                            slash,
                            percent,
                            equals,
                            less_than,
                            greater_than,
                            less_equal,
                            greater_equal,
                            shift_left,
                            shift_right,
                            logical_and,
                            logical_or})
    {
        register_binary(type, [this](expression_ptr left) { return parse_binary_expression(std::move(left)); });
    }
}

auto parser::parse_expression_input() -> expression_ptr
{
    auto expr = parse_expression(lowest);
    if (expr == nullptr || !expect_end_of_input()) {
        return {};
    }
    return expr;
}

auto parser::parse_command() -> std::optional<command>
{
    using enum token_type;
    switch (m_current_token.type) {
        case let:
            return parse_let_command();
        case function:
            return parse_function_command();
        default: {
            auto expr = parse_expression_input();
            if (expr == nullptr) {
                return std::nullopt;
            }
            return expression_command {.expr = std::move(expr)};
        }
    }
}

auto parser::errors() const -> const std::vector<std::string>&
{
    return m_errors;
}

auto parser::next_token() -> void
{
    m_current_token = m_peek_token;
    m_peek_token = m_lxr.next_token();
}

auto parser::parse_let_command() -> std::optional<command>
{
    using enum token_type;
    if (!get(ident)) {
        return std::nullopt;
    }
    auto name = std::string {m_current_token.literal};
    if (!get(assign)) {
        return std::nullopt;
    }
    next_token();
    auto value = parse_expression(lowest);
    if (value == nullptr || !expect_end_of_input()) {
        return std::nullopt;
    }
    return let_command {.name = std::move(name), .value = std::move(value)};
}

auto parser::parse_function_command() -> std::optional<command>
{
    using enum token_type;
    if (!get(ident)) {
        return std::nullopt;
    }
    auto name = std::string {m_current_token.literal};
    if (!get(lparen)) {
        return std::nullopt;
    }
    auto parameters = parse_function_parameters();
    if (!parameters || !get(assign)) {
        return std::nullopt;
    }
    next_token();
    auto body = parse_expression(lowest);
    if (body == nullptr || !expect_end_of_input()) {
        return std::nullopt;
    }
    return function_command {.name = std::move(name), .parameters = std::move(*parameters), .body = std::move(body)};
}

auto parser::expect_end_of_input() -> bool
{
    if (peek_token_is(token_type::semicolon)) {
        next_token();
    }
    return get(token_type::eof);
}

auto parser::parse_expression(int precedence) -> expression_ptr
{
    const auto depth = m_depth;
    auto expr = parse_nested_expression(precedence);
    m_depth = depth;
    return expr;
}

// every operand and every operator of a chain counts against max_nesting_depth,
// which bounds the height of the resulting tree
auto parser::parse_nested_expression(int precedence) -> expression_ptr
{
    if (!enter_nesting()) {
        return {};
    }
    auto unary = m_unary_parsers[m_current_token.type];
    if (!unary) {
        no_unary_expression_error(m_current_token);
        return {};
    }
    auto left_expr = unary();
    while (left_expr != nullptr && !peek_token_is(token_type::semicolon) && precedence < peek_precedence()) {
        auto binary = m_binary_parsers[m_peek_token.type];
        if (!binary) {
            return left_expr;
        }
        if (!enter_nesting()) {
            return {};
        }
        next_token();

        left_expr = binary(std::move(left_expr));
    }
    return left_expr;
}

auto parser::enter_nesting() -> bool
{
    if (m_depth >= max_nesting_depth) {
        new_error("expression nested too deeply, maximum depth is {}", max_nesting_depth);
        return false;
    }
    m_depth++;
    return true;
}

auto parser::parse_name() -> expression_ptr
{
    using enum token_type;
    auto name = std::string {m_current_token.literal};
    if (peek_token_is(lparen)) {
        return parse_call_expression(std::move(name));
    }
    if (peek_token_is(lbracket)) {
        return parse_list_index_expression(std::move(name));
    }
    if (peek_token_is(dot)) {
        return parse_list_length_expression(std::move(name));
    }
    return std::make_unique<identifier>(std::move(name), m_current_token.loc);
}

auto parser::parse_call_expression(std::string name) -> expression_ptr
{
    auto call = std::make_unique<call_expression>(m_current_token.loc);
    call->function = std::move(name);
    next_token();
    auto arguments = parse_expression_list(token_type::rparen);
    if (!arguments) {
        return {};
    }
    call->arguments = std::move(*arguments);
    return call;
}

auto parser::parse_list_index_expression(std::string name) -> expression_ptr
{
    auto index_expr = std::make_unique<list_index_expression>(m_current_token.loc);
    index_expr->name = std::move(name);
    next_token();
    next_token();
    index_expr->index = parse_expression(lowest);
    if (index_expr->index == nullptr || !get(token_type::rbracket)) {
        return {};
    }
    return index_expr;
}

auto parser::parse_list_length_expression(std::string name) -> expression_ptr
{
    const auto loc = m_current_token.loc;
    next_token();
    if (!get(token_type::ident)) {
        return {};
    }
    if (m_current_token.literal != length_property) {
        new_error("unknown property {} of {}, expected {}", m_current_token.literal, name, length_property);
        return {};
    }
    return std::make_unique<list_length_expression>(std::move(name), loc);
}

auto parser::parse_integer_literal() -> expression_ptr
{
    try {
        return std::make_unique<literal>(value {static_cast<integer_value>(std::stoll(std::string {m_current_token.literal}))},
                                         m_current_token.loc);
    } catch (const std::out_of_range&) {
        new_error("could not parse {} as integer", m_current_token.literal);
        return {};
    }
}

// a leading minus is only allowed directly in front of an integer literal
auto parser::parse_negative_integer_literal() -> expression_ptr
{
    const auto loc = m_current_token.loc;
    if (!get(token_type::integer)) {
        return {};
    }
    const auto digits = "-" + std::string {m_current_token.literal};
    try {
        return std::make_unique<literal>(value {static_cast<integer_value>(std::stoll(digits))}, loc);
    } catch (const std::out_of_range&) {
        new_error("could not parse {} as integer", digits);
        return {};
    }
}

auto parser::parse_boolean() -> expression_ptr
{
    return std::make_unique<literal>(value {current_token_is(token_type::tru)}, m_current_token.loc);
}

auto parser::parse_string_literal() -> expression_ptr
{
    return std::make_unique<literal>(value {std::string {m_current_token.literal}}, m_current_token.loc);
}

auto parser::parse_list_literal() -> expression_ptr
{
    const auto loc = m_current_token.loc;
    auto elements = parse_expression_list(token_type::rbracket);
    if (!elements) {
        return {};
    }
    list_value list;
    for (const auto& element : *elements) {
        const auto* lit = dynamic_cast<const literal*>(element.get());
        if (lit == nullptr) {
            new_error("list elements must be literals, got {}", element->string());
            return {};
        }
        list.push_back(lit->constant);
    }
    return std::make_unique<literal>(value {std::move(list)}, loc);
}

auto parser::parse_not_expression() -> expression_ptr
{
    auto not_expr = std::make_unique<not_expression>(m_current_token.loc);
    next_token();
    not_expr->right = parse_expression(prefix);
    if (not_expr->right == nullptr) {
        return {};
    }
    return not_expr;
}

auto parser::parse_grouped_expression() -> expression_ptr
{
    next_token();
    auto exp = parse_expression(lowest);
    if (exp == nullptr || !get(token_type::rparen)) {
        return {};
    }
    return exp;
}

auto parser::parse_eval_expression() -> expression_ptr
{
    auto eval_expr = std::make_unique<eval_expression>(m_current_token.loc);
    if (!get(token_type::lparen)) {
        return {};
    }
    next_token();
    eval_expr->source = parse_expression(lowest);
    if (eval_expr->source == nullptr || !get(token_type::rparen)) {
        return {};
    }
    return eval_expr;
}

auto parser::parse_binary_expression(expression_ptr left) -> expression_ptr
{
    auto bin_expr = std::make_unique<binary_expression>(m_current_token.loc);
    const auto oper = binary_operator_of_token(m_current_token.type);
    if (!oper) {
        new_error("unsupported operator {}", m_current_token.type);
        return {};
    }
    bin_expr->op = *oper;
    bin_expr->left = std::move(left);

    auto precedence = current_precedence();
    next_token();
    bin_expr->right = parse_expression(precedence);
    if (bin_expr->right == nullptr) {
        return {};
    }
    return bin_expr;
}

auto parser::parse_function_parameters() -> std::optional<std::vector<std::string>>
{
    using enum token_type;
    std::vector<std::string> parameters;
    if (peek_token_is(rparen)) {
        next_token();
        return parameters;
    }
    if (!get(ident)) {
        return std::nullopt;
    }
    parameters.emplace_back(m_current_token.literal);
    while (peek_token_is(comma)) {
        next_token();
        if (!get(ident)) {
            return std::nullopt;
        }
        parameters.emplace_back(m_current_token.literal);
    }
    if (!get(rparen)) {
        return std::nullopt;
    }
    return parameters;
}

auto parser::parse_expression_list(token_type end) -> std::optional<expressions>
{
    using enum token_type;
    auto list = expressions();
    if (peek_token_is(end)) {
        next_token();
        return list;
    }
    next_token();
    auto first = parse_expression(lowest);
    if (first == nullptr) {
        return std::nullopt;
    }
    list.push_back(std::move(first));

    while (peek_token_is(comma)) {
        next_token();
        next_token();
        auto element = parse_expression(lowest);
        if (element == nullptr) {
            return std::nullopt;
        }
        list.push_back(std::move(element));
    }

    if (!get(end)) {
        return std::nullopt;
    }

    return list;
}

auto parser::get(token_type type) -> bool
{
    if (m_peek_token.type == type) {
        next_token();
        return true;
    }
    peek_error(type);
    return false;
}

auto parser::peek_error(token_type type) -> void
{
    new_error("expected next token to be {}, got {} instead", type, m_peek_token.type);
}

auto parser::register_binary(token_type type, binary_parser binary) -> void
{
    m_binary_parsers[type] = std::move(binary);
}

auto parser::register_unary(token_type type, unary_parser unary) -> void
{
    m_unary_parsers[type] = std::move(unary);
}

auto parser::current_token_is(token_type type) const -> bool
{
    return m_current_token.type == type;
}

auto parser::peek_token_is(token_type type) const -> bool
{
    return m_peek_token.type == type;
}

auto parser::no_unary_expression_error(const token& tok) -> void
{
    if (tok.type == token_type::illegal) {
        new_error("illegal token `{}` at {}", tok.literal, tok.loc);
        return;
    }
    new_error("no prefix parse function for {} found", tok.type);
}

auto parser::peek_precedence() const -> int
{
    return precedence_of_token(m_peek_token.type);
}

auto parser::current_precedence() const -> int
{
    return precedence_of_token(m_current_token.type);
}
