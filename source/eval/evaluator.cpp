#include <cstdint>
#include <string>
#include <utility>

#include "evaluator.hpp"

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
#include <error.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>
#include <state/state.hpp>
#include <value/value.hpp>
#include <value/value_ref.hpp>

namespace
{
auto apply_binary_operator(binary_operator oper, const value& left, const value& right) -> value
{
    using enum binary_operator;
    switch (oper) {
        case add:
            return left.add(right);
        case subtract:
            return left.subtract(right);
        case multiply:
            return left.multiply(right);
        case divide:
            return left.divide(right);
        case modulus:
            return left.modulus(right);
        case equality:
            return left.equals(right);
        case less_than:
            return left.less_than(right);
        case greater_than:
            return left.greater_than(right);
        case less_than_equal:
            return left.less_than_equal(right);
        case greater_than_equal:
            return left.greater_than_equal(right);
        case shift_left:
            return left.shift_left(right);
        case shift_right:
            return left.shift_right(right);
        case logical_and:
            return left.logical_and(right);
        case logical_or:
            return left.logical_or(right);
    }
    throw make_error(error_kind::type_mismatch, "unknown operator: {} {} {}", left.type(), oper, right.type());
}
}  // namespace

evaluator::evaluator(state& st)
    : m_state {st}
{
}

// every node counts against the state's depth limit, so nesting can never exhaust the host stack
auto evaluator::evaluate(const expression& expr) -> value_ref
{
    const auto guard = m_state.enter();
    expr.accept(*this);
    return std::move(*m_result);
}

void evaluator::visit(const binary_expression& expr)
{
    // both sides are always evaluated, && and || included
    const auto left = ::evaluate(*expr.left, m_state);
    const auto right = ::evaluate(*expr.right, m_state);
    m_result = value_ref::owned(apply_binary_operator(expr.op, *left, *right));
}

void evaluator::visit(const call_expression& expr)
{
    m_result = value_ref::owned(m_state.call_function(expr.function, expr.arguments));
}

void evaluator::visit(const eval_expression& expr)
{
    const auto source = ::evaluate(*expr.source, m_state);
    const auto& code = source->as<string_value>();

    auto prsr = parser {lexer {code, "<eval>"}};
    const auto parsed = prsr.parse_expression_input();
    if (parsed == nullptr) {
        throw syntax_error(fmt::format("{}", fmt::join(prsr.errors(), "; ")));
    }
    const auto guard = m_state.enter();
    m_result = value_ref::owned(::evaluate(*parsed, m_state).into_owned());
}

void evaluator::visit(const identifier& expr)
{
    m_result = value_ref::borrowed(m_state.get(expr.value));
}

void evaluator::visit(const list_index_expression& expr)
{
    const auto index = try_int(*expr.index, m_state);
    m_result = m_state.list_index(expr.name, index);
}

void evaluator::visit(const list_length_expression& expr)
{
    const auto& val = m_state.get(expr.name);
    if (val.is<list_value>()) {
        m_result = value_ref::owned(value {static_cast<integer_value>(val.as<list_value>().size())});
        return;
    }
    if (val.is<string_value>()) {
        m_result = value_ref::owned(value {static_cast<integer_value>(val.as<string_value>().size())});
        return;
    }
    throw index_unindexable(val.type());
}

void evaluator::visit(const literal& expr)
{
    m_result = value_ref::borrowed(expr.constant);
}

void evaluator::visit(const not_expression& expr)
{
    const auto operand = ::evaluate(*expr.right, m_state);
    m_result = value_ref::owned(operand->logical_not());
}

auto evaluate(const expression& expr, state& st) -> value_ref
{
    auto eval = evaluator {st};
    return eval.evaluate(expr);
}

auto try_bool(const expression& expr, state& st) -> bool
{
    return evaluate(expr, st)->as<bool>();
}

auto try_int(const expression& expr, state& st) -> integer_value
{
    return evaluate(expr, st)->as<integer_value>();
}
