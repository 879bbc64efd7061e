#pragma once

#include <optional>

#include <ast/expression.hpp>
#include <ast/visitor.hpp>
#include <value/value.hpp>
#include <value/value_ref.hpp>

class state;

struct evaluator final : visitor
{
    explicit evaluator(state& st);
    auto evaluate(const expression& expr) -> value_ref;

  protected:
    void visit(const binary_expression& expr) final;
    void visit(const call_expression& expr) final;
    void visit(const eval_expression& expr) final;
    void visit(const identifier& expr) final;
    void visit(const list_index_expression& expr) final;
    void visit(const list_length_expression& expr) final;
    void visit(const literal& expr) final;
    void visit(const not_expression& expr) final;

  private:
    std::optional<value_ref> m_result;
    state& m_state;
};

// Reduces expr against st. Variables, literals and list elements come back
// borrowed, everything else is computed and owned.
auto evaluate(const expression& expr, state& st) -> value_ref;
auto try_bool(const expression& expr, state& st) -> bool;
auto try_int(const expression& expr, state& st) -> integer_value;
