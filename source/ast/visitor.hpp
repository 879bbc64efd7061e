#pragma once

#include <ast/binary_expression.hpp>
#include <ast/call_expression.hpp>
#include <ast/eval_expression.hpp>
#include <ast/expression.hpp>
#include <ast/identifier.hpp>
#include <ast/list_index_expression.hpp>
#include <ast/list_length_expression.hpp>
#include <ast/literal.hpp>
#include <ast/not_expression.hpp>

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const binary_expression& expr) = 0;
    virtual void visit(const call_expression& expr) = 0;
    virtual void visit(const eval_expression& expr) = 0;
    virtual void visit(const identifier& expr) = 0;
    virtual void visit(const list_index_expression& expr) = 0;
    virtual void visit(const list_length_expression& expr) = 0;
    virtual void visit(const literal& expr) = 0;
    virtual void visit(const not_expression& expr) = 0;
};
