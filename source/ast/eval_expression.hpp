#pragma once

#include <string>

#include "expression.hpp"

// evaluates its operand to a string and runs that string as source code
struct eval_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr source;
};
