#pragma once

#include <string>

#include "binary_operator.hpp"
#include "expression.hpp"

struct binary_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left;
    binary_operator op {};
    expression_ptr right;
};
