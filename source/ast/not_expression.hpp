#pragma once

#include <string>

#include "expression.hpp"

struct not_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr right;
};
