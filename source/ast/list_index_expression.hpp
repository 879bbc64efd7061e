#pragma once

#include <string>

#include "expression.hpp"

struct list_index_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
    expression_ptr index;
};
