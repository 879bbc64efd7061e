#include <string>

#include "eval_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto eval_expression::string() const -> std::string
{
    return fmt::format("eval({})", source->string());
}

void eval_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
