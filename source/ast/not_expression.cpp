#include <string>

#include "not_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto not_expression::string() const -> std::string
{
    return fmt::format("(!{})", right->string());
}

void not_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
