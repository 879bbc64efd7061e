#include <string>

#include "list_length_expression.hpp"

#include "visitor.hpp"

auto list_length_expression::string() const -> std::string
{
    return name + ".length";
}

void list_length_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
