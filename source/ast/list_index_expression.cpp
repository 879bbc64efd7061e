#include <string>

#include "list_index_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto list_index_expression::string() const -> std::string
{
    return fmt::format("{}[{}]", name, index->string());
}

void list_index_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
