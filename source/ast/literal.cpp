#include <string>

#include "literal.hpp"

#include "visitor.hpp"

auto literal::string() const -> std::string
{
    return constant.inspect();
}

void literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
