#pragma once

#include <string>
#include <utility>

#include <lexer/location.hpp>
#include <value/value.hpp>

#include "expression.hpp"

struct literal final : expression
{
    explicit literal(value val, location loc = {})
        : expression {loc}
        , constant {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    value constant;
};
