#pragma once

#include <string>
#include <utility>

#include <lexer/location.hpp>

#include "expression.hpp"

struct list_length_expression final : expression
{
    explicit list_length_expression(std::string list_name, location loc = {})
        : expression {loc}
        , name {std::move(list_name)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
};
