#pragma once

#include <string>
#include <variant>
#include <vector>

#include <ast/expression.hpp>

// let name = expr
struct let_command
{
    std::string name;
    expression_ptr value;
};

// fn name(params) = body
struct function_command
{
    std::string name;
    std::vector<std::string> parameters;
    expression_ptr body;
};

struct expression_command
{
    expression_ptr expr;
};

using command = std::variant<let_command, function_command, expression_command>;
