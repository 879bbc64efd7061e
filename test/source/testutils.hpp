#pragma once

#include <optional>
#include <string_view>

#include <ast/expression.hpp>
#include <error.hpp>
#include <parser/parser.hpp>
#include <state/state.hpp>
#include <value/value.hpp>

auto assert_no_parse_errors(const parser& prsr) -> bool;
auto assert_expression(std::string_view input) -> expression_ptr;
auto test_eval(std::string_view input, state& st) -> value;
auto test_eval(std::string_view input) -> value;
// evaluates input expecting it to fail, returns the error if it did
auto eval_error(std::string_view input, state& st) -> std::optional<error>;
auto eval_error(std::string_view input) -> std::optional<error>;
