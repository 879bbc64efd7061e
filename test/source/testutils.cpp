#include <iostream>
#include <optional>
#include <string_view>

#include "testutils.hpp"

#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gtest/gtest.h>
#include <lexer/lexer.hpp>

auto assert_no_parse_errors(const parser& prsr) -> bool
{
    EXPECT_TRUE(prsr.errors().empty()) << "expected no errors, got: "
                                       << fmt::format("{}", fmt::join(prsr.errors(), ", "));
    return !prsr.errors().empty();
}

auto assert_expression(std::string_view input) -> expression_ptr
{
    auto prsr = parser {lexer {input}};
    auto expr = prsr.parse_expression_input();
    if (assert_no_parse_errors(prsr)) {
        std::cerr << "while parsing: `" << input << "`";
    };
    return expr;
}

auto test_eval(std::string_view input, state& st) -> value
{
    const auto expr = assert_expression(input);
    if (expr == nullptr) {
        return {};
    }
    return evaluate(*expr, st).into_owned();
}

auto test_eval(std::string_view input) -> value
{
    auto st = state {};
    register_builtins(st);
    return test_eval(input, st);
}

auto eval_error(std::string_view input, state& st) -> std::optional<error>
{
    const auto expr = assert_expression(input);
    if (expr == nullptr) {
        return std::nullopt;
    }
    try {
        const auto result = evaluate(*expr, st);
        ADD_FAILURE() << "expected `" << input << "` to fail, got " << result->inspect();
    } catch (const error& err) {
        return err;
    }
    return std::nullopt;
}

auto eval_error(std::string_view input) -> std::optional<error>
{
    auto st = state {};
    register_builtins(st);
    return eval_error(input, st);
}
