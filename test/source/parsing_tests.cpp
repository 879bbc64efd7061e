#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <ast/binary_expression.hpp>
#include <ast/binary_operator.hpp>
#include <ast/call_expression.hpp>
#include <ast/eval_expression.hpp>
#include <ast/identifier.hpp>
#include <ast/list_index_expression.hpp>
#include <ast/list_length_expression.hpp>
#include <ast/literal.hpp>
#include <ast/not_expression.hpp>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <lexer/lexer.hpp>
#include <parser/command.hpp>
#include <parser/parser.hpp>
#include <value/value.hpp>

#include "testutils.hpp"

namespace
{
template<typename E>
auto assert_node(const expression_ptr& expr) -> const E*
{
    const auto* node = dynamic_cast<const E*>(expr.get());
    EXPECT_NE(node, nullptr) << "unexpected node " << (expr ? expr->string() : "null");
    return node;
}

auto assert_literal(const expression_ptr& expr, const value& expected) -> void
{
    const auto* lit = assert_node<literal>(expr);
    ASSERT_NE(lit, nullptr);
    ASSERT_EQ(lit->constant, expected);
}

auto first_parse_error(std::string_view input) -> std::string
{
    auto prsr = parser {lexer {input}};
    const auto expr = prsr.parse_expression_input();
    EXPECT_TRUE(expr == nullptr) << "expected `" << input << "` to fail, got " << expr->string();
    if (prsr.errors().empty()) {
        return {};
    }
    return prsr.errors().front();
}

auto assert_command(std::string_view input) -> std::optional<command>
{
    auto prsr = parser {lexer {input}};
    auto cmd = prsr.parse_command();
    assert_no_parse_errors(prsr);
    return cmd;
}
}  // namespace

// NOLINTBEGIN(*-magic-numbers)
TEST(parsing, testLiterals)
{
    assert_literal(assert_expression("5"), value {integer_value {5}});
    assert_literal(assert_expression("-5"), value {integer_value {-5}});
    assert_literal(assert_expression("-9223372036854775808"), value {integer_value {INT64_MIN}});
    assert_literal(assert_expression("true"), value {true});
    assert_literal(assert_expression("false"), value {false});
    assert_literal(assert_expression(R"("hello world")"), value {string_value {"hello world"}});
    assert_literal(assert_expression("'single'"), value {string_value {"single"}});
}

TEST(parsing, testListLiteralIsFolded)
{
    const auto expr = assert_expression(R"([1, "two", true, [3], -4])");
    assert_literal(expr,
                   value {list_value {
                       value {integer_value {1}},
                       value {string_value {"two"}},
                       value {true},
                       value {list_value {value {integer_value {3}}}},
                       value {integer_value {-4}},
                   }});
    assert_literal(assert_expression("[]"), value {list_value {}});
}

TEST(parsing, testNames)
{
    const auto variable = assert_expression("foobar");
    const auto* ident = assert_node<identifier>(variable);
    ASSERT_NE(ident, nullptr);
    EXPECT_EQ(ident->value, "foobar");

    const auto index = assert_expression("xs[1 + i]");
    const auto* index_expr = assert_node<list_index_expression>(index);
    ASSERT_NE(index_expr, nullptr);
    EXPECT_EQ(index_expr->name, "xs");
    EXPECT_EQ(index_expr->index->string(), "(1 + i)");

    const auto length = assert_expression("xs.length");
    const auto* length_expr = assert_node<list_length_expression>(length);
    ASSERT_NE(length_expr, nullptr);
    EXPECT_EQ(length_expr->name, "xs");

    const auto call = assert_expression("add(1, 2 * 3, x)");
    const auto* call_expr = assert_node<call_expression>(call);
    ASSERT_NE(call_expr, nullptr);
    EXPECT_EQ(call_expr->function, "add");
    ASSERT_EQ(call_expr->arguments.size(), 3U);
    EXPECT_EQ(call_expr->arguments[1]->string(), "(2 * 3)");

    const auto no_args = assert_expression("now()");
    const auto* no_args_expr = assert_node<call_expression>(no_args);
    ASSERT_NE(no_args_expr, nullptr);
    EXPECT_TRUE(no_args_expr->arguments.empty());
}

TEST(parsing, testBinaryOperators)
{
    struct binary_test
    {
        std::string_view input;
        binary_operator op;
    };
    using enum binary_operator;
    std::array tests {
        binary_test {"a + b", add},
        binary_test {"a - b", subtract},
        binary_test {"a * b", multiply},
        binary_test {"a / b", divide},
        binary_test {"a % b", modulus},
        binary_test {"a == b", equality},
        binary_test {"a < b", less_than},
        binary_test {"a > b", greater_than},
        binary_test {"a <= b", less_than_equal},
        binary_test {"a >= b", greater_than_equal},
        binary_test {"a << b", shift_left},
        binary_test {"a >> b", shift_right},
        binary_test {"a && b", logical_and},
        binary_test {"a || b", logical_or},
    };
    for (const auto& test : tests) {
        const auto expr = assert_expression(test.input);
        const auto* binary = assert_node<binary_expression>(expr);
        ASSERT_NE(binary, nullptr);
        EXPECT_EQ(binary->op, test.op) << test.input;
        EXPECT_EQ(binary->left->string(), "a");
        EXPECT_EQ(binary->right->string(), "b");
    }
}

TEST(parsing, testOperatorPrecedence)
{
    struct precedence_test
    {
        std::string_view input;
        std::string_view expected;
    };
    std::array tests {
        precedence_test {"1 + 2 * 3", "(1 + (2 * 3))"},
        precedence_test {"a + b - c", "((a + b) - c)"},
        precedence_test {"a * b / c % d", "(((a * b) / c) % d)"},
        precedence_test {"!true == false", "((!true) == false)"},
        precedence_test {"!!x", "(!(!x))"},
        precedence_test {"1 < 2 == true", "((1 < 2) == true)"},
        precedence_test {"a || b && c", "(a || (b && c))"},
        precedence_test {"a && b || c && d", "((a && b) || (c && d))"},
        precedence_test {"1 << 2 + 3", "(1 << (2 + 3))"},
        precedence_test {"1 + 2 << 3 < 4", "(((1 + 2) << 3) < 4)"},
        precedence_test {"(1 + 2) * 3", "((1 + 2) * 3)"},
        precedence_test {"1 - -2", "(1 - -2)"},
        precedence_test {"x[1 + 2] % 3", "(x[(1 + 2)] % 3)"},
        precedence_test {"f(1, a * b) + s.length", "(f(1, (a * b)) + s.length)"},
        precedence_test {R"(eval("1 + 2") >= -3)", R"((eval("1 + 2") >= -3))"},
        precedence_test {"[1, 'a'] + xs", R"(([1, "a"] + xs))"},
        precedence_test {"a == b;", "(a == b)"},
    };
    for (const auto& test : tests) {
        const auto expr = assert_expression(test.input);
        ASSERT_NE(expr, nullptr);
        EXPECT_EQ(expr->string(), test.expected);
    }
}

TEST(parsing, testEvalExpression)
{
    const auto expr = assert_expression(R"(eval("x" + "1"))");
    const auto* eval_expr = assert_node<eval_expression>(expr);
    ASSERT_NE(eval_expr, nullptr);
    EXPECT_EQ(eval_expr->source->string(), R"(("x" + "1"))");
}

TEST(parsing, testNotExpression)
{
    const auto expr = assert_expression("!done");
    const auto* not_expr = assert_node<not_expression>(expr);
    ASSERT_NE(not_expr, nullptr);
    EXPECT_EQ(not_expr->right->string(), "done");
}

TEST(parsing, testParseErrors)
{
    struct error_test
    {
        std::string_view input;
        std::string_view expected_error;
    };
    std::array tests {
        error_test {"1 +", "no prefix parse function for eof found"},
        error_test {"1 2", "expected next token to be eof, got integer instead"},
        error_test {"-x", "expected next token to be integer, got identifier instead"},
        error_test {"(1 + 2", "expected next token to be ), got eof instead"},
        error_test {"xs[1", "expected next token to be ], got eof instead"},
        error_test {"[1, x]", "list elements must be literals, got x"},
        error_test {"[1 + 2]", "list elements must be literals, got (1 + 2)"},
        error_test {"s.size", "unknown property size of s, expected length"},
        error_test {"eval 1", "expected next token to be (, got integer instead"},
        error_test {"99999999999999999999", "could not parse 99999999999999999999 as integer"},
        error_test {"-9223372036854775809", "could not parse -9223372036854775809 as integer"},
        error_test {R"("abc)", R"(illegal token `"abc` at <stdin>:1:1)"},
        error_test {"let x = 1", "no prefix parse function for let found"},
        error_test {"", "no prefix parse function for eof found"},
    };
    for (const auto& test : tests) {
        EXPECT_EQ(first_parse_error(test.input), test.expected_error) << "input: " << test.input;
    }
}

TEST(parsing, testNestingLimit)
{
    const auto nested_error = fmt::format("expression nested too deeply, maximum depth is {}", parser::max_nesting_depth);

    const auto shallow = std::string(100, '!') + "true";
    EXPECT_EQ(assert_expression(shallow)->string().size(), 3 * 100 + 4);

    std::array inputs {
        std::string(100000, '!') + "true",
        std::string(100000, '(') + "1" + std::string(100000, ')'),
        std::string(100000, '!') + "(" + std::string(1000, '!') + "true)",
    };
    for (const auto& input : inputs) {
        auto prsr = parser {lexer {input}};
        EXPECT_EQ(prsr.parse_expression_input(), nullptr);
        ASSERT_EQ(prsr.errors().size(), 1U);
        EXPECT_EQ(prsr.errors().front(), nested_error);
    }

    auto chain = std::string {"1"};
    for (auto i = 0; i < 100000; i++) {
        chain += " + 1";
    }
    EXPECT_EQ(first_parse_error(chain), nested_error);
}

TEST(parsing, testLetCommand)
{
    const auto cmd = assert_command("let answer = 6 * 7;");
    ASSERT_TRUE(cmd.has_value());
    const auto* let = std::get_if<let_command>(&*cmd);
    ASSERT_NE(let, nullptr);
    EXPECT_EQ(let->name, "answer");
    EXPECT_EQ(let->value->string(), "(6 * 7)");
}

TEST(parsing, testFunctionCommand)
{
    const auto cmd = assert_command("fn add(a, b) = a + b");
    ASSERT_TRUE(cmd.has_value());
    const auto* function = std::get_if<function_command>(&*cmd);
    ASSERT_NE(function, nullptr);
    EXPECT_EQ(function->name, "add");
    EXPECT_EQ(function->parameters, (std::vector<std::string> {"a", "b"}));
    EXPECT_EQ(function->body->string(), "(a + b)");

    const auto nullary = assert_command("fn zero() = 0");
    ASSERT_TRUE(nullary.has_value());
    const auto* zero = std::get_if<function_command>(&*nullary);
    ASSERT_NE(zero, nullptr);
    EXPECT_TRUE(zero->parameters.empty());
}

TEST(parsing, testExpressionCommand)
{
    const auto cmd = assert_command("x.length + 1");
    ASSERT_TRUE(cmd.has_value());
    const auto* expr = std::get_if<expression_command>(&*cmd);
    ASSERT_NE(expr, nullptr);
    EXPECT_EQ(expr->expr->string(), "(x.length + 1)");
}

TEST(parsing, testCommandErrors)
{
    struct error_test
    {
        std::string_view input;
        std::string_view expected_error;
    };
    std::array tests {
        error_test {"let = 1", "expected next token to be identifier, got = instead"},
        error_test {"let x 1", "expected next token to be =, got integer instead"},
        error_test {"fn f(a, 1) = a", "expected next token to be identifier, got integer instead"},
        error_test {"fn f(a) a", "expected next token to be =, got identifier instead"},
        error_test {"let x = 1 2", "expected next token to be eof, got integer instead"},
    };
    for (const auto& test : tests) {
        auto prsr = parser {lexer {test.input}};
        const auto cmd = prsr.parse_command();
        EXPECT_FALSE(cmd.has_value()) << test.input;
        ASSERT_FALSE(prsr.errors().empty()) << test.input;
        EXPECT_EQ(prsr.errors().front(), test.expected_error) << test.input;
    }
}
// NOLINTEND(*-magic-numbers)
