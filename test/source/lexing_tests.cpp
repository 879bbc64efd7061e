#include <string_view>
#include <vector>

#include <gtest/gtest.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
struct expected_token
{
    token_type type;
    std::string_view literal;
};

auto assert_tokens(std::string_view input, const std::vector<expected_token>& expected_tokens) -> void
{
    auto lxr = lexer {input};
    for (const auto& expected : expected_tokens) {
        const auto tok = lxr.next_token();
        ASSERT_EQ(tok.type, expected.type) << "in `" << input << "` at " << tok;
        ASSERT_EQ(tok.literal, expected.literal) << "in `" << input << "` at " << tok;
    }
}
}  // namespace

TEST(lexing, testNextToken)
{
    using enum token_type;
    assert_tokens(R"r(let five = 5;
fn add(x, y) = x + y;
let result = add(five, -10);
!-/*%5;
5 < 10 > 5 <= 4 >= 3;
10 == 10;
1 << 2 >> 3;
true && false || true;
"foobar"
'foo bar'
""
[1,2];
xs[0] xs.length
eval("1 + 2")
)r",
                  {
                      {let, "let"},           {ident, "five"},      {assign, "="},         {integer, "5"},
                      {semicolon, ";"},       {function, "fn"},     {ident, "add"},        {lparen, "("},
                      {ident, "x"},           {comma, ","},         {ident, "y"},          {rparen, ")"},
                      {assign, "="},          {ident, "x"},         {plus, "+"},           {ident, "y"},
                      {semicolon, ";"},       {let, "let"},         {ident, "result"},     {assign, "="},
                      {ident, "add"},         {lparen, "("},        {ident, "five"},       {comma, ","},
                      {minus, "-"},           {integer, "10"},      {rparen, ")"},         {semicolon, ";"},
                      {exclamation, "!"},     {minus, "-"},         {slash, "/"},          {asterisk, "*"},
                      {percent, "%"},         {integer, "5"},       {semicolon, ";"},      {integer, "5"},
                      {less_than, "<"},       {integer, "10"},      {greater_than, ">"},   {integer, "5"},
                      {less_equal, "<="},     {integer, "4"},       {greater_equal, ">="}, {integer, "3"},
                      {semicolon, ";"},       {integer, "10"},      {equals, "=="},        {integer, "10"},
                      {semicolon, ";"},       {integer, "1"},       {shift_left, "<<"},    {integer, "2"},
                      {shift_right, ">>"},    {integer, "3"},       {semicolon, ";"},      {tru, "true"},
                      {logical_and, "&&"},    {fals, "false"},      {logical_or, "||"},    {tru, "true"},
                      {semicolon, ";"},       {string, "foobar"},   {string, "foo bar"},   {string, ""},
                      {lbracket, "["},        {integer, "1"},       {comma, ","},          {integer, "2"},
                      {rbracket, "]"},        {semicolon, ";"},     {ident, "xs"},         {lbracket, "["},
                      {integer, "0"},         {rbracket, "]"},      {ident, "xs"},         {dot, "."},
                      {ident, "length"},      {eval, "eval"},       {lparen, "("},         {string, "1 + 2"},
                      {rparen, ")"},          {eof, ""},
                  });
}

TEST(lexing, testIdentifiers)
{
    using enum token_type;
    assert_tokens("_private snake_case x1 letter evaluate fnord",
                  {
                      {ident, "_private"},
                      {ident, "snake_case"},
                      {ident, "x1"},
                      {ident, "letter"},
                      {ident, "evaluate"},
                      {ident, "fnord"},
                      {eof, ""},
                  });
}

TEST(lexing, testQuotes)
{
    using enum token_type;
    assert_tokens(R"r("it's" 'say "hi"' "a\n")r",
                  {
                      {string, "it's"},
                      {string, R"(say "hi")"},
                      {string, R"(a\n)"},
                      {eof, ""},
                  });
}

TEST(lexing, testUnterminatedString)
{
    using enum token_type;
    assert_tokens(R"r(1 + "abc)r",
                  {
                      {integer, "1"},
                      {plus, "+"},
                      {illegal, R"("abc)"},
                      {eof, ""},
                  });
}

TEST(lexing, testIllegalCharacters)
{
    using enum token_type;
    assert_tokens("a @ b $ {",
                  {
                      {ident, "a"},
                      {illegal, "@"},
                      {ident, "b"},
                      {illegal, "$"},
                      {illegal, "{"},
                      {eof, ""},
                  });
}

TEST(lexing, testLocations)
{
    auto lxr = lexer {"a + bc\n  42", "test.swirl"};
    const auto first = lxr.next_token();
    EXPECT_EQ(first.loc, (location {.filename = "test.swirl", .line = 1, .column = 1}));
    const auto plus = lxr.next_token();
    EXPECT_EQ(plus.loc, (location {.filename = "test.swirl", .line = 1, .column = 3}));
    const auto ident = lxr.next_token();
    EXPECT_EQ(ident.loc, (location {.filename = "test.swirl", .line = 1, .column = 5}));
    const auto number = lxr.next_token();
    EXPECT_EQ(number.literal, "42");
    EXPECT_EQ(number.loc, (location {.filename = "test.swirl", .line = 2, .column = 3}));
}
