#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "lexer.hpp"

#include "location.hpp"
#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table = std::array<token_type, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(illegal);
    arr['&'] = ampersand;
    arr['*'] = asterisk;
    arr[']'] = rbracket;
    arr[')'] = rparen;
    arr[','] = comma;
    arr['='] = assign;
    arr['>'] = greater_than;
    arr['<'] = less_than;
    arr['['] = lbracket;
    arr['('] = lparen;
    arr[';'] = semicolon;
    arr['.'] = dot;
    arr['/'] = slash;
    arr['%'] = percent;
    arr['|'] = pipe;
    arr['+'] = plus;
    arr['-'] = minus;
    arr['!'] = exclamation;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();
constexpr auto keyword_count = 5;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"fn", token_type::function},
        std::pair {"let", token_type::let},
        std::pair {"true", token_type::tru},
        std::pair {"false", token_type::fals},
        std::pair {"eval", token_type::eval},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

using token_pair = std::pair<token_type, token_type>;

struct token_pair_hash
{
    auto operator()(const token_pair& pair) const -> std::size_t
    {
        return static_cast<std::uint8_t>(pair.first)
            ^ static_cast<std::size_t>(static_cast<std::size_t>(pair.second) << 8U);
    }
};

using two_token_lookup = std::unordered_map<token_pair, token, token_pair_hash>;

auto build_two_token_lookup() -> two_token_lookup
{
    using enum token_type;
    two_token_lookup lookup;

    lookup.insert({{assign, assign},
                   {
                       .type = equals,
                       .literal = "==",
                   }});
    lookup.insert({{less_than, less_than},
                   {
                       .type = shift_left,
                       .literal = "<<",
                   }});
    lookup.insert({{greater_than, greater_than},
                   {
                       .type = shift_right,
                       .literal = ">>",
                   }});
    lookup.insert({{ampersand, ampersand},
                   {
                       .type = logical_and,
                       .literal = "&&",
                   }});
    lookup.insert({{pipe, pipe},
                   {
                       .type = logical_or,
                       .literal = "||",
                   }});
    lookup.insert({{greater_than, assign},
                   {
                       .type = greater_equal,
                       .literal = ">=",
                   }});
    lookup.insert({{less_than, assign},
                   {
                       .type = less_equal,
                       .literal = "<=",
                   }});
    return lookup;
}

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

}  // namespace

lexer::lexer(std::string_view input, std::string_view filename)
    : m_input {input}
    , m_filename {filename}
{
    read_char();
}

auto lexer::next_token() -> token
{
    using enum token_type;
    skip_whitespace();
    const auto loc = current_loc();
    if (m_byte == '\0') {
        return token {.type = eof, .literal = "", .loc = loc};
    }
    const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(m_byte)];
    const static auto two_token = build_two_token_lookup();
    if (char_token_type != illegal) {
        const auto peek_token_type = char_literal_tokens[static_cast<unsigned char>(peek_char())];
        if (const auto itr = two_token.find({char_token_type, peek_token_type}); itr != two_token.end()) {
            return read_char(), read_char(), itr->second.with_loc(loc);
        }
        return read_char(),
               token {
                   .type = char_token_type,
                   .literal = m_input.substr(m_position - 1, 1),
                   .loc = loc,
               };
    }
    if (m_byte == '"' || m_byte == '\'') {
        return read_string();
    }
    if (is_letter(m_byte)) {
        return read_identifier_or_keyword();
    }
    if (is_digit(m_byte)) {
        return read_number();
    }
    return read_char(),
           token {
               .type = illegal,
               .literal = m_input.substr(m_position - 1, 1),
               .loc = loc,
           };
}

auto lexer::read_char() -> void
{
    if (m_read_position >= m_input.size()) {
        m_byte = '\0';
    } else {
        m_byte = m_input[m_read_position];
    }
    if (m_byte == '\n') {
        m_row++;
        m_bol = m_read_position;
    }
    m_position = m_read_position;
    m_read_position++;
}

auto lexer::skip_whitespace() -> void
{
    while (m_byte == ' ' || m_byte == '\t' || m_byte == '\n' || m_byte == '\r') {
        read_char();
    }
}

auto lexer::peek_char() -> std::string_view::value_type
{
    if (m_read_position >= m_input.size()) {
        return '\0';
    }
    return m_input[m_read_position];
}

auto lexer::read_identifier_or_keyword() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (is_letter(m_byte) || is_digit(m_byte)) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(position, m_position - position);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    if (itr != keyword_tokens.end()) {
        return token {.type = itr->second, .literal = itr->first, .loc = loc};
    }
    // NOLINTEND(*-qualified-auto)
    return token {.type = token_type::ident, .literal = identifier_or_keyword, .loc = loc};
}

auto lexer::read_number() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (is_digit(m_byte)) {
        read_char();
    }
    return token {.type = token_type::integer, .literal = m_input.substr(position, m_position - position), .loc = loc};
}

// strings are delimited by matching double or single quotes and have no
// escape sequences; a string running into the end of input is illegal
auto lexer::read_string() -> token
{
    const auto loc = current_loc();
    const auto quote = m_byte;
    const auto position = m_position + 1;
    while (true) {
        read_char();
        if (m_byte == quote || m_byte == '\0') {
            break;
        }
    }
    if (m_byte == '\0') {
        return token {.type = token_type::illegal, .literal = m_input.substr(position - 1), .loc = loc};
    }
    const auto count = m_position - position;
    return read_char(), token {.type = token_type::string, .literal = m_input.substr(position, count), .loc = loc};
}

auto lexer::current_loc() -> location
{
    const auto column = m_row == 0 ? m_read_position - m_bol : m_read_position - m_bol - 1;
    return location {.filename = m_filename, .line = m_row + 1, .column = column};
}
