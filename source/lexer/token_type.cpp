#include <ostream>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case illegal:
            return ostream << "illegal";
        case eof:
            return ostream << "eof";
        case ampersand:
            return ostream << "&";
        case assign:
            return ostream << "=";
        case asterisk:
            return ostream << "*";
        case comma:
            return ostream << ",";
        case dot:
            return ostream << ".";
        case exclamation:
            return ostream << "!";
        case greater_than:
            return ostream << ">";
        case lbracket:
            return ostream << "[";
        case less_than:
            return ostream << "<";
        case lparen:
            return ostream << "(";
        case minus:
            return ostream << "-";
        case percent:
            return ostream << "%";
        case pipe:
            return ostream << "|";
        case plus:
            return ostream << "+";
        case rbracket:
            return ostream << "]";
        case rparen:
            return ostream << ")";
        case semicolon:
            return ostream << ";";
        case slash:
            return ostream << "/";
        case equals:
            return ostream << "==";
        case greater_equal:
            return ostream << ">=";
        case less_equal:
            return ostream << "<=";
        case shift_left:
            return ostream << "<<";
        case shift_right:
            return ostream << ">>";
        case logical_and:
            return ostream << "&&";
        case logical_or:
            return ostream << "||";
        case ident:
            return ostream << "identifier";
        case integer:
            return ostream << "integer";
        case string:
            return ostream << "string";
        case let:
            return ostream << "let";
        case function:
            return ostream << "fn";
        case tru:
            return ostream << "true";
        case fals:
            return ostream << "false";
        case eval:
            return ostream << "eval";
    }
    return ostream << "unknown " << static_cast<int>(type);
}
