#include <ostream>

#include "binary_operator.hpp"

auto operator<<(std::ostream& ostrm, binary_operator oper) -> std::ostream&
{
    using enum binary_operator;
    switch (oper) {
        case add:
            return ostrm << "+";
        case subtract:
            return ostrm << "-";
        case multiply:
            return ostrm << "*";
        case divide:
            return ostrm << "/";
        case equality:
            return ostrm << "==";
        case less_than:
            return ostrm << "<";
        case greater_than:
            return ostrm << ">";
        case less_than_equal:
            return ostrm << "<=";
        case greater_than_equal:
            return ostrm << ">=";
        case shift_left:
            return ostrm << "<<";
        case shift_right:
            return ostrm << ">>";
        case logical_and:
            return ostrm << "&&";
        case logical_or:
            return ostrm << "||";
        case modulus:
            return ostrm << "%";
    }
    return ostrm << "unknown " << static_cast<int>(oper);
}
