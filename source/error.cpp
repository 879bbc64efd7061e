#include <ostream>
#include <string>

#include "error.hpp"

#include <fmt/format.h>

auto operator<<(std::ostream& ostrm, error_kind kind) -> std::ostream&
{
    using enum error_kind;
    switch (kind) {
        case unexpected_type:
            return ostrm << "unexpected_type";
        case index_unindexable:
            return ostrm << "index_unindexable";
        case syntax_error:
            return ostrm << "syntax_error";
        case type_mismatch:
            return ostrm << "type_mismatch";
        case division_by_zero:
            return ostrm << "division_by_zero";
        case integer_overflow:
            return ostrm << "integer_overflow";
        case invalid_shift:
            return ostrm << "invalid_shift";
        case unknown_variable:
            return ostrm << "unknown_variable";
        case unknown_function:
            return ostrm << "unknown_function";
        case arity_mismatch:
            return ostrm << "arity_mismatch";
        case index_out_of_range:
            return ostrm << "index_out_of_range";
        case recursion_limit:
            return ostrm << "recursion_limit";
    }
    return ostrm << "unknown " << static_cast<int>(kind);
}

auto unexpected_type(value_kind expected, value_kind actual) -> error
{
    return error {error_kind::unexpected_type,
                  fmt::format("unexpected type: expected {}, got {}", expected, actual),
                  expected,
                  actual};
}

auto index_unindexable(value_kind actual) -> error
{
    return error {error_kind::index_unindexable, fmt::format("unindexable type: {}", actual), {}, actual};
}

auto syntax_error(const std::string& message) -> error
{
    return error {error_kind::syntax_error, fmt::format("syntax error: {}", message)};
}
