#include <cstddef>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <host/command_line.hpp>
#include <lexer/lexer.hpp>
#include <overloaded.hpp>
#include <parser/command.hpp>
#include <parser/parser.hpp>
#include <state/state.hpp>

namespace
{
constexpr auto prompt = ">> ";
constexpr auto comment_prefix = '#';

auto print_parse_errors(const std::vector<std::string>& errors)
{
    std::cerr << "Whoops! We ran into some syntax trouble here!\n";
    std::cerr << "  parser errors: \n";
    for (const auto& error : errors) {
        std::cerr << "    " << error << '\n';
    }
}

auto show_error(std::string_view error_kind, std::string_view error_message)
{
    std::cerr << "Whoops! We ran into some " << error_kind << " error: \n  " << error_message << '\n';
}

auto print_eval_error(std::string_view error)
{
    show_error("evaluation", error);
}

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-d] [-h] [-m <depth>] [<file>]\n\n", program);
    fmt::print("  -d          dump the global bindings after each command\n");
    fmt::print("  -h          show this help\n");
    fmt::print("  -m <depth>  maximum evaluation depth (default {})\n", state::default_max_depth);
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

// Parses and runs one line, printing the outcome. Returns false on any error.
auto run_command(state& st, std::string_view input, std::string_view filename, bool debug) -> bool
{
    auto prsr = parser {lexer {input, filename}};
    auto cmd = prsr.parse_command();
    if (!cmd) {
        print_parse_errors(prsr.errors());
        return false;
    }
    try {
        std::visit(overloaded {
                       [&](let_command& let) { st.set(let.name, evaluate(*let.value, st).into_owned()); },
                       [&](function_command& function)
                       { st.define_function(function.name, std::move(function.parameters), std::move(function.body)); },
                       [&](expression_command& expr) { std::cout << evaluate(*expr.expr, st)->inspect() << '\n'; },
                   },
                   *cmd);
    } catch (const std::exception& e) {
        print_eval_error(e.what());
        return false;
    }
    if (debug) {
        st.debug();
    }
    return true;
}

auto is_blank_or_comment(std::string_view line) -> bool
{
    const auto first = line.find_first_not_of(" \t\r");
    return first == std::string_view::npos || line[first] == comment_prefix;
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        std::cerr << "ERROR: could not open file: " << opts.file << '\n';
        return 1;
    }
    auto st = state {opts.max_depth};
    register_builtins(st);
    auto line = std::string {};
    for (std::size_t line_number = 1; getline(ifs, line); line_number++) {
        if (is_blank_or_comment(line)) {
            continue;
        }
        if (!run_command(st, line, opts.file, opts.debug)) {
            std::cerr << "  at " << opts.file << ':' << line_number << '\n';
            return 1;
        }
    }
    return 0;
}

auto run_repl(const command_line_args& opts) -> int
{
    std::cout << "This is swirl. Feel free to type in commands\n";
    auto st = state {opts.max_depth};
    register_builtins(st);
    auto show_prompt = []() { std::cout << prompt; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        if (!is_blank_or_comment(input)) {
            run_command(st, input, "<stdin>", opts.debug);
        }
        show_prompt();
    }
    return 0;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    const auto args = std::span(argv, static_cast<std::size_t>(argc));
    const auto program = std::string_view(args.front());
    const auto opts = parse_command_line(args.subspan(1));
    if (!opts.error.empty()) {
        show_usage(program, opts.error);
    }
    for (const auto file : opts.ignored_files) {
        fmt::print("ignoring file argument {}, already have one set.\n", file);
    }
    if (opts.help) {
        show_usage(program);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);
    } catch (const std::exception& e) {
        std::cerr << "Caught an exception: " << e.what() << '\n';
        return 1;
    }
}
