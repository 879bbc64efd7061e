#include <cstddef>
#include <exception>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "command_line.hpp"

#include <fmt/format.h>

namespace
{
auto parse_depth(std::string_view arg) -> std::optional<std::size_t>
{
    try {
        std::size_t consumed {};
        const auto depth = std::stoul(std::string {arg}, &consumed);
        if (consumed == arg.size() && depth > 0) {
            return depth;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}
}  // namespace

auto parse_command_line(std::span<char* const> args) -> command_line_args
{
    command_line_args opts {};
    for (auto itr = args.begin(); itr != args.end(); ++itr) {
        const std::string_view arg {*itr};
        if (arg.empty()) {
            opts.error = "empty argument";
            return opts;
        }
        if (arg[0] == '-' && arg.size() == 1) {
            opts.error = fmt::format("invalid option {}", arg);
            return opts;
        }
        if (arg[0] == '-') {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                case 'm': {
                    if (std::next(itr) == args.end()) {
                        opts.error = "option -m requires a depth";
                        return opts;
                    }
                    ++itr;
                    const auto depth = parse_depth(*itr);
                    if (!depth) {
                        opts.error = fmt::format("invalid depth {}", *itr);
                        return opts;
                    }
                    opts.max_depth = *depth;
                    break;
                }
                default: {
                    opts.error = fmt::format("invalid option {}", arg);
                    return opts;
                }
            }
        } else if (opts.file.empty()) {
            opts.file = arg;
        } else {
            opts.ignored_files.push_back(arg);
        }
    }
    return opts;
}
