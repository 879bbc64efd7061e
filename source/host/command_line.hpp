#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <state/state.hpp>

struct command_line_args
{
    bool help {};
    bool debug {};
    std::size_t max_depth {state::default_max_depth};
    std::string_view file;
    std::vector<std::string_view> ignored_files;
    // set when the arguments are unusable, the host then shows the usage
    std::string error;
};

// parses the arguments following the program name
auto parse_command_line(std::span<char* const> args) -> command_line_args;
