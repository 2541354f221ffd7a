#pragma once
#include "cli/command.hpp"

#include <iosfwd>
#include <string_view>

namespace patchwright::cli {

// `usage` is the one-line synopsis shown by `patchwright help`.
void register_command(std::string_view name, command_fn fn, std::string_view usage);
[[nodiscard]] command_fn find_command(std::string_view name);
void print_usage(std::ostream& out);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace patchwright::cli
