#pragma once
#include <exception>
#include <string_view>

namespace patchwright::cli {

using command_fn = int (*)(int, char **);

// Print "<cmd>: <what>" and map the exception to the process exit status
// (130 when interrupted, 1 otherwise).
int report_error(std::string_view cmd, const std::exception &e);

} // namespace patchwright::cli
