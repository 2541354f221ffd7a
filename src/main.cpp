#include "cli/registry.hpp"
#include "patchwright/interrupt.hpp"
#include "patchwright/log.hpp"

#include <iostream>
#include <string_view>

int main(int argc, char **argv) {
  patchwright::cli::register_all_commands();
  patchwright::interrupt::install_handlers();
  patchwright::log::init();

  const std::string_view cmd = argc > 1 ? argv[1] : "";
  if (cmd == "-h" || cmd == "--help" || cmd == "help") {
    patchwright::cli::print_usage(std::cout);
    return 0;
  }
  const auto fn = patchwright::cli::find_command(cmd);
  if (fn == nullptr) {
    if (!cmd.empty())
      std::cerr << "unknown command: " << cmd << "\n";
    patchwright::cli::print_usage(std::cerr);
    return 2;
  }
  // argv[0] of the handler is the command name
  return fn(argc - 1, argv + 1);
}
