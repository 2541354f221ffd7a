#include "cli/command.hpp"
#include "patchwright/consts.hpp"
#include "patchwright/version_pin.hpp"

#include <filesystem>
#include <iostream>

int cmd_version(int argc, char **argv) {
  const std::filesystem::path file =
      argc >= 2 ? std::filesystem::path(argv[1])
                : std::filesystem::current_path() / patchwright::consts::kVersionFile;
  try {
    std::cout << patchwright::VersionPin(file).resolve().id << "\n";
    return 0;
  } catch (const std::exception &e) {
    return patchwright::cli::report_error("version", e);
  }
}
