#include "cli/command.hpp"
#include "patchwright/build_flags.hpp"
#include "patchwright/fs.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int cmd_compose(int argc, char **argv) {
  std::vector<std::string> pos;
  std::filesystem::path out;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if ((a == "-o" || a == "--out") && i + 1 < argc)
      out = argv[++i];
    else
      pos.push_back(a);
  }
  if (pos.size() != 3) {
    std::cerr << "usage: patchwright compose <fragments-dir> <debug|release> <arm64|x64> "
                 "[--out FILE]\n";
    return 2;
  }

  try {
    const auto config = patchwright::compose(std::filesystem::path(pos[0]),
                                             patchwright::parse_variant(pos[1]),
                                             patchwright::parse_arch(pos[2]));
    if (out.empty()) {
      std::cout << config.content;
    } else {
      patchwright::fs::write_text_atomic(out, config.content);
      std::cout << "Wrote " << out.string() << " (" << config.out_dir_name << ")\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return patchwright::cli::report_error("compose", e);
  }
}
