#include "cli/command.hpp"
#include "patchwright/resource_overlay.hpp"
#include "patchwright/tree_lock.hpp"
#include "patchwright/working_tree.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int cmd_overlay(int argc, char **argv) {
  if (argc < 3) {
    std::cerr << "usage: patchwright overlay <tree> [?]<src>:<dest>...\n";
    return 2;
  }
  try {
    std::vector<patchwright::OverlaySpec> specs;
    for (int i = 2; i < argc; ++i)
      specs.push_back(patchwright::parse_overlay_spec(argv[i]));

    patchwright::DiskWorkingTree tree{std::filesystem::path(argv[1])};
    const patchwright::TreeLock lock{tree};
    const auto report = patchwright::overlay(tree, specs);
    std::cout << "Copied " << report.written.size() << " files";
    if (!report.skipped.empty())
      std::cout << ", skipped " << report.skipped.size() << " missing optional sources";
    std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    return patchwright::cli::report_error("overlay", e);
  }
}
