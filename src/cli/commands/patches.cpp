#include "cli/command.hpp"
#include "patchwright/log.hpp"
#include "patchwright/patch_stack.hpp"
#include "patchwright/tree_lock.hpp"
#include "patchwright/working_tree.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_list(const char *label, const std::vector<std::string> &ids) {
  if (ids.empty())
    return;
  std::cout << label << ":\n";
  for (const auto &id : ids)
    std::cout << "  " << id << "\n";
}

} // namespace

int cmd_patches(int argc, char **argv) {
  std::vector<std::string> pos;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-v" || a == "--verbose")
      patchwright::log::init(spdlog::level::debug);
    else
      pos.push_back(a);
  }
  if (pos.size() != 3 || (pos[0] != "apply" && pos[0] != "reverse" && pos[0] != "status")) {
    std::cerr << "usage: patchwright patches apply|reverse|status <tree> <patch-dir>\n";
    return 2;
  }
  const std::string &action = pos[0];

  try {
    const auto stack = patchwright::PatchStack::load(pos[2]);
    patchwright::DiskWorkingTree tree{std::filesystem::path(pos[1])};
    const patchwright::TreeLock lock{tree};

    if (action == "status") {
      const auto st = stack.status(tree);
      print_list("Applied", st.applied);
      print_list("Pending", st.pending);
      print_list("Not in this stack", st.foreign);
      print_list("Changed since patched", st.drifted);
      return 0;
    }

    const auto report = action == "apply" ? stack.apply(tree) : stack.reverse(tree);
    for (const auto &r : report.results)
      std::cout << r.id << ": " << patchwright::to_string(r.state) << "\n";
    if (report.no_op())
      std::cout << "Nothing to do\n";
    return 0;
  } catch (const std::exception &e) {
    return patchwright::cli::report_error("patches", e);
  }
}
