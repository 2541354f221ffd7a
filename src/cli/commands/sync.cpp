#include "cli/command.hpp"
#include "patchwright/consts.hpp"
#include "patchwright/tree_lock.hpp"
#include "patchwright/tree_sync.hpp"
#include "patchwright/vcs.hpp"
#include "patchwright/version_pin.hpp"
#include "patchwright/working_tree.hpp"
#include "patchwright/log.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_sync(int argc, char **argv) {
  std::filesystem::path tree_root;
  std::filesystem::path version_file =
      std::filesystem::current_path() / patchwright::consts::kVersionFile;
  patchwright::SyncOptions opts;
  bool custom_exclusions = false;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--reset") {
      opts.reset_tracked = true;
    } else if (a == "--clean") {
      opts.clean_untracked = true;
    } else if (a == "--depth" && i + 1 < argc) {
      try {
        opts.fetch_depth = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        opts.fetch_depth = -1;
      }
      if (opts.fetch_depth < 0) {
        std::cerr << "sync: --depth needs a non-negative number\n";
        return 2;
      }
    } else if (a == "--version-file" && i + 1 < argc) {
      version_file = argv[++i];
    } else if (a == "--scope" && i + 1 < argc) {
      opts.clean_scopes.emplace_back(argv[++i]);
    } else if (a == "--exclude" && i + 1 < argc) {
      if (!custom_exclusions)
        opts.exclusions.clear();
      custom_exclusions = true;
      opts.exclusions.emplace_back(argv[++i]);
    } else if (a == "--no-deps") {
      opts.sync_dependencies = false;
    } else if (a == "-v" || a == "--verbose") {
      patchwright::log::init(spdlog::level::debug);
    } else if (tree_root.empty() && !a.starts_with('-')) {
      tree_root = a;
    } else {
      tree_root.clear();
      break;
    }
  }
  if (tree_root.empty()) {
    std::cerr << "usage: patchwright sync <tree> [--reset] [--clean] [--depth N]\n"
                 "                        [--version-file F] [--scope P]... [--exclude P]...\n"
                 "                        [--no-deps]\n";
    return 2;
  }

  try {
    const auto revision = patchwright::VersionPin(version_file).resolve();
    patchwright::DiskWorkingTree tree{tree_root};
    patchwright::GitVcs vcs{tree_root};
    const patchwright::TreeLock lock{tree};
    const auto res = patchwright::sync(tree, vcs, revision, opts);
    std::cout << "At " << revision.id << " (" << res.head << ")\n";
    if (opts.clean_untracked)
      std::cout << "Removed " << res.removed.size() << " untracked paths, kept "
                << res.preserved.size() << "\n";
    if (res.ledger_cleared)
      std::cout << "Applied-patch record cleared\n";
    return 0;
  } catch (const std::exception &e) {
    return patchwright::cli::report_error("sync", e);
  }
}
