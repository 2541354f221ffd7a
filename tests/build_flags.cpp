#include "patchwright/build_flags.hpp"
#include "patchwright/errors.hpp"
#include "patchwright/working_tree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using patchwright::Arch;
using patchwright::Variant;

int main() {
  const fs::path dir = fs::temp_directory_path() / ("patchwright_flags_" + std::to_string(std::random_device{}()));
  fs::create_directories(dir);
  int rc = 0;

  std::ofstream(dir / "release.gn") << "is_debug = false\nis_official_build = true\n";
  std::ofstream(dir / "debug.gn") << "is_debug = true"; // no trailing newline

  try {
    const auto cfg = patchwright::compose(dir, Variant::Release, Arch::X64);
    if (cfg.content != "is_debug = false\nis_official_build = true\ntarget_cpu = \"x64\"\n") {
      std::cerr << "release content:\n" << cfg.content; rc = 1;
    }
    if (cfg.out_dir_name != "Release_x64" || patchwright::output_dir(cfg) != "out/Release_x64") {
      std::cerr << "release out dir\n"; rc = 1;
    }

    const auto dbg = patchwright::compose(dir, Variant::Debug, Arch::Arm64);
    if (dbg.content != "is_debug = true\ntarget_cpu = \"arm64\"\n" || dbg.out_dir_name != "Default_arm64") {
      std::cerr << "debug content:\n" << dbg.content; rc = 1;
    }

    // base.gn goes first when present.
    std::ofstream(dir / "base.gn") << "enable_nacl = false\n";
    const auto with_base = patchwright::compose(dir, Variant::Release, Arch::Arm64);
    if (with_base.content != "enable_nacl = false\nis_debug = false\nis_official_build = true\ntarget_cpu = \"arm64\"\n") {
      std::cerr << "base content:\n" << with_base.content; rc = 1;
    }

    // Explicit fragment list, in the given order.
    const auto listed = patchwright::compose({dir / "debug.gn", dir / "base.gn"}, Variant::Debug, Arch::X64);
    // debug.gn has no final newline; it still ends up on a line of its own.
    if (listed.content != "is_debug = true\nenable_nacl = false\ntarget_cpu = \"x64\"\n") {
      std::cerr << "listed content:\n" << listed.content; rc = 1;
    }

    // materialize: fresh writes, non-fresh keeps an existing file.
    patchwright::MemoryWorkingTree tree;
    if (!patchwright::materialize(cfg, tree, false) || tree.text("out/Release_x64/args.gn") != cfg.content) {
      std::cerr << "first materialize\n"; rc = 1;
    }
    tree.put("out/Release_x64/args.gn", "hand edited\n");
    if (patchwright::materialize(cfg, tree, false) || tree.text("out/Release_x64/args.gn") != "hand edited\n") {
      std::cerr << "non-fresh materialize replaced the file\n"; rc = 1;
    }
    if (!patchwright::materialize(cfg, tree, true) || tree.text("out/Release_x64/args.gn") != cfg.content) {
      std::cerr << "fresh materialize\n"; rc = 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "compose threw: " << e.what() << "\n"; rc = 1;
  }

  // Missing variant fragment.
  fs::remove(dir / "release.gn");
  bool caught = false;
  try {
    (void)patchwright::compose(dir, Variant::Release, Arch::X64);
  } catch (const patchwright::ConfigError& e) {
    caught = std::string(e.what()).find("release.gn") != std::string::npos;
  }
  if (!caught) { std::cerr << "missing fragment accepted\n"; rc = 1; }

  // Parsing
  if (patchwright::parse_variant("release") != Variant::Release || patchwright::parse_arch("x64") != Arch::X64) {
    std::cerr << "parse\n"; rc = 1;
  }
  for (const char *bad : {"Release", "ia32", ""}) {
    bool threw = false;
    try {
      (void)patchwright::parse_arch(bad);
      (void)patchwright::parse_variant(bad);
    } catch (const patchwright::ConfigError &) {
      threw = true;
    }
    if (!threw) { std::cerr << "accepted '" << bad << "'\n"; rc = 1; }
  }

  fs::remove_all(dir);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
