#include "patchwright/vcs.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

// Stand-in git: `status` prints NUL-separated porcelain records, anything else fails.
static fs::path fake_git(const fs::path& dir) {
  const auto p = dir / "git";
  std::ofstream(p) << "#!/bin/sh\n"
                      "if [ \"$1\" = status ]; then\n"
                      "  case \"$*\" in *-z*) ;; *) exit 9 ;; esac\n"
                      "  printf ' M chrome/app.cc\\000M  chrome/with space.cc\\000"
                      "R  chrome/renamed.cc\\000chrome/original.cc\\000'\n"
                      "  exit 0\n"
                      "fi\n"
                      "exit 1\n";
  fs::permissions(p, fs::perms::owner_all);
  return p;
}

int main() {
  const fs::path dir = fs::temp_directory_path() / ("patchwright_gitvcs_" + std::to_string(std::random_device{}()));
  fs::create_directories(dir / "src");
  int rc = 0;
  try {
    const patchwright::GitVcs vcs{dir / "src", fake_git(dir).string()};
    const auto changed = vcs.tracked_changes();
    const std::vector<std::string> want{"chrome/app.cc", "chrome/with space.cc", "chrome/renamed.cc",
                                        "chrome/original.cc"};
    if (changed != want) {
      std::cerr << "tracked changes:";
      for (const auto& c : changed)
        std::cerr << " [" << c << "]";
      std::cerr << "\n";
      rc = 1;
    }
    // A failing query reads as "unknown", not as an error.
    if (!vcs.head_revision().empty()) { std::cerr << "head of a failing git\n"; rc = 1; }
  } catch (const std::exception& e) {
    std::cerr << "unexpected: " << e.what() << "\n";
    rc = 1;
  }
  fs::remove_all(dir);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
