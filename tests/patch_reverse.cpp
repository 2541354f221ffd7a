#include "patchwright/errors.hpp"
#include "patchwright/ledger.hpp"
#include "patchwright/patch_stack.hpp"
#include "patchwright/working_tree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path& p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::map<std::string, std::string> snapshot(const patchwright::DiskWorkingTree& tree) {
  std::map<std::string, std::string> out;
  for (const auto& rel : tree.list()) {
    const auto bytes = tree.read(rel);
    out[rel] = std::string(bytes.begin(), bytes.end());
  }
  return out;
}

static bool owner_exec(const fs::path& p) {
  return (fs::status(p).permissions() & fs::perms::owner_exec) != fs::perms::none;
}

// Patched executables stay executable, new ones follow the diff's file mode,
// and reversal leaves the modes it found.
static int check_file_modes() {
  const fs::path root = fs::temp_directory_path() / ("patchwright_modes_" + std::to_string(std::random_device{}()));
  write_file(root / "build/gen.sh", "#!/bin/sh\necho gen\n");
  write_file(root / "build/notes.txt", "notes\n");
  fs::permissions(root / "build/gen.sh", fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                             fs::perms::others_read | fs::perms::others_exec);

  patchwright::PatchStack stack({
      patchwright::make_patch("0001-gen",
                              "--- a/build/gen.sh\n+++ b/build/gen.sh\n@@ -1,2 +1,2 @@\n #!/bin/sh\n-echo gen\n+echo fork\n"
                              "--- a/build/notes.txt\n+++ b/build/notes.txt\n@@ -1 +1 @@\n-notes\n+fork notes\n"),
      patchwright::make_patch("0002-tool",
                              "diff --git a/tools/run.sh b/tools/run.sh\nnew file mode 100755\nindex 0000000..e69de29\n"
                              "--- /dev/null\n+++ b/tools/run.sh\n@@ -0,0 +1,2 @@\n+#!/bin/sh\n+exit 0\n"),
  });

  int rc = 0;
  try {
    patchwright::DiskWorkingTree tree{root};
    stack.apply(tree);
    if (!owner_exec(root / "build/gen.sh")) { std::cerr << "apply dropped the exec bit\n"; rc = 1; }
    if (owner_exec(root / "build/notes.txt")) { std::cerr << "apply made a plain file executable\n"; rc = 1; }
    if (!owner_exec(root / "tools/run.sh") || !tree.is_executable("tools/run.sh")) {
      std::cerr << "new file mode 100755 ignored\n"; rc = 1;
    }

    stack.reverse(tree);
    if (!owner_exec(root / "build/gen.sh")) { std::cerr << "reverse dropped the exec bit\n"; rc = 1; }
    if (fs::exists(root / "tools/run.sh")) { std::cerr << "created script left behind\n"; rc = 1; }
    if (fs::status(root / "build/gen.sh").permissions() !=
        (fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read |
         fs::perms::others_exec)) {
      std::cerr << "mode changed by the round trip\n"; rc = 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "file modes: " << e.what() << "\n";
    rc = 1;
  }
  fs::remove_all(root);
  return rc;
}

int main() {
  const fs::path root = fs::temp_directory_path() / ("patchwright_reverse_" + std::to_string(std::random_device{}()));
  fs::create_directories(root / ".git");
  write_file(root / "chrome/app.cc", "int main() {\n  return 0;\n}\n");
  write_file(root / "chrome/old.h", "#pragma once\n");
  write_file(root / "tail.txt", "no newline");

  patchwright::PatchStack stack({
      patchwright::make_patch("0001-app",
                              "--- a/chrome/app.cc\n+++ b/chrome/app.cc\n@@ -1,3 +1,4 @@\n int main() {\n+  brand();\n   return 0;\n }\n"),
      patchwright::make_patch("0002-files",
                              "--- /dev/null\n+++ b/chrome/fork/panel.cc\n@@ -0,0 +1 @@\n+panel\n"
                              "--- a/chrome/old.h\n+++ /dev/null\n@@ -1 +0,0 @@\n-#pragma once\n"),
      patchwright::make_patch("0003-app-again",
                              "--- a/chrome/app.cc\n+++ b/chrome/app.cc\n@@ -1,2 +1,2 @@\n int main() {\n-  brand();\n+  brand(true);\n"
                              "--- a/tail.txt\n+++ b/tail.txt\n@@ -1 +1 @@\n-no newline\n\\ No newline at end of file\n+still none\n\\ No newline at end of file\n"),
  });

  int rc = 0;
  try {
    patchwright::DiskWorkingTree tree{root};
    if (tree.state_dir() != root / ".git" / "patchwright") { std::cerr << "state dir\n"; rc = 1; }
    const auto pristine = snapshot(tree);

    stack.apply(tree);
    if (!fs::exists(root / "chrome/fork/panel.cc") || fs::exists(root / "chrome/old.h")) {
      std::cerr << "apply did not create/delete\n"; rc = 1;
    }

    const auto rev = stack.reverse(tree);
    std::vector<std::string> order;
    for (const auto& r : rev.results)
      order.push_back(r.id);
    if (order != std::vector<std::string>{"0003-app-again", "0002-files", "0001-app"}) {
      std::cerr << "reverse order\n"; rc = 1;
    }
    if (snapshot(tree) != pristine) { std::cerr << "round trip not byte-identical\n"; rc = 1; }
    if (fs::exists(root / "chrome/fork")) { std::cerr << "empty directory left behind\n"; rc = 1; }
    if (!patchwright::Ledger::load(tree).empty() || fs::exists(root / ".git/patchwright/objects")) {
      std::cerr << "ledger not cleared\n"; rc = 1;
    }

    // Nothing applied: reverse reports every patch as not applied.
    const auto again = stack.reverse(tree);
    if (again.ids_in(patchwright::PatchState::NotApplied).size() != 3 || !again.no_op()) {
      std::cerr << "second reverse\n"; rc = 1;
    }

    // An edit on top of the patched content stops reversal at that patch.
    stack.apply(tree);
    write_file(root / "tail.txt", "edited");
    bool caught = false;
    try {
      stack.reverse(tree);
    } catch (const patchwright::PatchConflictError& e) {
      caught = e.failure().reversing && e.failure().patch_id == "0003-app-again" &&
               e.failure().applied.size() == 3;
    }
    if (!caught) { std::cerr << "reverse conflict not raised\n"; rc = 1; }
    if (patchwright::Ledger::load(tree).ids().size() != 3) { std::cerr << "ledger changed on failed reverse\n"; rc = 1; }
  } catch (const std::exception& e) {
    std::cerr << "unexpected: " << e.what() << "\n";
    rc = 1;
  }

  fs::remove_all(root);
  if (check_file_modes() != 0)
    rc = 1;
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
