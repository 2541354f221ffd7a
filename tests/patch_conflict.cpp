#include "patchwright/errors.hpp"
#include "patchwright/ledger.hpp"
#include "patchwright/patch_stack.hpp"
#include "patchwright/working_tree.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  patchwright::PatchStack stack({
      patchwright::make_patch("0001-a", "--- a/a.txt\n+++ b/a.txt\n@@ -1 +1 @@\n-a\n+A\n"),
      patchwright::make_patch("0002-b", "--- a/b.txt\n+++ b/b.txt\n@@ -1,2 +1,2 @@\n b1\n-b2\n+B2\n"),
      patchwright::make_patch("0003-c", "--- a/c.txt\n+++ b/c.txt\n@@ -1 +1 @@\n-c\n+C\n"),
  });

  // 0002-b's target was edited out of band.
  {
    patchwright::MemoryWorkingTree tree;
    tree.put("a.txt", "a\n");
    tree.put("b.txt", "b1\nlocal edit\n");
    tree.put("c.txt", "c\n");

    bool caught = false;
    try {
      stack.apply(tree);
    } catch (const patchwright::PatchConflictError& e) {
      caught = true;
      const auto& f = e.failure();
      if (f.patch_id != "0002-b" || f.applied != std::vector<std::string>{"0001-a"} || f.path != "b.txt") {
        std::cerr << "conflict report: " << e.what() << "\n"; return 1;
      }
      const std::string msg = e.what();
      if (msg.find("already applied: 0001-a") == std::string::npos || msg.find("+local edit") == std::string::npos) {
        std::cerr << "conflict message:\n" << msg << "\n"; return 1;
      }
    }
    if (!caught) { std::cerr << "conflict not raised\n"; return 1; }

    if (tree.text("a.txt") != "A\n") { std::cerr << "0001-a not applied\n"; return 1; }
    if (tree.text("b.txt") != "b1\nlocal edit\n") { std::cerr << "0002-b partially applied\n"; return 1; }
    if (tree.text("c.txt") != "c\n") { std::cerr << "0003-c was attempted\n"; return 1; }
    if (patchwright::Ledger::load(tree).ids() != std::vector<std::string>{"0001-a"}) {
      std::cerr << "ledger after conflict\n"; return 1;
    }

    // Fixing the tree and rerunning continues with 0002-b.
    tree.put("b.txt", "b1\nb2\n");
    try {
      const auto r = stack.apply(tree);
      if (r.ids_in(patchwright::PatchState::Applied) != std::vector<std::string>{"0002-b", "0003-c"}) {
        std::cerr << "resume\n"; return 1;
      }
    } catch (const std::exception& e) {
      std::cerr << "resume failed: " << e.what() << "\n"; return 1;
    }
  }

  // Missing target is its own error kind.
  {
    patchwright::MemoryWorkingTree tree;
    tree.put("a.txt", "a\n");
    tree.put("c.txt", "c\n");
    bool caught = false;
    try {
      stack.apply(tree);
    } catch (const patchwright::PatchConflictError &) {
      std::cerr << "missing target reported as conflict\n"; return 1;
    } catch (const patchwright::PatchTargetMissingError& e) {
      caught = e.failure().patch_id == "0002-b" && e.failure().path == "b.txt" &&
               e.failure().applied == std::vector<std::string>{"0001-a"};
    }
    if (!caught) { std::cerr << "target missing not raised\n"; return 1; }
    if (tree.text("c.txt") != "c\n") { std::cerr << "0003-c was attempted\n"; return 1; }
  }

  // A multi-file patch is all or nothing.
  {
    patchwright::MemoryWorkingTree tree;
    tree.put("x.txt", "x\n");
    tree.put("y.txt", "changed\n");
    patchwright::PatchStack two({patchwright::make_patch(
        "0001-xy", "--- a/x.txt\n+++ b/x.txt\n@@ -1 +1 @@\n-x\n+X\n--- a/y.txt\n+++ b/y.txt\n@@ -1 +1 @@\n-y\n+Y\n")});
    const auto before = tree.mutations();
    try {
      two.apply(tree);
      std::cerr << "conflict not raised\n"; return 1;
    } catch (const patchwright::PatchConflictError &) {
    }
    if (tree.mutations() != before || tree.text("x.txt") != "x\n") { std::cerr << "partial patch written\n"; return 1; }
    if (!patchwright::Ledger::load(tree).empty()) { std::cerr << "ledger written for failed patch\n"; return 1; }
  }

  std::cout << "OK\n";
  return 0;
}
