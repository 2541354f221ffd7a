#include "patchwright/patch.hpp"
#include "patchwright/patch_apply.hpp"
#include "patchwright/working_tree.hpp"

#include <iostream>
#include <string>

using patchwright::PlanFailure;

static std::string text_of(const std::optional<std::vector<std::uint8_t>>& b) {
  return b ? std::string(b->begin(), b->end()) : std::string("<absent>");
}

int main() {
  // Hunk lands at an offset: two lines were inserted above it upstream.
  {
    const auto files = patchwright::parse_unified_diff(
        "--- a/f.txt\n+++ b/f.txt\n@@ -2,3 +2,3 @@\n b\n-c\n+C\n d\n@@ -6,2 +6,3 @@\n f\n g\n+h\n");
    const std::string original = "new1\nnew2\na\nb\nc\nd\ne\nf\ng\n";
    const auto r = patchwright::apply_hunks(original, files[0].hunks, "f.txt");
    if (!r.ok) { std::cerr << "offset apply failed:\n" << r.detail; return 1; }
    if (r.content != "new1\nnew2\na\nb\nC\nd\ne\nf\ng\nh\n") { std::cerr << "offset result:\n" << r.content; return 1; }
  }

  // Context mismatch reports the hunk and an expected-vs-actual excerpt.
  {
    const auto files = patchwright::parse_unified_diff(
        "--- a/f.txt\n+++ b/f.txt\n@@ -1,2 +1,2 @@\n keep\n-old\n+new\n");
    const auto r = patchwright::apply_hunks("keep\nedited\n", files[0].hunks, "f.txt");
    if (r.ok || r.failed_hunk != 0) { std::cerr << "mismatch not detected\n"; return 1; }
    if (r.detail.find("hunk #1") == std::string::npos || r.detail.find("-old") == std::string::npos ||
        r.detail.find("+edited") == std::string::npos) {
      std::cerr << "excerpt:\n" << r.detail; return 1;
    }
  }

  // Missing final newline is preserved exactly.
  {
    const auto files = patchwright::parse_unified_diff(
        "--- a/f\n+++ b/f\n@@ -1,2 +1,2 @@\n a\n-b\n\\ No newline at end of file\n+c\n\\ No newline at end of file\n");
    const auto r = patchwright::apply_hunks("a\nb", files[0].hunks, "f");
    if (!r.ok || r.content != "a\nc") { std::cerr << "no-newline apply: '" << r.content << "'\n"; return 1; }
  }

  // Planning: create, delete, rename and modify in one patch; nothing written.
  {
    patchwright::MemoryWorkingTree tree;
    tree.put("keep.txt", "one\ntwo\n");
    tree.put("gone.txt", "bye\n");
    tree.put("src/x.cc", "x\n");
    const auto files = patchwright::parse_unified_diff(
        "--- a/keep.txt\n+++ b/keep.txt\n@@ -1,2 +1,2 @@\n one\n-two\n+2\n"
        "--- /dev/null\n+++ b/docs/new.md\n@@ -0,0 +1 @@\n+hi\n"
        "--- a/gone.txt\n+++ /dev/null\n@@ -1 +0,0 @@\n-bye\n"
        "diff --git a/src/x.cc b/src/y.cc\nrename from src/x.cc\nrename to src/y.cc\n");
    const auto plan = patchwright::plan_changes(tree, files);
    if (plan.failure != PlanFailure::None) { std::cerr << "plan failed: " << plan.detail << "\n"; return 1; }
    if (tree.mutations() != 3) { std::cerr << "planning wrote to the tree\n"; return 1; }
    if (plan.changes.size() != 5) { std::cerr << "expected 5 changes, got " << plan.changes.size() << "\n"; return 1; }
    for (const auto& c : plan.changes) {
      const std::string after = text_of(c.after);
      const std::string before = text_of(c.before);
      if (c.path == "keep.txt" && (before != "one\ntwo\n" || after != "one\n2\n")) { std::cerr << "keep.txt\n"; return 1; }
      if (c.path == "docs/new.md" && (before != "<absent>" || after != "hi\n")) { std::cerr << "new.md\n"; return 1; }
      if (c.path == "gone.txt" && after != "<absent>") { std::cerr << "gone.txt\n"; return 1; }
      if (c.path == "src/x.cc" && after != "<absent>") { std::cerr << "rename source\n"; return 1; }
      if (c.path == "src/y.cc" && after != "x\n") { std::cerr << "rename target\n"; return 1; }
    }
  }

  // Failure kinds
  {
    patchwright::MemoryWorkingTree tree;
    tree.put("exists.txt", "a\n");
    const auto modify_missing = patchwright::parse_unified_diff("--- a/nope.txt\n+++ b/nope.txt\n@@ -1 +1 @@\n-a\n+b\n");
    const auto p1 = patchwright::plan_changes(tree, modify_missing);
    if (p1.failure != PlanFailure::TargetMissing || p1.failed_path != "nope.txt") { std::cerr << "target missing\n"; return 1; }

    const auto create_existing = patchwright::parse_unified_diff("--- /dev/null\n+++ b/exists.txt\n@@ -0,0 +1 @@\n+a\n");
    const auto p2 = patchwright::plan_changes(tree, create_existing);
    if (p2.failure != PlanFailure::Conflict || p2.failed_path != "exists.txt") { std::cerr << "create over existing\n"; return 1; }

    const auto delete_partial = patchwright::parse_unified_diff("--- a/exists.txt\n+++ /dev/null\n@@ -1 +0,0 @@\n-a\n");
    tree.put("exists.txt", "a\nextra\n");
    const auto p3 = patchwright::plan_changes(tree, delete_partial);
    if (p3.failure != PlanFailure::Conflict) { std::cerr << "delete with leftover content\n"; return 1; }
  }

  std::cout << "OK\n";
  return 0;
}
