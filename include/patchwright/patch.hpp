#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

enum class LineKind : std::uint8_t { Context, Remove, Add };

struct HunkLine {
  LineKind kind;
  std::string text; // line bytes including the trailing '\n' (absent for "\ No newline")
};

struct Hunk {
  std::size_t old_start = 0; // as written in "@@ -old_start,old_count ..."
  std::size_t old_count = 0;
  std::size_t new_start = 0;
  std::size_t new_count = 0;
  std::vector<HunkLine> lines;

  // Lines the tree must contain (context + removed), and what replaces them.
  [[nodiscard]] std::vector<std::string> preimage() const;
  [[nodiscard]] std::vector<std::string> postimage() const;
};

enum class FileOp : std::uint8_t { Modify, Create, Delete };

struct FilePatch {
  std::string old_path; // empty for Create
  std::string new_path; // empty for Delete
  FileOp op = FileOp::Modify;
  bool executable = false; // "new file mode 100755" or "deleted file mode 100755"
  std::vector<Hunk> hunks;

  [[nodiscard]] bool is_rename() const {
    return op == FileOp::Modify && old_path != new_path;
  }
  // Path that must exist before the change (Modify/Delete) or must not (Create).
  [[nodiscard]] const std::string& target() const {
    return op == FileOp::Create ? new_path : old_path;
  }
};

// One patch file of the stack.
struct Patch {
  std::string id;     // path relative to the patch directory; defines order
  std::string digest; // SHA-1 hex of the raw patch text
  std::vector<FilePatch> files;

  // Tree paths the patch reads or writes, sorted, unique.
  [[nodiscard]] std::vector<std::string> touched_paths() const;
};

// Parse unified-diff text (plain `diff -u`, `git diff` or `git format-patch`).
// Throws std::runtime_error with a line number on malformed input.
std::vector<FilePatch> parse_unified_diff(std::string_view text);

// Build a patch from raw text; `id` is kept verbatim.
Patch make_patch(std::string id, std::string_view text);

// Same change run backwards: removed/added lines swapped, create <-> delete,
// rename target/source swapped.
FilePatch inverted(const FilePatch& fp);

// Split file content into lines that keep their '\n'; a missing final newline
// leaves the last line without one.
std::vector<std::string> split_keep_newlines(std::string_view text);

} // namespace patchwright
