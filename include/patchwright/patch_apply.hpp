#pragma once
#include "patchwright/patch.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

struct HunkApplyResult {
  bool ok = false;
  std::string content;          // patched text when ok
  std::size_t failed_hunk = 0;  // index of the first hunk that did not match
  std::string detail;           // expected-vs-actual excerpt when !ok
};

// Apply hunks to `original` with exact context. Each hunk is searched for
// nearest to the line its header names (shifted by the offset the previous
// hunk landed at), never before the end of the previous hunk.
HunkApplyResult apply_hunks(std::string_view original, const std::vector<Hunk>& hunks,
                            std::string_view path);

// Planned effect of one patch on one file.
struct FileChange {
  std::string path;
  std::optional<std::vector<std::uint8_t>> before; // nullopt: file absent
  std::optional<std::vector<std::uint8_t>> after;  // nullopt: file removed
  bool executable = false; // new file gets the exec bits
};

class WorkingTree;

// Why a patch could not be planned.
enum class PlanFailure : std::uint8_t { None, Conflict, TargetMissing };

struct PatchPlan {
  PlanFailure failure = PlanFailure::None;
  std::string failed_path;
  std::string detail;
  std::vector<FileChange> changes; // complete only when failure == None
};

// Compute every file change of `files` against the current tree without
// writing anything. Later sections see the staged result of earlier ones.
PatchPlan plan_changes(const WorkingTree& tree, const std::vector<FilePatch>& files);

} // namespace patchwright
