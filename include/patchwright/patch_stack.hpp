#pragma once
#include "patchwright/patch.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace patchwright {

class WorkingTree;

enum class PatchState : std::uint8_t {
  Applied,        // applied by this call
  AlreadyApplied, // recorded in the ledger before this call
  Reversed,       // reversed by this call
  NotApplied,     // not in the ledger (reverse skips it)
};

const char *to_string(PatchState s);

struct PatchResult {
  std::string id;
  PatchState state;
  std::vector<std::string> files;
};

struct ApplyReport {
  std::vector<PatchResult> results; // in the order patches were visited
  std::vector<std::string> drifted; // "<patch>: <file>" changed since it was applied
  std::size_t files_written = 0;

  [[nodiscard]] std::vector<std::string> ids_in(PatchState s) const;
  // True when nothing had to be done.
  [[nodiscard]] bool no_op() const { return files_written == 0; }
};

struct StackStatus {
  std::vector<std::string> applied;  // stack patches recorded in the ledger, in order
  std::vector<std::string> pending;  // stack patches not yet applied
  std::vector<std::string> foreign;  // ledger entries that diverge from the stack
  std::vector<std::string> drifted;
};

// Ordered patch files of the fork. Apply order is ascending by id, reversal descending.
class PatchStack {
public:
  // Sorts by id; throws ConfigError on duplicate ids.
  explicit PatchStack(std::vector<Patch> patches);

  // Every *.patch / *.diff under `dir` (recursive), id = generic relative path.
  // Throws ConfigError if the directory is missing or a patch is empty/malformed.
  static PatchStack load(const std::filesystem::path& dir);

  [[nodiscard]] const std::vector<Patch>& patches() const { return patches_; }
  [[nodiscard]] bool empty() const { return patches_.empty(); }

  // Apply every patch not yet recorded in the tree's ledger, stopping at the first
  // failure (PatchConflictError / PatchTargetMissingError). Patches recorded
  // already are reported AlreadyApplied and not touched.
  ApplyReport apply(WorkingTree& tree) const;

  // Reverse recorded patches newest first; fails fast on the first patch that
  // does not reverse cleanly or does not restore its recorded pre-images.
  ApplyReport reverse(WorkingTree& tree) const;

  [[nodiscard]] StackStatus status(const WorkingTree& tree) const;

private:
  std::vector<Patch> patches_;
};

} // namespace patchwright
