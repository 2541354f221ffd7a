#pragma once
#include "patchwright/consts.hpp"
#include "patchwright/version_pin.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

class Vcs;
class WorkingTree;

struct SyncOptions {
  bool reset_tracked = false;   // discard tracked modifications first
  bool clean_untracked = false; // remove untracked/ignored files outside `exclusions`
  int fetch_depth = 0;          // 0 = full history
  std::vector<std::string> clean_scopes; // subpaths to clean, empty = whole tree
  std::vector<std::string> exclusions{consts::kDefaultCleanExclusions.begin(),
                                      consts::kDefaultCleanExclusions.end()};
  bool sync_dependencies = true;
  bool shallow_dependencies = true;
};

struct SyncResult {
  UpstreamRevision revision;
  std::string previous_head; // commit before the sync, empty if unknown
  std::string head;          // commit after the sync
  bool reset = false;
  bool ledger_cleared = false;
  std::vector<std::string> removed;   // untracked paths deleted by the clean
  std::vector<std::string> preserved; // untracked paths kept by the exclusion list
  bool dependencies_synced = false;

  [[nodiscard]] bool moved() const { return previous_head != head; }
};

// True if `path` (a trailing '/' marks a directory) lies under one of
// `exclusions`, or is a directory containing one.
bool is_excluded(std::string_view path, const std::vector<std::string>& exclusions);

// Bring `tree` to `revision`: reset, clean, fetch + checkout, dependency sync,
// in that order. Throws SyncError when the revision does not exist or the tree
// keeps modifications the applied-patch ledger does not account for, and
// ConfigError when cleaning with an empty exclusion list.
SyncResult sync(WorkingTree& tree, Vcs& vcs, const UpstreamRevision& revision,
                const SyncOptions& options);

} // namespace patchwright
