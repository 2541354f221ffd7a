#pragma once
#include "patchwright/config.hpp"
#include "patchwright/patch_stack.hpp"
#include "patchwright/resource_overlay.hpp"
#include "patchwright/tree_sync.hpp"
#include "patchwright/version_pin.hpp"

#include <optional>
#include <string>
#include <vector>

namespace patchwright {

class Vcs;
class WorkingTree;

struct PipelineReport {
  UpstreamRevision revision;
  std::vector<std::string> stages; // stages that ran, in order
  std::optional<SyncResult> sync;
  std::optional<ApplyReport> patches;
  std::optional<OverlayReport> overlay;
  std::string output_dir;  // "out/<name>" inside the source tree
  bool config_written = false;
  double seconds = 0;
};

// VersionPin -> clean -> SourceTreeSync -> PatchStack -> ResourceOverlay ->
// BuildFlagComposer -> BuildInvoker -> PackagingBridge, each gated by the
// settings. The first failure aborts the run; the tree stays locked meanwhile.
class Pipeline {
public:
  Pipeline(BuildSettings settings, WorkingTree& tree, Vcs& vcs);

  [[nodiscard]] const BuildSettings& settings() const { return settings_; }

  PipelineReport run();

private:
  void stage(PipelineReport& report, const char *name);

  BuildSettings settings_;
  WorkingTree& tree_;
  Vcs& vcs_;
};

} // namespace patchwright
