#include "patchwright/pipeline.hpp"

#include "patchwright/build_flags.hpp"
#include "patchwright/build_invoker.hpp"
#include "patchwright/consts.hpp"
#include "patchwright/interrupt.hpp"
#include "patchwright/log.hpp"
#include "patchwright/packaging.hpp"
#include "patchwright/tree_lock.hpp"
#include "patchwright/working_tree.hpp"

#include <chrono>

namespace patchwright {

Pipeline::Pipeline(BuildSettings settings, WorkingTree &tree, Vcs &vcs)
    : settings_(std::move(settings)), tree_(tree), vcs_(vcs) {}

void Pipeline::stage(PipelineReport &report, const char *name) {
  interrupt::check();
  report.stages.emplace_back(name);
  log::get()->info("==> {}", name);
}

PipelineReport Pipeline::run() {
  auto logger = log::get();
  const auto started = std::chrono::steady_clock::now();
  const auto &s = settings_;
  PipelineReport report;

  logger->info("source tree: {}", tree_.root().string());
  logger->info("build: {} {}", to_string(s.variant), to_string(s.arch));

  // Resolved once; the same revision is used for the whole run.
  report.revision = VersionPin(s.version_file).resolve();
  logger->info("upstream: {}", report.revision.id);

  const TreeLock lock{tree_};
  report.output_dir = std::string(consts::kOutDir) + "/" + output_dir_name(s.variant, s.arch);

  if (s.clean) {
    stage(report, "clean");
    tree_.remove_tree(report.output_dir);
  }

  if (s.sync_stage()) {
    stage(report, "sync");
    report.sync = sync(tree_, vcs_, report.revision, s.sync_options);
  }

  if (s.apply_patches) {
    stage(report, "patches");
    report.patches = PatchStack::load(s.patches_dir).apply(tree_);

    stage(report, "overlay");
    if (!s.scripts.icons.empty()) {
      const PackagingBridge icons{tree_.root(), s.scripts};
      (void)icons.generate_icons(s.icon_image, s.icon_output);
    }
    report.overlay = overlay(tree_, s.overlays);
  }

  if (s.build) {
    stage(report, "configure");
    const BuildConfiguration config =
        s.flag_fragments.empty() ? compose(s.fragments_dir, s.variant, s.arch)
                                 : compose(s.flag_fragments, s.variant, s.arch);
    report.config_written = materialize(config, tree_, s.clean);

    stage(report, "build");
    const BuildInvoker invoker{tree_.root(), s.build_tools};
    invoker.invoke(report.output_dir, s.targets);
  }

  if (s.sign || s.package) {
    stage(report, "package");
    const PackagingBridge bridge{tree_.root(), s.scripts};
    bridge.sign_and_package(report.output_dir, s.arch, s.sign, s.package);
  }

  report.seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  logger->info("done in {:.1f}s", report.seconds);
  return report;
}

} // namespace patchwright
