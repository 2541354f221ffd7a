#include "fake_vcs.hpp"

#include "patchwright/config.hpp"
#include "patchwright/errors.hpp"
#include "patchwright/interrupt.hpp"
#include "patchwright/ledger.hpp"
#include "patchwright/pipeline.hpp"
#include "patchwright/working_tree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using patchwright::PatchState;

static void write_file(const fs::path& p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  int rc = 0;
  const fs::path root = fs::temp_directory_path() / ("patchwright_pipeline_" + std::to_string(std::random_device{}()));
  write_file(root / "UPSTREAM_VERSION", "# pinned\n130.0.6723.58\n");
  write_file(root / "patches/0001-branding.patch",
             "--- a/chrome/app/branding.h\n+++ b/chrome/app/branding.h\n@@ -1 +1 @@\n-#define NAME \"Chromium\"\n+#define NAME \"Fork\"\n");
  write_file(root / "patches/0002-panel.patch",
             "--- /dev/null\n+++ b/chrome/browser/panel.cc\n@@ -0,0 +1 @@\n+// panel\n");
  write_file(root / "resources/side_panel/index.html", "<html></html>\n");
  write_file(root / "resources/agent_side_panel/agent.js", "agent();\n");

  patchwright::MemoryWorkingTree tree;
  FakeVcs vcs{tree};
  vcs.add_revision("129.0.0.0", {{"chrome/app/branding.h", "#define NAME \"Chromium\"\n"}});
  vcs.add_revision("130.0.6723.58", {{"chrome/app/branding.h", "#define NAME \"Chromium\"\n"},
                                     {"chrome/browser/browser.cc", "int main();\n"}});
  vcs.start_at("129.0.0.0");
  tree.put("out/Default_arm64/chrome", "stale binary\n");
  tree.put("scratch.txt", "leftover\n");

  auto settings = patchwright::default_settings(root);
  settings.clean = true;
  settings.reset = true;
  settings.apply_patches = true;
  settings.build = false;
  settings.sync_options.reset_tracked = true;
  settings.sync_options.clean_untracked = true;

  try {
    const auto report = patchwright::Pipeline(settings, tree, vcs).run();
    if (report.revision.id != "130.0.6723.58") { std::cerr << "revision\n"; rc = 1; }
    if (report.stages != std::vector<std::string>{"clean", "sync", "patches", "overlay"}) {
      std::cerr << "stages:"; for (const auto& s : report.stages) std::cerr << " " << s; std::cerr << "\n"; rc = 1;
    }
    if (tree.exists("out/Default_arm64/chrome") || tree.exists("scratch.txt")) { std::cerr << "clean\n"; rc = 1; }
    if (!report.sync || report.sync->head != "c-130.0.6723.58") { std::cerr << "sync\n"; rc = 1; }
    if (tree.text("chrome/app/branding.h") != "#define NAME \"Fork\"\n" || tree.text("chrome/browser/panel.cc") != "// panel\n") {
      std::cerr << "patches\n"; rc = 1;
    }
    if (tree.text("chrome/browser/resources/side_panel/index.html") != "<html></html>\n" ||
        tree.text("chrome/browser/resources/agent_side_panel/agent.js") != "agent();\n") {
      std::cerr << "overlay\n"; rc = 1;
    }
    if (!report.overlay || report.overlay->skipped.size() != 1) { std::cerr << "optional icons not skipped\n"; rc = 1; }
    if (report.output_dir != "out/Default_arm64") { std::cerr << "output dir\n"; rc = 1; }
  } catch (const std::exception& e) {
    std::cerr << "first run: " << e.what() << "\n"; rc = 1;
  }

  // Second run without reset or clean: the tree is already patched.
  settings.clean = false;
  settings.reset = false;
  settings.sync = true;
  settings.sync_options.reset_tracked = false;
  settings.sync_options.clean_untracked = false;
  try {
    const auto report = patchwright::Pipeline(settings, tree, vcs).run();
    if (!report.patches || !report.patches->no_op() ||
        report.patches->ids_in(PatchState::AlreadyApplied).size() != 2) {
      std::cerr << "second run should be a no-op\n"; rc = 1;
    }
    if (patchwright::Ledger::load(tree).entries().size() != 2) { std::cerr << "ledger\n"; rc = 1; }
  } catch (const std::exception& e) {
    std::cerr << "second run: " << e.what() << "\n"; rc = 1;
  }

  // A missing required overlay source fails the run after patching.
  fs::remove_all(root / "resources/agent_side_panel");
  bool caught = false;
  try {
    (void)patchwright::Pipeline(settings, tree, vcs).run();
  } catch (const patchwright::ResourceMissingError &) {
    caught = true;
  }
  if (!caught) { std::cerr << "missing overlay source accepted\n"; rc = 1; }

  // An interrupt stops before the first stage.
  patchwright::interrupt::request();
  caught = false;
  try {
    (void)patchwright::Pipeline(settings, tree, vcs).run();
  } catch (const patchwright::Interrupted &) {
    caught = true;
  }
  patchwright::interrupt::reset();
  if (!caught) { std::cerr << "interrupt ignored\n"; rc = 1; }

  // Missing version file
  fs::remove(root / "UPSTREAM_VERSION");
  caught = false;
  try {
    (void)patchwright::Pipeline(settings, tree, vcs).run();
  } catch (const patchwright::ConfigError &) {
    caught = true;
  }
  if (!caught) { std::cerr << "missing version file accepted\n"; rc = 1; }

  fs::remove_all(root);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
