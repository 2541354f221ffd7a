#include "patchwright/config.hpp"
#include "patchwright/errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using patchwright::Arch;
using patchwright::Variant;

// Answers every question with the next scripted reply and records it.
class ScriptedPrompt final : public patchwright::PromptProvider {
public:
  explicit ScriptedPrompt(bool answer) : answer_(answer) {}
  bool confirm(std::string_view question) override {
    asked.emplace_back(question);
    return answer_;
  }
  std::vector<std::string> asked;

private:
  bool answer_;
};

static bool config_error(const fs::path& file) {
  patchwright::SettingsOverrides cli;
  cli.config_file = file;
  patchwright::DefaultsPrompt prompt;
  try {
    (void)patchwright::resolve_settings(file.parent_path(), cli, prompt);
  } catch (const patchwright::ConfigError &) {
    return true;
  }
  return false;
}

int main() {
  int rc = 0;
  const fs::path root = fs::temp_directory_path() / ("patchwright_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  const auto file = root / "build.yaml";

  try {
    // Defaults with a non-interactive prompt: nothing optional happens.
    {
      patchwright::DefaultsPrompt prompt;
      const auto s = patchwright::resolve_settings(root, {}, prompt);
      if (s.clean || s.reset || s.sync || s.apply_patches || s.sign || s.package || !s.build) {
        std::cerr << "default switches\n"; rc = 1;
      }
      if (s.source != root / "upstream_src" || s.version_file != root / "UPSTREAM_VERSION" ||
          s.variant != Variant::Debug || s.arch != Arch::Arm64 || s.overlays.size() != 3 ||
          s.targets != std::vector<std::string>{"chrome", "chromedriver"}) {
        std::cerr << "default settings\n"; rc = 1;
      }
      if (s.overlays[2].required) { std::cerr << "icons overlay should be optional\n"; rc = 1; }
    }

    std::ofstream(file) << "build:\n"
                           "  type: release\n"
                           "  architecture: arm64\n"
                           "steps:\n"
                           "  clean: true\n"
                           "  git_setup: true\n"
                           "  apply_patches: true\n"
                           "  sign: false\n"
                           "paths:\n"
                           "  chromium_src: ../chromium/src\n"
                           "  sign_script: /opt/sign.sh\n"
                           "sync:\n"
                           "  fetch_depth: 1\n"
                           "  exclusions: [third_party/, out/]\n"
                           "  shallow: false\n"
                           "gn_flags:\n"
                           "  file: [build/flags/base.gn, build/flags/release.gn]\n"
                           "targets: [chrome]\n"
                           "overlays:\n"
                           "  - source: assets/panel\n"
                           "    destination: chrome/browser/resources/panel\n"
                           "  - source: assets/extra\n"
                           "    destination: chrome/extra\n"
                           "    required: false\n"
                           "tools:\n"
                           "  ninja: ninja\n"
                           "logging:\n"
                           "  level: warn\n";

    // File values, command line wins over the file, prompts fill the rest.
    {
      patchwright::SettingsOverrides cli;
      cli.config_file = file;
      cli.arch = Arch::X64;
      cli.steps.clean = false;
      ScriptedPrompt prompt{true};
      const auto s = patchwright::resolve_settings(root, cli, prompt);
      if (s.variant != Variant::Release || s.arch != Arch::X64) { std::cerr << "variant/arch\n"; rc = 1; }
      if (s.clean || s.sync_options.clean_untracked) { std::cerr << "cli clean should win\n"; rc = 1; }
      if (!s.sync || !s.apply_patches || s.sign) { std::cerr << "file switches\n"; rc = 1; }
      if (!s.reset || !s.package || !s.sync_options.reset_tracked) { std::cerr << "prompted switches\n"; rc = 1; }
      if (prompt.asked.size() != 2) { std::cerr << "asked " << prompt.asked.size() << " questions\n"; rc = 1; }
      if (s.source != root / "../chromium/src" || s.scripts.sign != "/opt/sign.sh") { std::cerr << "paths\n"; rc = 1; }
      if (s.sync_options.fetch_depth != 1 || s.sync_options.shallow_dependencies ||
          s.sync_options.exclusions != std::vector<std::string>{"third_party/", "out/"}) {
        std::cerr << "sync options\n"; rc = 1;
      }
      if (s.flag_fragments.size() != 2 || s.flag_fragments[1] != root / "build/flags/release.gn") {
        std::cerr << "gn_flags\n"; rc = 1;
      }
      if (s.targets != std::vector<std::string>{"chrome"} || s.build_tools.ninja != "ninja" ||
          s.build_tools.gn != "gn" || s.log_level != "warn") {
        std::cerr << "targets/tools/logging\n"; rc = 1;
      }
      if (s.overlays.size() != 2 || !s.overlays[0].required || s.overlays[1].required ||
          s.overlays[0].source != root / "assets/panel") {
        std::cerr << "overlays\n"; rc = 1;
      }
    }

    // Terminal prompt: only an explicit yes counts.
    {
      std::istringstream in("y\n\nyes\nn\n");
      std::ostringstream out;
      patchwright::InteractivePrompt prompt{in, out};
      const auto s = patchwright::resolve_settings(root, {}, prompt);
      if (!s.clean || s.reset || !s.apply_patches || s.sign || s.package) { std::cerr << "interactive answers\n"; rc = 1; }
      if (out.str().find("[y/N]") == std::string::npos) { std::cerr << "question not shown\n"; rc = 1; }
    }
  } catch (const std::exception& e) {
    std::cerr << "unexpected: " << e.what() << "\n"; rc = 1;
  }

  std::ofstream(file) << "build:\n  type: fast\n";
  if (!config_error(file)) { std::cerr << "bad build type accepted\n"; rc = 1; }
  std::ofstream(file) << "build: [unterminated\n";
  if (!config_error(file)) { std::cerr << "malformed yaml accepted\n"; rc = 1; }
  std::ofstream(file) << "sync:\n  exclusions: []\n";
  if (!config_error(file)) { std::cerr << "empty exclusions accepted\n"; rc = 1; }
  std::ofstream(file) << "steps:\n  clean: maybe\n";
  if (!config_error(file)) { std::cerr << "non-boolean switch accepted\n"; rc = 1; }
  if (!config_error(root / "absent.yaml")) { std::cerr << "missing file accepted\n"; rc = 1; }

  fs::remove_all(root);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
