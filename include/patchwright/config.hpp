#pragma once
#include "patchwright/build_flags.hpp"
#include "patchwright/build_invoker.hpp"
#include "patchwright/packaging.hpp"
#include "patchwright/resource_overlay.hpp"
#include "patchwright/tree_sync.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

// Pipeline switches as given by a source; nullopt = that source is silent.
struct StepSwitches {
  std::optional<bool> clean;         // remove the build output (and untracked files when syncing)
  std::optional<bool> reset;         // discard tracked modifications (implies sync)
  std::optional<bool> sync;          // fetch + checkout the pinned revision
  std::optional<bool> apply_patches; // patch stack + resource overlays
  std::optional<bool> build;
  std::optional<bool> sign;
  std::optional<bool> package;

  // Fill every unset field from `lower`.
  void merge_under(const StepSwitches& lower);
};

// The single configuration object of one run.
struct BuildSettings {
  std::filesystem::path root;   // fork checkout: version file, patches, fragments, resources
  std::filesystem::path source; // upstream working tree
  Variant variant = Variant::Debug;
  Arch arch = Arch::Arm64;

  bool clean = false;
  bool reset = false;
  bool sync = false;
  bool apply_patches = false;
  bool build = true;
  bool sign = false;
  bool package = false;

  SyncOptions sync_options;
  std::filesystem::path version_file;
  std::filesystem::path patches_dir;
  std::filesystem::path fragments_dir;
  std::vector<std::filesystem::path> flag_fragments; // explicit list overrides fragments_dir
  std::vector<OverlaySpec> overlays;
  std::vector<std::string> targets;
  BuildTools build_tools;
  std::string git_tool{consts::kGitTool};
  std::string gclient_tool{consts::kGclientTool};
  PackagingScripts scripts;
  std::filesystem::path icon_image;
  std::filesystem::path icon_output; // where the icon generator writes
  std::string log_level = "info";

  // Whether the sync stage runs at all.
  [[nodiscard]] bool sync_stage() const { return sync || reset; }
};

// Defaults for a fork checked out at `root`.
BuildSettings default_settings(const std::filesystem::path& root);

// Merge a YAML build configuration into `settings`; step switches the file
// sets go to `steps`. Relative paths are taken relative to settings.root.
// Throws ConfigError on unreadable/malformed files and invalid values.
void apply_config_file(const std::filesystem::path& file, BuildSettings& settings,
                       StepSwitches& steps);

// Source of answers for switches nobody set.
class PromptProvider {
public:
  virtual ~PromptProvider() = default;
  virtual bool confirm(std::string_view question) = 0;
};

// Asks on a terminal; anything but y/yes (including just enter) means no.
class InteractivePrompt final : public PromptProvider {
public:
  InteractivePrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}
  bool confirm(std::string_view question) override;

private:
  std::istream& in_;
  std::ostream& out_;
};

// Non-interactive: never performs an action nobody asked for.
class DefaultsPrompt final : public PromptProvider {
public:
  bool confirm(std::string_view /*question*/) override { return false; }
};

// Everything the command line supplied.
struct SettingsOverrides {
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> source;
  std::optional<Variant> variant;
  std::optional<Arch> arch;
  StepSwitches steps;
  bool verbose = false;
};

// defaults < config file < command line < prompt answers.
BuildSettings resolve_settings(const std::filesystem::path& root, const SettingsOverrides& cli,
                               PromptProvider& prompt);

} // namespace patchwright
