#include "patchwright/config.hpp"

#include "patchwright/errors.hpp"
#include "patchwright/fs.hpp"
#include "patchwright/log.hpp"
#include "patchwright/util.hpp"

#include <algorithm>
#include <istream>
#include <ostream>

#include <yaml-cpp/yaml.h>

namespace patchwright {

namespace {

constexpr std::string_view kSidePanelSrc = "resources/side_panel";
constexpr std::string_view kSidePanelDest = "chrome/browser/resources/side_panel";
constexpr std::string_view kAgentPanelSrc = "resources/agent_side_panel";
constexpr std::string_view kAgentPanelDest = "chrome/browser/resources/agent_side_panel";
constexpr std::string_view kIconsSrc = "resources/icons";
constexpr std::string_view kIconsDest = "chrome/app/theme/chromium";

std::filesystem::path under_root(const BuildSettings &s, const std::string &p) {
  const std::filesystem::path path{p};
  return path.is_absolute() ? path : s.root / path;
}

void expect_map(const YAML::Node &node, const char *section) {
  if (node && !node.IsMap())
    throw ConfigError(std::string("section '") + section + "' must be a mapping");
}

std::vector<std::string> string_list(const YAML::Node &node, const char *key) {
  std::vector<std::string> out;
  if (node.IsScalar()) {
    out.push_back(node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto &item : node)
      out.push_back(item.as<std::string>());
  } else {
    throw ConfigError(std::string("'") + key + "' must be a string or a list of strings");
  }
  return out;
}

void read_switch(const YAML::Node &section, const char *key, std::optional<bool> &out) {
  if (const auto n = section[key])
    out = n.as<bool>();
}

void read_string(const YAML::Node &section, const char *key, std::string &out) {
  if (const auto n = section[key])
    out = n.as<std::string>();
}

void read_path(const YAML::Node &section, const char *key, const BuildSettings &s,
               std::filesystem::path &out) {
  if (const auto n = section[key])
    out = under_root(s, n.as<std::string>());
}

void warn_unknown(const YAML::Node &section, const char *name,
                  std::initializer_list<std::string_view> known) {
  for (const auto &kv : section) {
    const auto key = kv.first.as<std::string>();
    if (std::find(known.begin(), known.end(), key) == known.end())
      log::get()->warn("config: ignoring unknown key '{}.{}'", name, key);
  }
}

void apply_yaml(const YAML::Node &doc, BuildSettings &s, StepSwitches &steps) {
  if (!doc.IsMap())
    throw ConfigError("top level must be a mapping");

  if (const auto build = doc["build"]) {
    expect_map(build, "build");
    warn_unknown(build, "build", {"type", "architecture"});
    if (const auto n = build["type"])
      s.variant = parse_variant(n.as<std::string>());
    if (const auto n = build["architecture"])
      s.arch = parse_arch(n.as<std::string>());
  }

  if (const auto st = doc["steps"]) {
    expect_map(st, "steps");
    warn_unknown(st, "steps",
                 {"clean", "reset", "git_setup", "sync", "apply_patches", "build", "sign", "package"});
    read_switch(st, "clean", steps.clean);
    read_switch(st, "reset", steps.reset);
    read_switch(st, "git_setup", steps.sync);
    read_switch(st, "sync", steps.sync);
    read_switch(st, "apply_patches", steps.apply_patches);
    read_switch(st, "build", steps.build);
    read_switch(st, "sign", steps.sign);
    read_switch(st, "package", steps.package);
  }

  if (const auto paths = doc["paths"]) {
    expect_map(paths, "paths");
    warn_unknown(paths, "paths",
                 {"chromium_src", "source", "version_file", "patches", "fragments", "sign_script",
                  "package_script", "icon_script", "icon_image", "icon_output"});
    read_path(paths, "chromium_src", s, s.source);
    read_path(paths, "source", s, s.source);
    read_path(paths, "version_file", s, s.version_file);
    read_path(paths, "patches", s, s.patches_dir);
    read_path(paths, "fragments", s, s.fragments_dir);
    read_path(paths, "sign_script", s, s.scripts.sign);
    read_path(paths, "package_script", s, s.scripts.package);
    read_path(paths, "icon_script", s, s.scripts.icons);
    read_path(paths, "icon_image", s, s.icon_image);
    read_path(paths, "icon_output", s, s.icon_output);
  }

  if (const auto sy = doc["sync"]) {
    expect_map(sy, "sync");
    warn_unknown(sy, "sync",
                 {"fetch_depth", "clean_scopes", "exclusions", "dependencies", "shallow"});
    if (const auto n = sy["fetch_depth"]) {
      s.sync_options.fetch_depth = n.as<int>();
      if (s.sync_options.fetch_depth < 0)
        throw ConfigError("sync.fetch_depth must not be negative");
    }
    if (const auto n = sy["clean_scopes"])
      s.sync_options.clean_scopes = string_list(n, "sync.clean_scopes");
    if (const auto n = sy["exclusions"]) {
      s.sync_options.exclusions = string_list(n, "sync.exclusions");
      if (s.sync_options.exclusions.empty())
        throw ConfigError("sync.exclusions must not be empty");
    }
    if (const auto n = sy["dependencies"])
      s.sync_options.sync_dependencies = n.as<bool>();
    if (const auto n = sy["shallow"])
      s.sync_options.shallow_dependencies = n.as<bool>();
  }

  if (const auto gn = doc["gn_flags"]) {
    expect_map(gn, "gn_flags");
    warn_unknown(gn, "gn_flags", {"file"});
    if (const auto n = gn["file"]) {
      s.flag_fragments.clear();
      for (const auto &f : string_list(n, "gn_flags.file"))
        s.flag_fragments.push_back(under_root(s, f));
    }
  }

  if (const auto t = doc["targets"]) {
    s.targets = string_list(t, "targets");
    if (s.targets.empty())
      throw ConfigError("targets must not be empty");
  }

  if (const auto ov = doc["overlays"]) {
    if (!ov.IsSequence())
      throw ConfigError("'overlays' must be a list");
    s.overlays.clear();
    for (const auto &item : ov) {
      if (!item.IsMap() || !item["source"] || !item["destination"])
        throw ConfigError("each overlay needs 'source' and 'destination'");
      OverlaySpec spec{.source = under_root(s, item["source"].as<std::string>()),
                       .destination = item["destination"].as<std::string>(),
                       .required = item["required"] ? item["required"].as<bool>() : true};
      s.overlays.push_back(std::move(spec));
    }
  }

  if (const auto tools = doc["tools"]) {
    expect_map(tools, "tools");
    warn_unknown(tools, "tools", {"gn", "ninja", "git", "gclient"});
    read_string(tools, "gn", s.build_tools.gn);
    read_string(tools, "ninja", s.build_tools.ninja);
    read_string(tools, "git", s.git_tool);
    read_string(tools, "gclient", s.gclient_tool);
  }

  if (const auto lg = doc["logging"]) {
    expect_map(lg, "logging");
    read_string(lg, "level", s.log_level);
    (void)log::parse_level(s.log_level);
  }
}

} // namespace

void StepSwitches::merge_under(const StepSwitches &lower) {
  if (!clean)
    clean = lower.clean;
  if (!reset)
    reset = lower.reset;
  if (!sync)
    sync = lower.sync;
  if (!apply_patches)
    apply_patches = lower.apply_patches;
  if (!build)
    build = lower.build;
  if (!sign)
    sign = lower.sign;
  if (!package)
    package = lower.package;
}

BuildSettings default_settings(const std::filesystem::path &root) {
  BuildSettings s;
  s.root = root;
  s.source = root / consts::kSourceDir;
  s.version_file = root / consts::kVersionFile;
  s.patches_dir = root / consts::kPatchesDir;
  s.fragments_dir = root / consts::kFragmentsDir;
  s.overlays = {
      OverlaySpec{.source = root / kSidePanelSrc, .destination = std::string(kSidePanelDest)},
      OverlaySpec{.source = root / kAgentPanelSrc, .destination = std::string(kAgentPanelDest)},
      OverlaySpec{.source = root / kIconsSrc,
                  .destination = std::string(kIconsDest),
                  .required = false},
  };
  s.targets.assign(consts::kDefaultTargets.begin(), consts::kDefaultTargets.end());
  s.icon_output = root / kIconsSrc;
  return s;
}

void apply_config_file(const std::filesystem::path &file, BuildSettings &settings,
                       StepSwitches &steps) {
  if (!fs::exists(file))
    throw ConfigError("config file not found: " + file.string());
  try {
    apply_yaml(YAML::LoadFile(file.string()), settings, steps);
  } catch (const YAML::Exception &e) {
    throw ConfigError(file.string() + ": " + e.what());
  } catch (const ConfigError &e) {
    throw ConfigError(file.string() + ": " + e.what());
  }
  log::get()->info("loaded config from {}", file.string());
}

bool InteractivePrompt::confirm(std::string_view question) {
  out_ << question << " [y/N] " << std::flush;
  std::string line;
  if (!std::getline(in_, line))
    return false;
  const std::string answer = strutil::trim(line);
  return answer == "y" || answer == "Y" || answer == "yes" || answer == "Yes";
}

BuildSettings resolve_settings(const std::filesystem::path &root, const SettingsOverrides &cli,
                               PromptProvider &prompt) {
  BuildSettings s = default_settings(root);
  StepSwitches file_steps;
  if (cli.config_file)
    apply_config_file(*cli.config_file, s, file_steps);

  if (cli.source)
    s.source = std::filesystem::absolute(*cli.source);
  if (cli.variant)
    s.variant = *cli.variant;
  if (cli.arch)
    s.arch = *cli.arch;
  if (cli.verbose)
    s.log_level = "debug";

  StepSwitches steps = cli.steps;
  steps.merge_under(file_steps);

  const auto ask = [&](std::optional<bool> &value, std::string_view question) {
    if (!value)
      value = prompt.confirm(question);
  };
  ask(steps.clean, "Clean the build output directory and untracked files?");
  ask(steps.reset, "Reset tracked files in the source tree (local edits are lost)?");
  ask(steps.apply_patches, "Apply patches and resource overlays?");
  ask(steps.sign, "Sign the build?");
  ask(steps.package, "Package the build?");

  s.clean = *steps.clean;
  s.reset = *steps.reset;
  s.apply_patches = *steps.apply_patches;
  s.sign = *steps.sign;
  s.package = *steps.package;
  s.sync = steps.sync.value_or(false);
  s.build = steps.build.value_or(true);
  s.sync_options.reset_tracked = s.reset;
  s.sync_options.clean_untracked = s.clean;
  return s;
}

} // namespace patchwright
