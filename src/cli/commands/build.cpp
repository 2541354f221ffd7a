#include "cli/command.hpp"
#include "patchwright/config.hpp"
#include "patchwright/errors.hpp"
#include "patchwright/log.hpp"
#include "patchwright/pipeline.hpp"
#include "patchwright/vcs.hpp"
#include "patchwright/working_tree.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

void usage() {
  std::cerr << "usage: patchwright build [options] [arm64|x64]\n"
               "  -c, --config FILE       YAML build configuration\n"
               "  -S, --source DIR        upstream source tree\n"
               "  -r, --release           release build (default debug)\n"
               "  -t, --build-type TYPE   debug|release\n"
               "  -y, --non-interactive   do not prompt; unset switches stay off\n"
               "  -C, --clean             remove build output and untracked files\n"
               "  -R, --reset             discard tracked modifications before syncing\n"
               "  -g, --sync              fetch and check out the pinned revision\n"
               "  -p, --apply-patches     apply patches and resource overlays\n"
               "  -b, --build             run the build (default)\n"
               "  -B, --no-build          skip the build\n"
               "  -s, --sign              sign the result\n"
               "  -P, --package           package the result\n"
               "  -v, --verbose           debug logging\n";
}

} // namespace

int cmd_build(int argc, char **argv) {
  patchwright::SettingsOverrides cli;
  bool non_interactive = false;
  std::string arch;
  try {
    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      const auto value = [&]() -> std::string {
        if (i + 1 >= argc)
          throw patchwright::ConfigError("option " + a + " needs a value");
        return argv[++i];
      };
      if (a == "-c" || a == "--config") {
        cli.config_file = value();
      } else if (a == "-S" || a == "--source") {
        cli.source = value();
      } else if (a == "-r" || a == "--release") {
        cli.variant = patchwright::Variant::Release;
      } else if (a == "-t" || a == "--build-type") {
        cli.variant = patchwright::parse_variant(value());
      } else if (a == "-y" || a == "--non-interactive") {
        non_interactive = true;
      } else if (a == "-C" || a == "--clean") {
        cli.steps.clean = true;
      } else if (a == "-R" || a == "--reset") {
        cli.steps.reset = true;
      } else if (a == "-g" || a == "--sync") {
        cli.steps.sync = true;
      } else if (a == "-p" || a == "--apply-patches") {
        cli.steps.apply_patches = true;
      } else if (a == "-b" || a == "--build") {
        cli.steps.build = true;
      } else if (a == "-B" || a == "--no-build") {
        cli.steps.build = false;
      } else if (a == "-s" || a == "--sign") {
        cli.steps.sign = true;
      } else if (a == "-P" || a == "--package") {
        cli.steps.package = true;
      } else if (a == "-v" || a == "--verbose") {
        cli.verbose = true;
      } else if (a == "-h" || a == "--help") {
        usage();
        return 0;
      } else if (!a.starts_with('-') && arch.empty()) {
        arch = a;
      } else {
        std::cerr << "build: unexpected argument '" << a << "'\n";
        usage();
        return 2;
      }
    }
    if (!arch.empty())
      cli.arch = patchwright::parse_arch(arch);
  } catch (const patchwright::ConfigError &e) {
    std::cerr << "build: " << e.what() << "\n";
    usage();
    return 2;
  }

  try {
    patchwright::DefaultsPrompt defaults;
    patchwright::InteractivePrompt interactive{std::cin, std::cerr};
    patchwright::PromptProvider &prompt =
        non_interactive ? static_cast<patchwright::PromptProvider &>(defaults) : interactive;

    const auto settings =
        patchwright::resolve_settings(std::filesystem::current_path(), cli, prompt);
    patchwright::log::init(patchwright::log::parse_level(settings.log_level));

    std::error_code ec;
    if (!std::filesystem::is_directory(settings.source, ec))
      throw patchwright::ConfigError("source tree not found: " + settings.source.string());

    patchwright::DiskWorkingTree tree{settings.source};
    patchwright::GitVcs vcs{settings.source, settings.git_tool, settings.gclient_tool};
    patchwright::Pipeline pipeline{settings, tree, vcs};
    const auto report = pipeline.run();

    std::cout << "Upstream: " << report.revision.id << "\n";
    if (report.patches) {
      std::cout << "Patches: " << report.patches->ids_in(patchwright::PatchState::Applied).size()
                << " applied, "
                << report.patches->ids_in(patchwright::PatchState::AlreadyApplied).size()
                << " already applied\n";
    }
    std::cout << "Output: " << report.output_dir << "\n";
    return 0;
  } catch (const std::exception &e) {
    return patchwright::cli::report_error("build", e);
  }
}
