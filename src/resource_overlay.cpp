#include "patchwright/resource_overlay.hpp"

#include "patchwright/errors.hpp"
#include "patchwright/fs.hpp"
#include "patchwright/log.hpp"
#include "patchwright/working_tree.hpp"

namespace patchwright {

OverlayReport overlay(WorkingTree &tree, const std::vector<OverlaySpec> &specs) {
  auto logger = log::get();
  OverlayReport report;

  std::vector<const OverlaySpec *> present;
  for (const auto &spec : specs) {
    try {
      check_relative(spec.destination);
    } catch (const std::runtime_error &e) {
      throw ConfigError(std::string("overlay destination: ") + e.what());
    }
    std::error_code ec;
    if (std::filesystem::is_directory(spec.source, ec)) {
      present.push_back(&spec);
      continue;
    }
    if (spec.required)
      throw ResourceMissingError(spec.source.string());
    logger->warn("optional overlay source {} not found, skipping", spec.source.string());
    report.skipped.push_back(spec.source.string());
  }

  for (const auto *spec : present) {
    const auto files = fs::list_files(spec->source);
    for (const auto &rel : files) {
      const std::string dest = spec->destination + "/" + rel;
      tree.write(dest, fs::read_file(spec->source / rel));
      report.written.push_back(dest);
    }
    logger->info("overlay {} -> {} ({} files)", spec->source.string(), spec->destination,
                 files.size());
  }
  return report;
}

OverlaySpec parse_overlay_spec(std::string_view text) {
  OverlaySpec spec;
  if (text.starts_with('?')) {
    spec.required = false;
    text.remove_prefix(1);
  }
  const auto colon = text.rfind(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size())
    throw ConfigError("overlay must be <source>:<destination>: " + std::string(text));
  spec.source = std::string(text.substr(0, colon));
  spec.destination = std::string(text.substr(colon + 1));
  while (spec.destination.ends_with('/'))
    spec.destination.pop_back();
  return spec;
}

} // namespace patchwright
