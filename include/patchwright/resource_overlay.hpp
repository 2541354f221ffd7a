#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

class WorkingTree;

// Fork-owned asset directory copied over a fixed location inside the tree.
struct OverlaySpec {
  std::filesystem::path source;
  std::string destination; // tree-relative directory
  bool required = true;    // missing optional sources only warn
};

struct OverlayReport {
  std::vector<std::string> written; // tree-relative files, in copy order
  std::vector<std::string> skipped; // optional sources that were missing
};

// Recursive, overwrite-in-place copy of every spec; files already at the
// destination that the source lacks are left alone. Throws
// ResourceMissingError before writing anything if a required source is missing.
OverlayReport overlay(WorkingTree& tree, const std::vector<OverlaySpec>& specs);

// "<source>:<destination>"; a leading '?' marks the overlay optional.
OverlaySpec parse_overlay_spec(std::string_view text);

} // namespace patchwright
