#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

enum class Variant : std::uint8_t { Debug, Release };
enum class Arch : std::uint8_t { Arm64, X64 };

// Throw ConfigError on anything but "debug"/"release" and "arm64"/"x64".
Variant parse_variant(std::string_view s);
Arch parse_arch(std::string_view s);
const char *to_string(Variant v);
const char *to_string(Arch a);

// "Default_<arch>" for debug, "Release_<arch>" for release.
std::string output_dir_name(Variant v, Arch a);

struct BuildConfiguration {
  Variant variant = Variant::Debug;
  Arch arch = Arch::Arm64;
  std::string out_dir_name;
  std::string content; // the args.gn text
};

// Concatenate `fragments` verbatim in order and append `target_cpu = "<arch>"`.
// Every fragment must exist (ConfigError otherwise).
BuildConfiguration compose(const std::vector<std::filesystem::path>& fragments, Variant v,
                           Arch a);

// Fragments from `fragments_dir`: base.gn (if present), then <variant>.gn.
BuildConfiguration compose(const std::filesystem::path& fragments_dir, Variant v, Arch a);

class WorkingTree;

// "out/<out_dir_name>" inside the source tree.
std::string output_dir(const BuildConfiguration& config);

// Write <output_dir>/args.gn into the tree. An existing file is only replaced
// when `fresh`. Returns true if the file was written.
bool materialize(const BuildConfiguration& config, WorkingTree& tree, bool fresh);

} // namespace patchwright
