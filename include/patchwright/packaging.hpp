#pragma once
#include "patchwright/build_flags.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace patchwright {

// External scripts run after a successful build. Empty paths are unset.
struct PackagingScripts {
  std::filesystem::path sign;    // sign <out_dir> <arch>
  std::filesystem::path package; // package <out_dir> <arch>
  std::filesystem::path icons;   // icons <image> <output_dir>
};

// Boundary to the signing/packaging and icon pipelines; only their invocation
// contract is known here.
class PackagingBridge {
public:
  PackagingBridge(std::filesystem::path source_root, PackagingScripts scripts);

  // Run the signing script, then the packaging script, each when requested.
  // Throws ConfigError if a requested script is not configured or missing,
  // BuildError if it fails.
  void sign_and_package(const std::filesystem::path& out_dir, Arch arch, bool sign,
                        bool package) const;

  // Generate the icon set from `image` into `out_dir`. A missing image only
  // warns and returns false.
  bool generate_icons(const std::filesystem::path& image,
                      const std::filesystem::path& out_dir) const;

private:
  void run_script(const char *what, const std::filesystem::path& script,
                  const std::vector<std::string>& args) const;

  std::filesystem::path root_;
  PackagingScripts scripts_;
};

} // namespace patchwright
