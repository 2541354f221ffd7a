#pragma once
#include "patchwright/consts.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace patchwright {

struct BuildTools {
  std::string gn{consts::kGnTool};
  std::string ninja{consts::kNinjaTool};
};

// Runs the external build-file generator and build runner in the source tree.
class BuildInvoker {
public:
  explicit BuildInvoker(std::filesystem::path source_root, BuildTools tools = {});

  // `gn gen <out_dir>` then `autoninja -C <out_dir> <targets...>`, with
  // `out_dir` relative to the source root. Output streams to the terminal.
  // Throws BuildError with the tool's exit status and output on failure.
  void invoke(const std::string& out_dir, const std::vector<std::string>& targets) const;

private:
  void run_tool(const std::string& tool, const std::vector<std::string>& args) const;

  std::filesystem::path root_;
  BuildTools tools_;
};

} // namespace patchwright
