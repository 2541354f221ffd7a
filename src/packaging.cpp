#include "patchwright/packaging.hpp"

#include "patchwright/errors.hpp"
#include "patchwright/fs.hpp"
#include "patchwright/interrupt.hpp"
#include "patchwright/log.hpp"
#include "patchwright/process.hpp"

namespace patchwright {

PackagingBridge::PackagingBridge(std::filesystem::path source_root, PackagingScripts scripts)
    : root_(std::move(source_root)), scripts_(std::move(scripts)) {}

void PackagingBridge::run_script(const char *what, const std::filesystem::path &script,
                                 const std::vector<std::string> &args) const {
  if (script.empty())
    throw ConfigError(std::string(what) + " requested but no script is configured");
  if (!fs::exists(script))
    throw ConfigError(std::string(what) + " script not found: " + script.string());

  Command cmd{script.string()};
  cmd.args(args).cwd(root_).env("PATCHWRIGHT_SOURCE", root_.string()).passthrough(true);
  log::get()->info("{}: {}", what, cmd.display());
  ProcessResult res;
  try {
    res = cmd.run();
  } catch (const std::runtime_error &e) {
    throw BuildError(script.filename().string(), -1, e.what());
  }
  interrupt::check();
  if (!res.ok())
    throw BuildError(script.filename().string(), res.exit_status, std::move(res.output));
}

void PackagingBridge::sign_and_package(const std::filesystem::path &out_dir, Arch arch, bool sign,
                                       bool package) const {
  const std::string dir = (root_ / out_dir).lexically_normal().string();
  if (sign)
    run_script("sign", scripts_.sign, {dir, to_string(arch)});
  if (package)
    run_script("package", scripts_.package, {dir, to_string(arch)});
}

bool PackagingBridge::generate_icons(const std::filesystem::path &image,
                                     const std::filesystem::path &out_dir) const {
  if (!fs::exists(image)) {
    log::get()->warn("icon source {} not found, keeping existing icons", image.string());
    return false;
  }
  run_script("icons", scripts_.icons, {image.string(), out_dir.string()});
  return true;
}

} // namespace patchwright
