#include "patchwright/build_invoker.hpp"

#include "patchwright/errors.hpp"
#include "patchwright/interrupt.hpp"
#include "patchwright/log.hpp"
#include "patchwright/process.hpp"
#include "patchwright/util.hpp"

namespace patchwright {

BuildInvoker::BuildInvoker(std::filesystem::path source_root, BuildTools tools)
    : root_(std::move(source_root)), tools_(std::move(tools)) {}

void BuildInvoker::run_tool(const std::string &tool, const std::vector<std::string> &args) const {
  Command cmd{tool};
  cmd.args(args).cwd(root_).passthrough(true);
  log::get()->info("$ {}", cmd.display());
  ProcessResult res;
  try {
    res = cmd.run();
  } catch (const std::runtime_error &e) {
    throw BuildError(tool, -1, e.what());
  }
  interrupt::check();
  if (!res.ok())
    throw BuildError(tool, res.exit_status, std::move(res.output));
}

void BuildInvoker::invoke(const std::string &out_dir, const std::vector<std::string> &targets) const {
  if (targets.empty())
    throw ConfigError("no build targets given");
  run_tool(tools_.gn, {"gen", out_dir, "--fail-on-unused-args"});

  std::vector<std::string> args{"-C", out_dir};
  args.insert(args.end(), targets.begin(), targets.end());
  run_tool(tools_.ninja, args);
  log::get()->info("built {} in {}", strutil::join(targets, " "), out_dir);
}

} // namespace patchwright
