#include "patchwright/build_flags.hpp"

#include "patchwright/consts.hpp"
#include "patchwright/errors.hpp"
#include "patchwright/fs.hpp"
#include "patchwright/log.hpp"
#include "patchwright/working_tree.hpp"

namespace patchwright {

Variant parse_variant(std::string_view s) {
  if (s == "debug")
    return Variant::Debug;
  if (s == "release")
    return Variant::Release;
  throw ConfigError("unknown build type '" + std::string(s) + "' (debug|release)");
}

Arch parse_arch(std::string_view s) {
  if (s == "arm64")
    return Arch::Arm64;
  if (s == "x64")
    return Arch::X64;
  throw ConfigError("unknown architecture '" + std::string(s) + "' (arm64|x64)");
}

const char *to_string(Variant v) { return v == Variant::Release ? "release" : "debug"; }

const char *to_string(Arch a) { return a == Arch::X64 ? "x64" : "arm64"; }

std::string output_dir_name(Variant v, Arch a) {
  return std::string(v == Variant::Release ? "Release_" : "Default_") + to_string(a);
}

BuildConfiguration compose(const std::vector<std::filesystem::path> &fragments, Variant v,
                           Arch a) {
  BuildConfiguration out{.variant = v, .arch = a, .out_dir_name = output_dir_name(v, a),
                         .content = {}};
  for (const auto &f : fragments) {
    if (!fs::exists(f))
      throw ConfigError("flag fragment not found: " + f.string());
    // Each fragment contributes whole lines.
    out.content += fs::read_text(f);
    if (!out.content.empty() && out.content.back() != consts::kLF)
      out.content += consts::kLF;
  }
  out.content += "target_cpu = \"";
  out.content += to_string(a);
  out.content += "\"\n";
  return out;
}

BuildConfiguration compose(const std::filesystem::path &fragments_dir, Variant v, Arch a) {
  std::vector<std::filesystem::path> fragments;
  if (const auto base = fragments_dir / consts::kBaseFragment; fs::exists(base))
    fragments.push_back(base);
  fragments.push_back(fragments_dir / (std::string(to_string(v)) + ".gn"));
  return compose(fragments, v, a);
}

std::string output_dir(const BuildConfiguration &config) {
  return std::string(consts::kOutDir) + "/" + config.out_dir_name;
}

bool materialize(const BuildConfiguration &config, WorkingTree &tree, bool fresh) {
  const std::string path = output_dir(config) + "/" + std::string(consts::kArgsFile);
  if (!fresh && tree.exists(path)) {
    if (fs::as_text(tree.read(path)) != config.content)
      log::get()->warn("{} differs from the composed flags; clean build to regenerate", path);
    return false;
  }
  tree.write(path, fs::as_bytes(config.content));
  log::get()->info("wrote {}", path);
  return true;
}

} // namespace patchwright
