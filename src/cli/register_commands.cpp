#include "cli/registry.hpp"

int cmd_build(int argc, char **argv);
int cmd_sync(int argc, char **argv);
int cmd_patches(int argc, char **argv);
int cmd_compose(int, char **);
int cmd_overlay(int, char **);
int cmd_version(int, char **);

namespace patchwright::cli {

void register_all_commands() {
  register_command("build", ::cmd_build, "[options] [arm64|x64]   sync, patch and build the fork");
  register_command("sync", ::cmd_sync, "<tree> [--reset] [--clean] [--depth N]   check out the pinned revision");
  register_command("patches", ::cmd_patches, "apply|reverse|status <tree> <patch-dir>");
  register_command("compose", ::cmd_compose, "<fragments-dir> <debug|release> <arm64|x64> [--out FILE]");
  register_command("overlay", ::cmd_overlay, "<tree> [?]<src>:<dest>...   copy fork resources");
  register_command("version", ::cmd_version, "[version-file]   print the pinned upstream revision");
}

} // namespace patchwright::cli
