#include "patchwright/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace patchwright {

namespace {

std::string describe_patch_failure(std::string_view kind, const PatchFailure &f) {
  std::string out = fmt::format("patch {}: {}", f.patch_id, kind);
  if (f.reversing)
    out += " while reversing";
  if (!f.path.empty())
    out += fmt::format(" in {}", f.path);
  out += fmt::format("\n  {}: ", f.reversing ? "still applied" : "already applied");
  out += f.applied.empty() ? std::string("(none)") : fmt::format("{}", fmt::join(f.applied, ", "));
  if (!f.detail.empty())
    out += "\n" + f.detail;
  return out;
}

} // namespace

ResourceMissingError::ResourceMissingError(std::string path)
    : Error("resource directory missing: " + path), path_(std::move(path)) {}

BuildError::BuildError(std::string tool, int exit_status, std::string output)
    : Error(fmt::format("{} failed with exit status {}", tool, exit_status)),
      tool_(std::move(tool)), exit_status_(exit_status), output_(std::move(output)) {}

PatchError::PatchError(std::string_view kind, PatchFailure failure)
    : Error(describe_patch_failure(kind, failure)), failure_(std::move(failure)) {}

} // namespace patchwright
