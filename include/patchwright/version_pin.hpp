#pragma once
#include <filesystem>
#include <string>

namespace patchwright {

// Exact upstream version (tag or commit) the fork is built against.
struct UpstreamRevision {
  std::string id;

  bool operator==(const UpstreamRevision &) const = default;
};

// Single pinned-version file. Blank lines and '#' comments are allowed;
// anything else must be exactly one identifier.
class VersionPin {
public:
  explicit VersionPin(std::filesystem::path file) : file_(std::move(file)) {}

  [[nodiscard]] const std::filesystem::path& file() const { return file_; }

  // Throws ConfigError if the file is missing, empty or holds more than one identifier.
  [[nodiscard]] UpstreamRevision resolve() const;

private:
  std::filesystem::path file_;
};

} // namespace patchwright
