#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchwright {

// Base of every failure a pipeline stage reports.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Missing/invalid pinned version, fragment files or configuration values.
class ConfigError : public Error {
public:
  using Error::Error;
};

// Revision not found, fetch/checkout/reset failure.
class SyncError : public Error {
public:
  using Error::Error;
};

// Another invocation holds the working tree.
class LockError : public Error {
public:
  using Error::Error;
};

// A required overlay source directory does not exist.
class ResourceMissingError : public Error {
public:
  explicit ResourceMissingError(std::string path);
  [[nodiscard]] const std::string& path() const { return path_; }

private:
  std::string path_;
};

// External build/packaging tool failed.
class BuildError : public Error {
public:
  BuildError(std::string tool, int exit_status, std::string output);
  [[nodiscard]] const std::string& tool() const { return tool_; }
  [[nodiscard]] int exit_status() const { return exit_status_; }
  [[nodiscard]] const std::string& output() const { return output_; }

private:
  std::string tool_;
  int exit_status_;
  std::string output_;
};

// Raised at a safe point after SIGINT/SIGTERM.
class Interrupted : public Error {
public:
  Interrupted() : Error("interrupted") {}
};

// Exact state of the tree when a patch operation stopped.
struct PatchFailure {
  std::string patch_id;              // patch that failed
  std::vector<std::string> applied;  // patches applied at the time, in order
  std::string path;                  // file inside the tree, may be empty
  std::string detail;                // mismatch excerpt or reason
  bool reversing = false;
};

class PatchError : public Error {
public:
  PatchError(std::string_view kind, PatchFailure failure);
  [[nodiscard]] const PatchFailure& failure() const { return failure_; }

private:
  PatchFailure failure_;
};

// Target content diverges from what the patch expects.
class PatchConflictError : public PatchError {
public:
  explicit PatchConflictError(PatchFailure failure)
      : PatchError("conflict", std::move(failure)) {}
};

// A file the patch modifies does not exist in the tree.
class PatchTargetMissingError : public PatchError {
public:
  explicit PatchTargetMissingError(PatchFailure failure)
      : PatchError("target missing", std::move(failure)) {}
};

} // namespace patchwright
