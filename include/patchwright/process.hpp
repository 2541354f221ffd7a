#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace patchwright {

struct ProcessResult {
  int exit_status = 0; // 128 + signal number when the child was killed
  std::string output;  // stdout and stderr interleaved

  [[nodiscard]] bool ok() const { return exit_status == 0; }
};

// External tool invocation. The program is looked up in PATH unless it contains a '/'.
class Command {
public:
  explicit Command(std::string program);

  Command& arg(std::string a);
  Command& args(const std::vector<std::string>& as);
  Command& cwd(std::filesystem::path dir);
  // Empty value removes the variable from the child environment.
  Command& env(const std::string& name, const std::string& value);
  // Copy the child's output to our stdout as it arrives (long builds).
  Command& passthrough(bool on);

  [[nodiscard]] const std::string& program() const { return program_; }
  // "program arg1 arg2" for logs and error messages
  [[nodiscard]] std::string display() const;

  // Run to completion. Throws std::runtime_error when the child cannot be
  // started; a non-zero exit is reported through ProcessResult.
  ProcessResult run() const;

private:
  std::string program_;
  std::vector<std::string> args_;
  std::filesystem::path cwd_;
  std::map<std::string, std::string> envs_;
  bool passthrough_ = false;
};

} // namespace patchwright
