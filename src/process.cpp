#include "patchwright/process.hpp"

#include "patchwright/log.hpp"
#include "patchwright/util.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace patchwright {

namespace {

std::string errno_text(int err) { return std::strerror(err); }

bool has_name(const std::string &entry, const std::string &name) {
  return entry.size() > name.size() && entry.compare(0, name.size(), name) == 0 &&
         entry[name.size()] == '=';
}

std::vector<std::string> child_environment(const std::map<std::string, std::string> &overrides) {
  std::vector<std::string> out;
  for (char **e = environ; *e != nullptr; ++e)
    out.emplace_back(*e);
  for (const auto &[name, value] : overrides) {
    std::erase_if(out, [&](const std::string &entry) { return has_name(entry, name); });
    if (!value.empty())
      out.push_back(name + "=" + value);
  }
  return out;
}

} // namespace

Command::Command(std::string program) : program_(std::move(program)) {}

Command &Command::arg(std::string a) {
  args_.push_back(std::move(a));
  return *this;
}

Command &Command::args(const std::vector<std::string> &as) {
  args_.insert(args_.end(), as.begin(), as.end());
  return *this;
}

Command &Command::cwd(std::filesystem::path dir) {
  cwd_ = std::move(dir);
  return *this;
}

Command &Command::env(const std::string &name, const std::string &value) {
  envs_[name] = value;
  return *this;
}

Command &Command::passthrough(bool on) {
  passthrough_ = on;
  return *this;
}

std::string Command::display() const {
  std::string s = program_;
  for (const auto &a : args_) {
    s += ' ';
    s += a;
  }
  return s;
}

ProcessResult Command::run() const {
  log::get()->debug("run: {}{}", display(),
                    cwd_.empty() ? std::string{} : " (in " + cwd_.string() + ")");

  // Everything the child needs is built before fork.
  std::vector<std::string> env_strings = child_environment(envs_);
  std::vector<char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto &e : env_strings)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  std::vector<std::string> argv_strings;
  argv_strings.reserve(args_.size() + 1);
  argv_strings.push_back(program_);
  argv_strings.insert(argv_strings.end(), args_.begin(), args_.end());
  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto &a : argv_strings)
    argv.push_back(a.data());
  argv.push_back(nullptr);

  const std::string dir = cwd_.string();

  int out_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) == -1)
    throw std::runtime_error("pipe: " + errno_text(errno));

  const pid_t pid = ::fork();
  if (pid == -1) {
    const int err = errno;
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    throw std::runtime_error("fork: " + errno_text(err));
  }

  if (pid == 0) {
    const int null_in = ::open("/dev/null", O_RDONLY);
    if (null_in != -1)
      ::dup2(null_in, STDIN_FILENO);
    if (::dup2(out_pipe[1], STDOUT_FILENO) == -1 || ::dup2(out_pipe[1], STDERR_FILENO) == -1)
      ::_exit(127);
    if (!dir.empty() && ::chdir(dir.c_str()) == -1) {
      const std::string msg = "cannot enter " + dir + ": " + errno_text(errno) + "\n";
      (void)!::write(STDERR_FILENO, msg.data(), msg.size());
      ::_exit(127);
    }
    ::execvpe(argv[0], argv.data(), envp.data());
    const std::string msg = "cannot execute " + program_ + ": " + errno_text(errno) + "\n";
    (void)!::write(STDERR_FILENO, msg.data(), msg.size());
    ::_exit(127);
  }

  ::close(out_pipe[1]);
  ProcessResult res;
  char buf[4096];
  for (;;) {
    const ssize_t n = ::read(out_pipe[0], buf, sizeof buf);
    if (n > 0) {
      res.output.append(buf, static_cast<std::size_t>(n));
      if (passthrough_) {
        std::fwrite(buf, 1, static_cast<std::size_t>(n), stdout);
        std::fflush(stdout);
      }
      continue;
    }
    if (n == -1 && errno == EINTR)
      continue;
    break; // EOF or error
  }
  ::close(out_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      throw std::runtime_error("waitpid: " + errno_text(errno));
  }
  if (WIFEXITED(status))
    res.exit_status = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.exit_status = 128 + WTERMSIG(status);
  else
    res.exit_status = 1;

  if (res.exit_status == 127 && res.output.starts_with("cannot execute " + program_)) {
    std::string msg = res.output;
    strutil::rstrip_newlines(msg);
    throw std::runtime_error(msg);
  }
  return res;
}

} // namespace patchwright
