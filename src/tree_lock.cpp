#include "patchwright/tree_lock.hpp"

#include "patchwright/consts.hpp"
#include "patchwright/errors.hpp"
#include "patchwright/log.hpp"
#include "patchwright/util.hpp"
#include "patchwright/working_tree.hpp"

#include <cerrno>
#include <cstring>
#include <set>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace patchwright {

namespace {

// Trees locked by this process.
std::set<std::string> &held() {
  static std::set<std::string> s;
  return s;
}

std::string read_holder(int fd) {
  char buf[32] = {};
  const ssize_t n = ::pread(fd, buf, sizeof buf - 1, 0);
  if (n <= 0)
    return {};
  return strutil::trim(std::string_view(buf, static_cast<std::size_t>(n)));
}

} // namespace

TreeLock::TreeLock(const WorkingTree &tree) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(tree.root(), ec);
  key_ = (ec ? tree.root() : abs).lexically_normal().generic_string();
  if (held().contains(key_))
    throw LockError("working tree " + key_ + " is already locked by this process");

  if (const auto dir = tree.state_dir()) {
    std::filesystem::create_directories(*dir, ec);
    if (ec)
      throw LockError("cannot create " + dir->string() + ": " + ec.message());
    path_ = *dir / consts::kLockFile;

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW, 0644);
    if (fd_ < 0)
      throw LockError("cannot open " + path_.string() + ": " + std::strerror(errno));
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
      const int err = errno;
      const std::string holder = read_holder(fd_);
      ::close(fd_);
      fd_ = -1;
      if (err == EWOULDBLOCK)
        throw LockError("working tree " + key_ + " is locked by another invocation" +
                        (holder.empty() ? std::string{} : " (pid " + holder + ")"));
      throw LockError("cannot lock " + path_.string() + ": " + std::strerror(err));
    }
    const std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd_, 0) != 0 || ::pwrite(fd_, pid.data(), pid.size(), 0) < 0)
      log::get()->debug("could not record pid in {}", path_.string());
  }
  held().insert(key_);
  log::get()->debug("locked {}", key_);
}

TreeLock::~TreeLock() {
  if (fd_ >= 0) {
    if (::ftruncate(fd_, 0) != 0)
      log::get()->debug("could not clear {}", path_.string());
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  held().erase(key_);
}

} // namespace patchwright
