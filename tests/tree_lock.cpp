#include "patchwright/errors.hpp"
#include "patchwright/tree_lock.hpp"
#include "patchwright/working_tree.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <random>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::optional<std::string> lock_error(const patchwright::WorkingTree& tree) {
  try {
    const patchwright::TreeLock lock{tree};
  } catch (const patchwright::LockError& e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

int main() {
  int rc = 0;
  const fs::path root = fs::temp_directory_path() / ("patchwright_lock_" + std::to_string(std::random_device{}()));
  fs::create_directories(root / ".git");
  const patchwright::DiskWorkingTree tree{root};

  try {
    {
      const patchwright::TreeLock lock{tree};
      if (lock.path() != root / ".git" / "patchwright" / "lock" || !fs::exists(lock.path())) {
        std::cerr << "lock path " << lock.path() << "\n"; rc = 1;
      }
      const auto second = lock_error(patchwright::DiskWorkingTree{root});
      if (!second || second->find("already locked") == std::string::npos) { std::cerr << "second lock\n"; rc = 1; }
    }
    // Released with the first lock.
    if (lock_error(tree)) { std::cerr << "relock failed\n"; rc = 1; }

    // Held by someone else through flock on the same file.
    const int fd = ::open((root / ".git" / "patchwright" / "lock").c_str(), O_RDWR);
    if (fd < 0 || ::flock(fd, LOCK_EX | LOCK_NB) != 0 || ::pwrite(fd, "4242\n", 5, 0) != 5) {
      std::cerr << "could not take the lock file\n"; rc = 1;
    } else {
      const auto busy = lock_error(tree);
      if (!busy || busy->find("another invocation (pid 4242)") == std::string::npos) {
        std::cerr << "busy: " << busy.value_or("<no error>") << "\n"; rc = 1;
      }
      ::flock(fd, LOCK_UN);
    }
    if (fd >= 0)
      ::close(fd);
    if (lock_error(tree)) { std::cerr << "lock after foreign release\n"; rc = 1; }

    // In-memory trees are guarded within the process.
    const patchwright::MemoryWorkingTree mem;
    {
      const patchwright::TreeLock lock{mem};
      if (!lock.path().empty() || !lock_error(patchwright::MemoryWorkingTree{})) { std::cerr << "memory lock\n"; rc = 1; }
    }
    if (lock_error(mem)) { std::cerr << "memory relock\n"; rc = 1; }
  } catch (const std::exception& e) {
    std::cerr << "unexpected: " << e.what() << "\n"; rc = 1;
  }

  fs::remove_all(root);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
