#pragma once
#include <filesystem>
#include <string>

namespace patchwright {

class WorkingTree;

// Exclusive advisory lock on a working tree, held for the object's lifetime.
// On disk trees this is flock(2) on "lock" in the state area, which also keeps
// other processes out; in-memory trees are guarded within the process only.
class TreeLock {
public:
  // Never waits. Throws LockError (naming the holder PID when known) if the
  // tree is already locked.
  explicit TreeLock(const WorkingTree& tree);
  ~TreeLock();

  TreeLock(const TreeLock &) = delete;
  TreeLock& operator=(const TreeLock &) = delete;

  // Lock file; empty for in-memory trees.
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  std::string key_;
  std::filesystem::path path_;
  int fd_ = -1;
};

} // namespace patchwright
