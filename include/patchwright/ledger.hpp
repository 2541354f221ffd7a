#pragma once
#include <string>
#include <vector>

namespace patchwright {

class WorkingTree;

// Pre-/post-image ids of one file a patch touched. Empty id: file absent.
struct LedgerFile {
  std::string path;
  std::string before;
  std::string after;
};

struct LedgerEntry {
  std::string id;
  std::string digest;
  std::vector<LedgerFile> files;
};

// Applied patches of a working tree, oldest first. Lives in the tree state area.
class Ledger {
public:
  // Empty ledger when none has been written yet.
  static Ledger load(const WorkingTree& tree);

  // Atomically replace the stored ledger.
  void save(WorkingTree& tree) const;

  // Forget every applied patch and the stored file images.
  static void clear(WorkingTree& tree);

  [[nodiscard]] const std::vector<LedgerEntry>& entries() const { return entries_; }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] std::vector<std::string> ids() const;

  void push(LedgerEntry entry) { entries_.push_back(std::move(entry)); }
  void pop() { entries_.pop_back(); }

private:
  std::vector<LedgerEntry> entries_;
};

} // namespace patchwright
