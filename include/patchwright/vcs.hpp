#pragma once
#include "patchwright/version_pin.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

// Version-control operations SourceTreeSync needs from the upstream checkout.
class Vcs {
public:
  virtual ~Vcs() = default;

  // Discard every tracked modification (index and files).
  virtual void reset_hard() = 0;

  // Untracked and ignored paths under `scope` ("" = whole tree), tree-relative.
  // Wholly untracked directories are reported once, with a trailing '/'.
  [[nodiscard]] virtual std::vector<std::string> list_untracked(std::string_view scope) const = 0;

  // Bring remote references (tags included) into the checkout. depth 0 = full history.
  virtual void fetch(const UpstreamRevision& rev, int depth) = 0;

  // Commit id `rev` names locally; empty when it does not exist.
  [[nodiscard]] virtual std::string resolve(const UpstreamRevision& rev) const = 0;

  // Newest first, by version order.
  [[nodiscard]] virtual std::vector<std::string> recent_tags(std::size_t limit) const = 0;

  // Detach the checkout at `rev`. Local modifications that do not conflict are
  // carried over, as git does.
  virtual void checkout(const UpstreamRevision& rev) = 0;

  // Commit id currently checked out; empty when unknown.
  [[nodiscard]] virtual std::string head_revision() const = 0;

  // Tracked paths differing from the checked-out commit.
  [[nodiscard]] virtual std::vector<std::string> tracked_changes() const = 0;

  // Fetch nested dependency trees the upstream declares.
  virtual void sync_dependencies(bool shallow) = 0;
};

// Vcs backed by the git and gclient executables.
class GitVcs final : public Vcs {
public:
  explicit GitVcs(std::filesystem::path root, std::string git = "git",
                  std::string gclient = "gclient");

  void reset_hard() override;
  [[nodiscard]] std::vector<std::string> list_untracked(std::string_view scope) const override;
  void fetch(const UpstreamRevision& rev, int depth) override;
  [[nodiscard]] std::string resolve(const UpstreamRevision& rev) const override;
  [[nodiscard]] std::vector<std::string> recent_tags(std::size_t limit) const override;
  void checkout(const UpstreamRevision& rev) override;
  [[nodiscard]] std::string head_revision() const override;
  [[nodiscard]] std::vector<std::string> tracked_changes() const override;
  void sync_dependencies(bool shallow) override;

private:
  // Run git in the checkout; SyncError with the tool output on failure.
  std::string git(const std::vector<std::string>& args) const;

  std::filesystem::path root_;
  std::string git_;
  std::string gclient_;
};

} // namespace patchwright
