#include "patchwright/vcs.hpp"

#include "patchwright/errors.hpp"
#include "patchwright/log.hpp"
#include "patchwright/process.hpp"
#include "patchwright/util.hpp"

namespace patchwright {

namespace {

std::vector<std::string> split(std::string_view text, char sep) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t end = text.find(sep, pos);
    if (end == std::string_view::npos)
      end = text.size();
    std::string item(text.substr(pos, end - pos));
    strutil::rstrip_newlines(item);
    if (!item.empty())
      out.push_back(std::move(item));
    pos = end + 1;
  }
  return out;
}

std::string commit_ref(const UpstreamRevision &rev) { return rev.id + "^{commit}"; }

// Spawn failures (tool not installed) become SyncError.
ProcessResult run_tool(const Command &cmd) {
  try {
    return cmd.run();
  } catch (const std::runtime_error &e) {
    throw SyncError(e.what());
  }
}

// Trimmed stdout of a query that may legitimately fail; empty on failure.
std::string query(const std::string &git, const std::filesystem::path &root,
                  const std::vector<std::string> &args) {
  Command cmd{git};
  cmd.args(args).cwd(root);
  auto res = run_tool(cmd);
  if (!res.ok())
    return {};
  strutil::rstrip_newlines(res.output);
  return res.output;
}

} // namespace

GitVcs::GitVcs(std::filesystem::path root, std::string git, std::string gclient)
    : root_(std::move(root)), git_(std::move(git)), gclient_(std::move(gclient)) {}

std::string GitVcs::git(const std::vector<std::string> &args) const {
  Command cmd{git_};
  cmd.args(args).cwd(root_);
  const ProcessResult res = run_tool(cmd);
  if (!res.ok()) {
    std::string out = res.output;
    strutil::rstrip_newlines(out);
    throw SyncError(cmd.display() + " failed with exit status " +
                    std::to_string(res.exit_status) + (out.empty() ? "" : ":\n" + out));
  }
  return res.output;
}

void GitVcs::reset_hard() { (void)git({"reset", "--hard", "--quiet"}); }

std::vector<std::string> GitVcs::list_untracked(std::string_view scope) const {
  std::vector<std::string> args{"ls-files", "--others", "--directory", "-z"};
  if (!scope.empty()) {
    args.emplace_back("--");
    args.emplace_back(scope);
  }
  return split(git(args), '\0');
}

void GitVcs::fetch(const UpstreamRevision &rev, int depth) {
  std::vector<std::string> args{"fetch", "--tags", "--force"};
  if (depth > 0)
    args.push_back("--depth=" + std::to_string(depth));
  args.emplace_back("origin");
  (void)git(args);
  if (!resolve(rev).empty())
    return;

  // Plain commit ids are not reachable through tags; ask for them directly.
  if (looks_hex40(rev.id)) {
    args.push_back(rev.id);
    Command cmd{git_};
    cmd.args(args).cwd(root_);
    const auto res = run_tool(cmd);
    if (!res.ok())
      log::get()->debug("fetch of {} by id failed: {}", rev.id, res.output);
  }
}

std::string GitVcs::resolve(const UpstreamRevision &rev) const {
  return query(git_, root_, {"rev-parse", "--verify", "--quiet", commit_ref(rev)});
}

std::vector<std::string> GitVcs::recent_tags(std::size_t limit) const {
  auto tags = split(git({"tag", "-l", "--sort=-version:refname"}), '\n');
  if (tags.size() > limit)
    tags.resize(limit);
  return tags;
}

void GitVcs::checkout(const UpstreamRevision &rev) {
  (void)git({"checkout", "--quiet", "--detach", commit_ref(rev)});
}

std::string GitVcs::head_revision() const {
  return query(git_, root_, {"rev-parse", "--verify", "--quiet", "HEAD"});
}

// Records are "XY path"; a rename or copy is followed by a record holding its source.
std::vector<std::string> GitVcs::tracked_changes() const {
  const auto records = split(git({"status", "--porcelain", "-z", "--untracked-files=no"}), '\0');
  std::vector<std::string> out;
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto &rec = records[i];
    if (rec.size() < 4)
      throw SyncError("unexpected git status record: " + rec);
    out.push_back(rec.substr(3));
    if ((rec[0] == 'R' || rec[0] == 'C') && i + 1 < records.size())
      out.push_back(records[++i]);
  }
  return out;
}

void GitVcs::sync_dependencies(bool shallow) {
  Command cmd{gclient_};
  cmd.args({"sync", "-D"}).cwd(root_).passthrough(true);
  if (shallow)
    cmd.args({"--no-history", "--shallow"});
  const ProcessResult res = run_tool(cmd);
  if (!res.ok())
    throw SyncError(cmd.display() + " failed with exit status " + std::to_string(res.exit_status));
}

} // namespace patchwright
