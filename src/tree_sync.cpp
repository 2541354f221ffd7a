#include "patchwright/tree_sync.hpp"

#include "patchwright/errors.hpp"
#include "patchwright/interrupt.hpp"
#include "patchwright/ledger.hpp"
#include "patchwright/log.hpp"
#include "patchwright/util.hpp"
#include "patchwright/vcs.hpp"
#include "patchwright/working_tree.hpp"

#include <map>
#include <set>

namespace patchwright {

namespace {

constexpr std::size_t kTagsShown = 10;

std::string_view strip_slashes(std::string_view s) {
  while (s.ends_with('/'))
    s.remove_suffix(1);
  return s;
}

// Files the recorded patches created that still hold the patched content.
// A checkout neither restores nor removes them.
std::vector<std::string> created_files(const WorkingTree &tree, const Ledger &ledger) {
  std::map<std::string, std::pair<std::string, std::string>> images; // first before, last after
  for (const auto &e : ledger.entries())
    for (const auto &f : e.files) {
      auto [it, inserted] = images.try_emplace(f.path, f.before, f.after);
      if (!inserted)
        it->second.second = f.after;
    }
  std::vector<std::string> out;
  for (const auto &[path, img] : images) {
    if (img.first.empty() && !img.second.empty() && tree.exists(path) &&
        content_id(tree.read(path)) == img.second)
      out.push_back(path);
  }
  return out;
}

void forget_patches(WorkingTree &tree, const Ledger &ledger, SyncResult &res) {
  if (ledger.empty())
    return;
  for (const auto &path : created_files(tree, ledger)) {
    tree.remove(path);
    log::get()->debug("removed patch-created file {}", path);
  }
  Ledger::clear(tree);
  res.ledger_cleared = true;
  log::get()->info("forgot {} applied patches", ledger.entries().size());
}

std::set<std::string> ledger_paths(const Ledger &ledger) {
  std::set<std::string> out;
  for (const auto &e : ledger.entries())
    for (const auto &f : e.files)
      out.insert(f.path);
  return out;
}

// Paths the kept ledger records are never cleaned, or a patch it still lists
// as applied would lose the files it created.
void clean(WorkingTree &tree, const Vcs &vcs, const SyncOptions &options,
           const std::set<std::string> &patched, SyncResult &res) {
  auto exclusions = options.exclusions;
  exclusions.emplace_back(consts::kGitDir);
  exclusions.emplace_back(consts::kStateFallback);
  exclusions.insert(exclusions.end(), patched.begin(), patched.end());

  std::vector<std::string> scopes = options.clean_scopes;
  if (scopes.empty())
    scopes.emplace_back();
  for (const auto &scope : scopes) {
    for (const auto &entry : vcs.list_untracked(scope)) {
      if (is_excluded(entry, exclusions)) {
        res.preserved.push_back(entry);
        continue;
      }
      tree.remove_tree(strip_slashes(entry));
      res.removed.push_back(entry);
    }
  }
  log::get()->info("clean: removed {} untracked paths, kept {}", res.removed.size(),
                   res.preserved.size());
}

} // namespace

bool is_excluded(std::string_view path, const std::vector<std::string> &exclusions) {
  const bool dir = path.ends_with('/');
  const std::string_view bare = strip_slashes(path);
  for (const auto &ex : exclusions) {
    const std::string_view e = strip_slashes(ex);
    if (e.empty())
      continue;
    if (bare == e)
      return true;
    if (bare.size() > e.size() && bare.starts_with(e) && bare[e.size()] == '/')
      return true;
    if (dir && e.size() > bare.size() && e.starts_with(bare) && e[bare.size()] == '/')
      return true;
  }
  return false;
}

SyncResult sync(WorkingTree &tree, Vcs &vcs, const UpstreamRevision &revision,
                const SyncOptions &options) {
  auto logger = log::get();
  if (options.clean_untracked && options.exclusions.empty())
    throw ConfigError("clean requires a non-empty exclusion list");

  SyncResult res;
  res.revision = revision;
  const Ledger ledger = Ledger::load(tree);
  res.previous_head = vcs.head_revision();

  interrupt::check();
  if (options.reset_tracked) {
    logger->info("resetting tracked files in {}", tree.root().string());
    vcs.reset_hard();
    res.reset = true;
    forget_patches(tree, ledger, res);
  }

  interrupt::check();
  if (options.clean_untracked)
    clean(tree, vcs, options, res.ledger_cleared ? std::set<std::string>{} : ledger_paths(ledger),
          res);

  interrupt::check();
  logger->info("fetching {}", revision.id);
  vcs.fetch(revision, options.fetch_depth);
  const std::string target = vcs.resolve(revision);
  if (target.empty()) {
    const auto tags = vcs.recent_tags(kTagsShown);
    throw SyncError("revision " + revision.id + " not found" +
                    (tags.empty() ? std::string{}
                                  : "; most recent tags: " + strutil::join(tags, ", ")));
  }

  if (!res.ledger_cleared && !ledger.empty() && target != res.previous_head)
    throw SyncError("patches are applied on " + res.previous_head + "; sync with reset to move to " +
                    revision.id);

  interrupt::check();
  logger->info("checking out {}", revision.id);
  vcs.checkout(revision);
  res.head = vcs.head_revision();

  // Whatever is still modified must be the work of recorded patches.
  const auto changed = vcs.tracked_changes();
  if (!changed.empty()) {
    const auto known = res.ledger_cleared ? std::set<std::string>{} : ledger_paths(ledger);
    for (const auto &path : changed) {
      if (!known.contains(path))
        throw SyncError(std::to_string(changed.size()) +
                        " tracked files are modified (first unexplained: " + path +
                        "); sync with reset to discard local edits");
    }
    logger->info("{} patches from a previous run remain applied", ledger.entries().size());
  }

  if (options.sync_dependencies) {
    interrupt::check();
    logger->info("syncing dependencies{}", options.shallow_dependencies ? " (shallow)" : "");
    vcs.sync_dependencies(options.shallow_dependencies);
    res.dependencies_synced = true;
  }
  logger->info("tree at {} ({})", revision.id, res.head);
  return res;
}

} // namespace patchwright
