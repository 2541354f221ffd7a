#include "patchwright/patch_stack.hpp"

#include "patchwright/consts.hpp"
#include "patchwright/diff.hpp"
#include "patchwright/errors.hpp"
#include "patchwright/fs.hpp"
#include "patchwright/interrupt.hpp"
#include "patchwright/ledger.hpp"
#include "patchwright/log.hpp"
#include "patchwright/object_store.hpp"
#include "patchwright/patch_apply.hpp"
#include "patchwright/util.hpp"
#include "patchwright/working_tree.hpp"

#include <algorithm>
#include <map>

namespace patchwright {

namespace {

std::string current_id(const WorkingTree &tree, const std::string &path) {
  if (!tree.exists(path))
    return {};
  return content_id(tree.read(path));
}

// Latest post-image per path over the whole ledger.
std::map<std::string, std::pair<std::string, std::string>> latest_images(const Ledger &ledger) {
  std::map<std::string, std::pair<std::string, std::string>> out; // path -> (patch id, after)
  for (const auto &e : ledger.entries())
    for (const auto &f : e.files)
      out[f.path] = {e.id, f.after};
  return out;
}

std::vector<std::string> find_drift(const WorkingTree &tree, const Ledger &ledger) {
  std::vector<std::string> out;
  for (const auto &[path, rec] : latest_images(ledger)) {
    if (current_id(tree, path) != rec.second)
      out.push_back(rec.first + ": " + path);
  }
  return out;
}

// A recorded patch whose file is back at a pre-image, or gone while the patch
// left content there, no longer takes effect.
void check_lost_changes(const WorkingTree &tree, const Ledger &ledger) {
  std::map<std::string, std::vector<std::string>> before; // path -> recorded pre-images
  for (const auto &e : ledger.entries())
    for (const auto &f : e.files)
      before[f.path].push_back(f.before);
  for (const auto &[path, rec] : latest_images(ledger)) {
    const std::string now = current_id(tree, path);
    if (now == rec.second)
      continue;
    const bool reverted = std::ranges::find(before[path], now) != before[path].end();
    if (!reverted && !(now.empty() && !rec.second.empty()))
      continue;
    throw PatchConflictError(PatchFailure{
        .patch_id = rec.first,
        .applied = ledger.ids(),
        .path = path,
        .detail = now.empty() ? "file the patch wrote is missing; sync with reset and apply again"
                              : "file is back at its unpatched content; sync with reset and apply again",
        .reversing = false});
  }
}

[[noreturn]] void throw_plan_failure(const PatchPlan &plan, const std::string &patch_id,
                                     const Ledger &ledger, bool reversing) {
  PatchFailure f{.patch_id = patch_id,
                 .applied = ledger.ids(),
                 .path = plan.failed_path,
                 .detail = plan.detail,
                 .reversing = reversing};
  if (plan.failure == PlanFailure::TargetMissing)
    throw PatchTargetMissingError(std::move(f));
  throw PatchConflictError(std::move(f));
}

std::size_t write_changes(WorkingTree &tree, const std::vector<FileChange> &changes) {
  std::size_t n = 0;
  for (const auto &c : changes) {
    if (c.after) {
      tree.write(c.path, *c.after);
      if (c.executable)
        tree.set_executable(c.path);
      ++n;
    } else if (tree.exists(c.path)) {
      tree.remove(c.path);
      ++n;
    }
  }
  return n;
}

std::vector<std::string> change_paths(const std::vector<FileChange> &changes) {
  std::vector<std::string> out;
  out.reserve(changes.size());
  for (const auto &c : changes)
    out.push_back(c.path);
  return out;
}

bool has_patch_suffix(const std::string &name) {
  return std::ranges::any_of(consts::kPatchSuffixes,
                             [&](std::string_view sfx) { return name.ends_with(sfx); });
}

} // namespace

const char *to_string(PatchState s) {
  switch (s) {
  case PatchState::Applied: return "applied";
  case PatchState::AlreadyApplied: return "already applied";
  case PatchState::Reversed: return "reversed";
  case PatchState::NotApplied: return "not applied";
  }
  return "?";
}

std::vector<std::string> ApplyReport::ids_in(PatchState s) const {
  std::vector<std::string> out;
  for (const auto &r : results)
    if (r.state == s)
      out.push_back(r.id);
  return out;
}

PatchStack::PatchStack(std::vector<Patch> patches) : patches_(std::move(patches)) {
  std::ranges::sort(patches_, [](const Patch &a, const Patch &b) { return a.id < b.id; });
  const auto dup = std::ranges::adjacent_find(
      patches_, [](const Patch &a, const Patch &b) { return a.id == b.id; });
  if (dup != patches_.end())
    throw ConfigError("duplicate patch id: " + dup->id);
}

PatchStack PatchStack::load(const std::filesystem::path &dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec))
    throw ConfigError("patch directory not found: " + dir.string());

  std::vector<Patch> patches;
  for (const auto &rel : fs::list_files(dir)) {
    if (!has_patch_suffix(rel))
      continue;
    const std::string text = fs::read_text(dir / rel);
    if (strutil::trim(text).empty())
      throw ConfigError("patch " + rel + " is empty");
    try {
      auto p = make_patch(rel, text);
      if (p.files.empty())
        throw ConfigError("patch " + rel + " contains no file changes");
      patches.push_back(std::move(p));
    } catch (const ConfigError &) {
      throw;
    } catch (const std::runtime_error &e) {
      throw ConfigError("patch " + rel + ": " + e.what());
    }
  }
  log::get()->debug("loaded {} patches from {}", patches.size(), dir.string());
  return PatchStack(std::move(patches));
}

ApplyReport PatchStack::apply(WorkingTree &tree) const {
  auto logger = log::get();
  Ledger ledger = Ledger::load(tree);
  ApplyReport report;

  // The ledger must be a prefix of this stack: same ids, same content.
  const auto &recorded = ledger.entries();
  for (std::size_t i = 0; i < recorded.size(); ++i) {
    const auto &e = recorded[i];
    if (i >= patches_.size() || e.id != patches_[i].id || e.digest != patches_[i].digest) {
      const bool same_id = i < patches_.size() && e.id == patches_[i].id;
      PatchFailure f{.patch_id = i < patches_.size() ? patches_[i].id : e.id,
                     .applied = ledger.ids(),
                     .path = {},
                     .detail = same_id ? "patch content changed since it was applied; "
                                         "resync with reset before applying again"
                                       : "tree carries a different patch stack (ledger has " +
                                             e.id + "); resync with reset before applying"};
      throw PatchConflictError(std::move(f));
    }
    report.results.push_back(PatchResult{.id = e.id,
                                         .state = PatchState::AlreadyApplied,
                                         .files = patches_[i].touched_paths()});
  }
  check_lost_changes(tree, ledger);
  report.drifted = find_drift(tree, ledger);
  for (const auto &d : report.drifted)
    logger->warn("changed since it was patched: {}", d);
  if (!recorded.empty())
    logger->info("{} of {} patches already applied", recorded.size(), patches_.size());

  const ObjectStore store{tree};
  for (std::size_t i = recorded.size(); i < patches_.size(); ++i) {
    interrupt::check();
    const auto &p = patches_[i];
    const auto plan = plan_changes(tree, p.files);
    if (plan.failure != PlanFailure::None) {
      logger->error("patch {} failed in {}", p.id, plan.failed_path);
      throw_plan_failure(plan, p.id, ledger, false);
    }

    LedgerEntry entry{.id = p.id, .digest = p.digest, .files = {}};
    for (const auto &c : plan.changes) {
      entry.files.push_back(LedgerFile{.path = c.path,
                                       .before = c.before ? store.write(*c.before) : "",
                                       .after = c.after ? store.write(*c.after) : ""});
    }
    report.files_written += write_changes(tree, plan.changes);
    ledger.push(std::move(entry));
    ledger.save(tree);

    report.results.push_back(PatchResult{
        .id = p.id, .state = PatchState::Applied, .files = change_paths(plan.changes)});
    logger->info("applied {} ({} files)", p.id, plan.changes.size());
  }
  return report;
}

ApplyReport PatchStack::reverse(WorkingTree &tree) const {
  auto logger = log::get();
  Ledger ledger = Ledger::load(tree);
  ApplyReport report;
  const ObjectStore store{tree};

  for (auto it = patches_.rbegin(); it != patches_.rend(); ++it) {
    const auto &p = *it;
    const auto &recorded = ledger.entries();
    const auto pos = std::ranges::find_if(recorded, [&](const LedgerEntry &e) { return e.id == p.id; });
    if (pos == recorded.end()) {
      report.results.push_back(
          PatchResult{.id = p.id, .state = PatchState::NotApplied, .files = {}});
      continue;
    }
    if (std::next(pos) != recorded.end() || pos->digest != p.digest) {
      PatchFailure f{.patch_id = p.id,
                     .applied = ledger.ids(),
                     .path = {},
                     .detail = pos->digest != p.digest
                                   ? "patch content changed since it was applied"
                                   : "newer patch " + recorded.back().id +
                                         " is applied and not part of this stack",
                     .reversing = true};
      throw PatchConflictError(std::move(f));
    }
    interrupt::check();

    std::vector<FilePatch> inv;
    inv.reserve(p.files.size());
    for (auto f = p.files.rbegin(); f != p.files.rend(); ++f)
      inv.push_back(inverted(*f));
    const auto plan = plan_changes(tree, inv);
    if (plan.failure != PlanFailure::None) {
      logger->error("patch {} does not reverse cleanly in {}", p.id, plan.failed_path);
      throw_plan_failure(plan, p.id, ledger, true);
    }

    // The result must be exactly what the tree held before the patch.
    for (const auto &rec : pos->files) {
      const auto c = std::ranges::find_if(plan.changes,
                                          [&](const FileChange &fc) { return fc.path == rec.path; });
      const std::string produced =
          c == plan.changes.end() ? current_id(tree, rec.path)
                                  : (c->after ? content_id(*c->after) : std::string{});
      if (produced == rec.before)
        continue;
      std::string detail = "reversal does not restore the recorded pre-image";
      if (!rec.before.empty() && c != plan.changes.end() && c->after) {
        const auto want = store.read(rec.before);
        detail += "\n" + diff::unified_diff(diff::split_lines(fs::as_text(want)),
                                            diff::split_lines(fs::as_text(*c->after)),
                                            "recorded " + rec.path, "reversed " + rec.path);
      }
      throw PatchConflictError(PatchFailure{.patch_id = p.id,
                                            .applied = ledger.ids(),
                                            .path = rec.path,
                                            .detail = std::move(detail),
                                            .reversing = true});
    }

    report.files_written += write_changes(tree, plan.changes);
    ledger.pop();
    if (ledger.empty())
      Ledger::clear(tree);
    else
      ledger.save(tree);

    report.results.push_back(PatchResult{
        .id = p.id, .state = PatchState::Reversed, .files = change_paths(plan.changes)});
    logger->info("reversed {}", p.id);
  }
  return report;
}

StackStatus PatchStack::status(const WorkingTree &tree) const {
  const Ledger ledger = Ledger::load(tree);
  StackStatus st;
  const auto &recorded = ledger.entries();
  std::size_t i = 0;
  for (; i < recorded.size() && i < patches_.size(); ++i) {
    if (recorded[i].id != patches_[i].id || recorded[i].digest != patches_[i].digest)
      break;
    st.applied.push_back(recorded[i].id);
  }
  for (std::size_t j = i; j < recorded.size(); ++j)
    st.foreign.push_back(recorded[j].id);
  for (std::size_t j = i; j < patches_.size(); ++j)
    st.pending.push_back(patches_[j].id);
  st.drifted = find_drift(tree, ledger);
  return st;
}

} // namespace patchwright
