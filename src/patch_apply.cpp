#include "patchwright/patch_apply.hpp"

#include "patchwright/diff.hpp"
#include "patchwright/working_tree.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace patchwright {

namespace {

std::string strip_eol(std::string_view s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.remove_suffix(1);
  return std::string(s);
}

bool matches_at(const std::vector<std::string> &lines, const std::vector<std::string> &pre,
                std::size_t pos) {
  for (std::size_t j = 0; j < pre.size(); ++j)
    if (lines[pos + j] != pre[j])
      return false;
  return true;
}

// Nearest position >= min_pos where `pre` occurs, starting the search at `nominal`.
std::optional<std::size_t> locate(const std::vector<std::string> &lines,
                                  const std::vector<std::string> &pre, long nominal,
                                  std::size_t min_pos) {
  if (pre.size() > lines.size())
    return std::nullopt;
  const long max_pos = static_cast<long>(lines.size() - pre.size());
  const long lo = static_cast<long>(min_pos);
  if (lo > max_pos)
    return std::nullopt;
  const long start = std::clamp(nominal, lo, max_pos);
  for (long d = 0;; ++d) {
    bool in_range = false;
    if (const long fwd = start + d; fwd <= max_pos) {
      in_range = true;
      if (matches_at(lines, pre, static_cast<std::size_t>(fwd)))
        return static_cast<std::size_t>(fwd);
    }
    if (const long back = start - d; d > 0 && back >= lo) {
      in_range = true;
      if (matches_at(lines, pre, static_cast<std::size_t>(back)))
        return static_cast<std::size_t>(back);
    }
    if (!in_range)
      return std::nullopt;
  }
}

std::string mismatch_excerpt(const std::vector<std::string> &lines,
                             const std::vector<std::string> &pre, long nominal,
                             std::size_t hunk_index, std::string_view path) {
  std::vector<std::string> expected;
  expected.reserve(pre.size());
  for (const auto &l : pre)
    expected.push_back(strip_eol(l));

  std::vector<std::string> actual;
  const auto from = static_cast<std::size_t>(
      std::clamp<long>(nominal, 0, static_cast<long>(lines.size())));
  for (std::size_t j = from; j < lines.size() && actual.size() < pre.size(); ++j)
    actual.push_back(strip_eol(lines[j]));

  const std::string header = "hunk #" + std::to_string(hunk_index + 1) + " expected near line " +
                             std::to_string(from + 1);
  return diff::unified_diff(expected, actual, header, std::string(path));
}

using Content = std::optional<std::vector<std::uint8_t>>;

std::string as_string(const std::vector<std::uint8_t> &bytes) {
  return {bytes.begin(), bytes.end()};
}

std::vector<std::uint8_t> as_vector(const std::string &s) {
  return {s.begin(), s.end()};
}

} // namespace

HunkApplyResult apply_hunks(std::string_view original, const std::vector<Hunk> &hunks,
                            std::string_view path) {
  const auto lines = split_keep_newlines(original);
  HunkApplyResult res;
  std::string out;
  out.reserve(original.size());
  std::size_t cursor = 0;
  long drift = 0;

  for (std::size_t i = 0; i < hunks.size(); ++i) {
    const auto &h = hunks[i];
    const auto pre = h.preimage();
    const auto post = h.postimage();
    // Header line numbers are 1-based; a zero-length old range names the line before.
    const long base = h.old_count == 0 ? static_cast<long>(h.old_start)
                                       : static_cast<long>(h.old_start) - 1;
    const auto found = locate(lines, pre, base + drift, cursor);
    if (!found) {
      res.failed_hunk = i;
      res.detail = mismatch_excerpt(lines, pre, base + drift, i, path);
      return res;
    }
    for (std::size_t j = cursor; j < *found; ++j)
      out += lines[j];
    for (const auto &l : post)
      out += l;
    cursor = *found + pre.size();
    drift = static_cast<long>(*found) - base;
  }
  for (std::size_t j = cursor; j < lines.size(); ++j)
    out += lines[j];

  res.ok = true;
  res.content = std::move(out);
  return res;
}

PatchPlan plan_changes(const WorkingTree &tree, const std::vector<FilePatch> &files) {
  PatchPlan plan;
  std::map<std::string, Content> staged;
  std::map<std::string, Content> before;
  std::set<std::string> executable;
  std::vector<std::string> order;

  auto current = [&](const std::string &p) -> Content {
    if (const auto it = staged.find(p); it != staged.end())
      return it->second;
    if (tree.exists(p))
      return tree.read(p);
    return std::nullopt;
  };
  auto stage = [&](const std::string &p, Content after) {
    if (!before.contains(p)) {
      before[p] = tree.exists(p) ? Content(tree.read(p)) : std::nullopt;
      order.push_back(p);
    }
    staged[p] = std::move(after);
  };
  auto fail = [&](PlanFailure kind, const std::string &p, std::string detail) {
    plan.failure = kind;
    plan.failed_path = p;
    plan.detail = std::move(detail);
    plan.changes.clear();
    return plan;
  };

  for (const auto &fp : files) {
    switch (fp.op) {
    case FileOp::Modify: {
      const auto cur = current(fp.old_path);
      if (!cur)
        return fail(PlanFailure::TargetMissing, fp.old_path, "file does not exist in the tree");
      auto r = apply_hunks(as_string(*cur), fp.hunks, fp.old_path);
      if (!r.ok)
        return fail(PlanFailure::Conflict, fp.old_path, std::move(r.detail));
      if (fp.is_rename()) {
        if (current(fp.new_path))
          return fail(PlanFailure::Conflict, fp.new_path, "rename destination already exists");
        const bool staged_exec = executable.contains(fp.old_path);
        if (staged_exec || (!staged.contains(fp.old_path) && tree.is_executable(fp.old_path)))
          executable.insert(fp.new_path);
        stage(fp.old_path, std::nullopt);
        stage(fp.new_path, as_vector(r.content));
      } else {
        stage(fp.old_path, as_vector(r.content));
      }
      break;
    }
    case FileOp::Create: {
      if (current(fp.new_path))
        return fail(PlanFailure::Conflict, fp.new_path, "file to be created already exists");
      auto r = apply_hunks({}, fp.hunks, fp.new_path);
      if (!r.ok)
        return fail(PlanFailure::Conflict, fp.new_path, std::move(r.detail));
      stage(fp.new_path, as_vector(r.content));
      if (fp.executable)
        executable.insert(fp.new_path);
      break;
    }
    case FileOp::Delete: {
      const auto cur = current(fp.old_path);
      if (!cur)
        return fail(PlanFailure::TargetMissing, fp.old_path, "file to delete does not exist");
      auto r = apply_hunks(as_string(*cur), fp.hunks, fp.old_path);
      if (!r.ok)
        return fail(PlanFailure::Conflict, fp.old_path, std::move(r.detail));
      if (!r.content.empty())
        return fail(PlanFailure::Conflict, fp.old_path,
                    "file has content the deletion does not account for");
      stage(fp.old_path, std::nullopt);
      break;
    }
    }
  }

  plan.changes.reserve(order.size());
  for (const auto &p : order)
    plan.changes.push_back(FileChange{.path = p,
                                      .before = before[p],
                                      .after = staged[p],
                                      .executable = staged[p] && executable.contains(p)});
  return plan;
}

} // namespace patchwright
