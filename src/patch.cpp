#include "patchwright/patch.hpp"

#include "patchwright/hash.hpp"
#include "patchwright/working_tree.hpp"

#include <algorithm>
#include <charconv>
#include <set>
#include <stdexcept>

namespace patchwright {

namespace {

[[nodiscard]] auto parse_error(std::size_t lineno, std::string_view msg) -> std::runtime_error {
  return std::runtime_error("line " + std::to_string(lineno) + ": " + std::string(msg));
}

std::string_view chomp(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.remove_suffix(1);
  return line;
}

// "a/foo/bar.cc\t2024-01-01 ..." -> "foo/bar.cc"; "/dev/null" -> ""
std::string header_path(std::string_view raw) {
  raw = chomp(raw);
  if (const auto tab = raw.find('\t'); tab != std::string_view::npos)
    raw = raw.substr(0, tab);
  if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"')
    raw = raw.substr(1, raw.size() - 2);
  if (raw == "/dev/null")
    return {};
  if (raw.starts_with("a/") || raw.starts_with("b/"))
    raw.remove_prefix(2);
  return std::string(raw);
}

bool parse_number(std::string_view sv, std::size_t &out) {
  if (sv.empty())
    return false;
  const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc() && ptr == sv.data() + sv.size();
}

// "-12,5" or "-12" (count defaults to 1)
bool parse_range(std::string_view sv, char sign, std::size_t &start, std::size_t &count) {
  if (sv.empty() || sv.front() != sign)
    return false;
  sv.remove_prefix(1);
  const auto comma = sv.find(',');
  if (comma == std::string_view::npos) {
    count = 1;
    return parse_number(sv, start);
  }
  return parse_number(sv.substr(0, comma), start) && parse_number(sv.substr(comma + 1), count);
}

bool parse_hunk_header(std::string_view line, Hunk &h) {
  // @@ -a,b +c,d @@ optional section heading
  line = chomp(line);
  if (!line.starts_with("@@ "))
    return false;
  line.remove_prefix(3);
  const auto sp = line.find(' ');
  if (sp == std::string_view::npos)
    return false;
  const auto old_range = line.substr(0, sp);
  line.remove_prefix(sp + 1);
  const auto sp2 = line.find(' ');
  const auto new_range = line.substr(0, sp2);
  return parse_range(old_range, '-', h.old_start, h.old_count) &&
         parse_range(new_range, '+', h.new_start, h.new_count);
}

struct Cursor {
  std::vector<std::string> lines;
  std::size_t pos = 0;

  [[nodiscard]] bool done() const { return pos >= lines.size(); }
  [[nodiscard]] std::string_view peek() const { return lines[pos]; }
  [[nodiscard]] std::size_t lineno() const { return pos + 1; }
};

void read_hunk_body(Cursor &cur, Hunk &h) {
  std::size_t old_seen = 0;
  std::size_t new_seen = 0;
  while (old_seen < h.old_count || new_seen < h.new_count) {
    if (cur.done())
      throw parse_error(cur.lineno(), "hunk truncated");
    const std::string_view line = cur.peek();
    const char tag = line.empty() ? ' ' : line.front();
    if (tag == '\\') { // marker for the line before
      if (h.lines.empty())
        throw parse_error(cur.lineno(), "no-newline marker without a line");
      auto &prev = h.lines.back().text;
      if (!prev.empty() && prev.back() == '\n')
        prev.pop_back();
      ++cur.pos;
      continue;
    }
    // Some tools strip the single space of an empty context line.
    std::string text = (line == "\n" || line == "\r\n") ? std::string(line)
                                                        : std::string(line.substr(1));
    if (line == "\n" || line == "\r\n" || tag == ' ') {
      h.lines.push_back({LineKind::Context, std::move(text)});
      ++old_seen;
      ++new_seen;
    } else if (tag == '-') {
      h.lines.push_back({LineKind::Remove, std::move(text)});
      ++old_seen;
    } else if (tag == '+') {
      h.lines.push_back({LineKind::Add, std::move(text)});
      ++new_seen;
    } else {
      throw parse_error(cur.lineno(), "unexpected line inside hunk");
    }
    ++cur.pos;
    if (old_seen > h.old_count || new_seen > h.new_count)
      throw parse_error(cur.lineno(), "hunk longer than its header says");
  }
  // Trailing "\ No newline at end of file" for the final line.
  if (!cur.done() && cur.peek().starts_with("\\")) {
    auto &prev = h.lines.back().text;
    if (!prev.empty() && prev.back() == '\n')
      prev.pop_back();
    ++cur.pos;
  }
}

void finish_section(std::vector<FilePatch> &out, FilePatch &fp, bool &open) {
  if (!open)
    return;
  open = false;
  if (fp.op == FileOp::Modify && fp.hunks.empty() && !fp.is_rename())
    return; // mode-only change
  if (!fp.old_path.empty())
    check_relative(fp.old_path);
  if (!fp.new_path.empty())
    check_relative(fp.new_path);
  out.push_back(std::move(fp));
}

} // namespace

std::vector<std::string> Hunk::preimage() const {
  std::vector<std::string> out;
  for (const auto &l : lines)
    if (l.kind != LineKind::Add)
      out.push_back(l.text);
  return out;
}

std::vector<std::string> Hunk::postimage() const {
  std::vector<std::string> out;
  for (const auto &l : lines)
    if (l.kind != LineKind::Remove)
      out.push_back(l.text);
  return out;
}

std::vector<std::string> Patch::touched_paths() const {
  std::set<std::string> paths;
  for (const auto &f : files) {
    if (!f.old_path.empty())
      paths.insert(f.old_path);
    if (!f.new_path.empty())
      paths.insert(f.new_path);
  }
  return {paths.begin(), paths.end()};
}

std::vector<std::string> split_keep_newlines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    const auto nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      out.emplace_back(text.substr(start));
      break;
    }
    out.emplace_back(text.substr(start, nl - start + 1));
    start = nl + 1;
  }
  return out;
}

std::vector<FilePatch> parse_unified_diff(std::string_view text) {
  Cursor cur{split_keep_newlines(text)};
  std::vector<FilePatch> out;
  FilePatch fp;
  bool open = false;    // a file section is being collected
  bool git_hdr = false; // section started by "diff --git"

  while (!cur.done()) {
    const std::string_view line = cur.peek();

    if (line.starts_with("diff --git ")) {
      finish_section(out, fp, open);
      fp = FilePatch{};
      open = true;
      git_hdr = true;
      // diff --git a/x b/x : only reliable when paths have no spaces
      const auto rest = chomp(line.substr(11));
      if (const auto sp = rest.find(" b/"); sp != std::string_view::npos) {
        fp.old_path = header_path(rest.substr(0, sp));
        fp.new_path = header_path(rest.substr(sp + 1));
      }
      ++cur.pos;
      continue;
    }
    if (open && git_hdr && fp.hunks.empty()) {
      const auto l = chomp(line);
      if (l.starts_with("new file mode")) {
        fp.op = FileOp::Create;
        fp.executable = l.ends_with("755");
        fp.old_path.clear();
        ++cur.pos;
        continue;
      }
      if (l.starts_with("deleted file mode")) {
        fp.op = FileOp::Delete;
        fp.executable = l.ends_with("755");
        fp.new_path.clear();
        ++cur.pos;
        continue;
      }
      if (l.starts_with("rename from ")) {
        fp.old_path = std::string(l.substr(12));
        ++cur.pos;
        continue;
      }
      if (l.starts_with("rename to ")) {
        fp.new_path = std::string(l.substr(10));
        ++cur.pos;
        continue;
      }
      if (l.starts_with("GIT binary patch") || l.starts_with("Binary files ")) {
        throw parse_error(cur.lineno(), "binary patches are not supported");
      }
    }
    if (line.starts_with("--- ") && cur.pos + 1 < cur.lines.size() &&
        cur.lines[cur.pos + 1].starts_with("+++ ")) {
      if (!(open && git_hdr && fp.hunks.empty())) {
        finish_section(out, fp, open);
        fp = FilePatch{};
        open = true;
        git_hdr = false;
      }
      const auto from = header_path(line.substr(4));
      const auto to = header_path(std::string_view(cur.lines[cur.pos + 1]).substr(4));
      if (from.empty() && to.empty())
        throw parse_error(cur.lineno(), "both sides are /dev/null");
      if (from.empty()) {
        fp.op = FileOp::Create;
        fp.old_path.clear();
        fp.new_path = to;
      } else if (to.empty()) {
        fp.op = FileOp::Delete;
        fp.old_path = from;
        fp.new_path.clear();
      } else {
        fp.old_path = from;
        fp.new_path = to;
      }
      cur.pos += 2;
      continue;
    }
    if (line.starts_with("@@ ")) {
      if (!open)
        throw parse_error(cur.lineno(), "hunk without file header");
      Hunk h;
      if (!parse_hunk_header(line, h))
        throw parse_error(cur.lineno(), "malformed hunk header");
      ++cur.pos;
      read_hunk_body(cur, h);
      fp.hunks.push_back(std::move(h));
      continue;
    }
    // Mail headers, commit message, index lines, signature: not part of the diff.
    ++cur.pos;
  }
  finish_section(out, fp, open);
  return out;
}

Patch make_patch(std::string id, std::string_view text) {
  Patch p;
  p.id = std::move(id);
  p.digest = to_hex(sha1(text));
  p.files = parse_unified_diff(text);
  return p;
}

FilePatch inverted(const FilePatch &fp) {
  FilePatch out;
  out.old_path = fp.new_path;
  out.new_path = fp.old_path;
  out.executable = fp.executable;
  switch (fp.op) {
  case FileOp::Create: out.op = FileOp::Delete; break;
  case FileOp::Delete: out.op = FileOp::Create; break;
  case FileOp::Modify: out.op = FileOp::Modify; break;
  }
  out.hunks.reserve(fp.hunks.size());
  for (const auto &h : fp.hunks) {
    Hunk r;
    r.old_start = h.new_start;
    r.old_count = h.new_count;
    r.new_start = h.old_start;
    r.new_count = h.old_count;
    r.lines.reserve(h.lines.size());
    for (const auto &l : h.lines) {
      const LineKind k = l.kind == LineKind::Add      ? LineKind::Remove
                         : l.kind == LineKind::Remove ? LineKind::Add
                                                      : LineKind::Context;
      r.lines.push_back({k, l.text});
    }
    out.hunks.push_back(std::move(r));
  }
  return out;
}

} // namespace patchwright
