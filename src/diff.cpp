#include "patchwright/diff.hpp"

#include <algorithm>

namespace patchwright::diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  while (!text.empty()) {
    const auto nl = text.find('\n');
    std::string_view line = text.substr(0, nl);
    if (line.ends_with('\r'))
      line.remove_suffix(1);
    out.emplace_back(line);
    if (nl == std::string_view::npos)
      break;
    text.remove_prefix(nl + 1);
  }
  return out;
}

std::vector<Op> edit_script(const std::vector<std::string> &a, const std::vector<std::string> &b) {
  const int n = static_cast<int>(a.size());
  const int m = static_cast<int>(b.size());
  const int max = n + m;
  if (max == 0)
    return {};

  // v[k + max]: furthest x reached on diagonal k; one snapshot per edit distance.
  std::vector<int> v(2 * static_cast<std::size_t>(max) + 2, 0);
  std::vector<std::vector<int>> trace;
  int d = 0;
  for (;; ++d) {
    trace.push_back(v);
    bool done = false;
    for (int k = -d; k <= d && !done; k += 2) {
      const bool down = k == -d || (k != d && v[k - 1 + max] < v[k + 1 + max]);
      int x = down ? v[k + 1 + max] : v[k - 1 + max] + 1;
      int y = x - k;
      while (x < n && y < m && a[x] == b[y]) {
        ++x;
        ++y;
      }
      v[k + max] = x;
      done = x >= n && y >= m;
    }
    if (done)
      break;
  }

  std::vector<Op> ops;
  int x = n;
  int y = m;
  for (; d > 0; --d) {
    const auto &prev = trace[d];
    const int k = x - y;
    const bool down = k == -d || (k != d && prev[k - 1 + max] < prev[k + 1 + max]);
    const int pk = down ? k + 1 : k - 1;
    const int px = prev[pk + max];
    const int py = px - pk;
    for (; x > px && y > py; --x, --y)
      ops.push_back(Op::Keep);
    ops.push_back(down ? Op::Insert : Op::Delete);
    x = px;
    y = py;
  }
  for (; x > 0 && y > 0; --x, --y)
    ops.push_back(Op::Keep);
  std::ranges::reverse(ops);
  return ops;
}

namespace {

struct Row {
  Op op;
  std::size_t a; // line index in a (next line for inserts)
  std::size_t b; // line index in b (next line for deletes)
};

std::string range(std::size_t start, std::size_t count) {
  // Empty ranges name the line before them, as diff(1) does.
  const std::size_t first = count == 0 ? start : start + 1;
  return std::to_string(first) + "," + std::to_string(count);
}

} // namespace

std::string unified_diff(const std::vector<std::string> &a, const std::vector<std::string> &b,
                         std::string_view from_label, std::string_view to_label,
                         std::size_t context) {
  std::string out;
  out.append("--- ").append(from_label).append("\n");
  out.append("+++ ").append(to_label).append("\n");

  std::vector<Row> rows;
  std::size_t ia = 0;
  std::size_t ib = 0;
  for (const Op op : edit_script(a, b)) {
    rows.push_back({op, ia, ib});
    if (op != Op::Insert)
      ++ia;
    if (op != Op::Delete)
      ++ib;
  }

  std::size_t i = 0;
  while (i < rows.size()) {
    if (rows[i].op == Op::Keep) {
      ++i;
      continue;
    }
    // Grow the hunk while the next change is within 2 * context kept lines.
    const std::size_t begin = i > context ? i - context : 0;
    std::size_t end = i;
    std::size_t kept = 0;
    for (std::size_t j = i; j < rows.size(); ++j) {
      if (rows[j].op != Op::Keep) {
        end = j + 1;
        kept = 0;
      } else if (++kept > 2 * context) {
        break;
      }
    }
    end = std::min(rows.size(), end + context);

    std::size_t a_count = 0;
    std::size_t b_count = 0;
    std::string body;
    for (std::size_t j = begin; j < end; ++j) {
      const Row &r = rows[j];
      switch (r.op) {
      case Op::Keep:
        body.append(" ").append(a[r.a]).append("\n");
        ++a_count;
        ++b_count;
        break;
      case Op::Delete:
        body.append("-").append(a[r.a]).append("\n");
        ++a_count;
        break;
      case Op::Insert:
        body.append("+").append(b[r.b]).append("\n");
        ++b_count;
        break;
      }
    }
    out.append("@@ -" + range(rows[begin].a, a_count) + " +" + range(rows[begin].b, b_count) +
               " @@\n");
    out.append(body);
    i = end;
  }
  return out;
}

} // namespace patchwright::diff
