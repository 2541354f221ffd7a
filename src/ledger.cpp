#include "patchwright/ledger.hpp"

#include "patchwright/consts.hpp"
#include "patchwright/fs.hpp"
#include "patchwright/util.hpp"
#include "patchwright/working_tree.hpp"

#include <sstream>
#include <stdexcept>

namespace patchwright {

namespace {

std::string oid_field(const std::string &hex) {
  return hex.empty() ? std::string(consts::kAbsentOid) : hex;
}

std::string parse_oid_field(std::string_view field) {
  if (field == consts::kAbsentOid)
    return {};
  if (!looks_hex40(field))
    throw std::runtime_error("ledger: bad object id '" + std::string(field) + "'");
  return std::string(field);
}

// Split off the first space-separated token of `rest`.
std::string_view take_token(std::string_view &rest) {
  const auto sp = rest.find(consts::kSpace);
  if (sp == std::string_view::npos)
    throw std::runtime_error("ledger: truncated line");
  const auto tok = rest.substr(0, sp);
  rest.remove_prefix(sp + 1);
  return tok;
}

} // namespace

Ledger Ledger::load(const WorkingTree &tree) {
  Ledger out;
  if (!tree.has_state(consts::kLedgerFile))
    return out;

  const auto bytes = tree.read_state(consts::kLedgerFile);
  std::istringstream iss(std::string(bytes.begin(), bytes.end()));
  std::string line;
  bool header = false;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty())
      continue;
    if (!header) {
      if (line != consts::kLedgerHeader)
        throw std::runtime_error("ledger: unknown format '" + line + "'");
      header = true;
      continue;
    }
    std::string_view sv{line};
    if (sv.starts_with(consts::kPatchPrefix)) {
      sv.remove_prefix(consts::kPatchPrefix.size());
      LedgerEntry e;
      e.digest = parse_oid_field(take_token(sv));
      e.id = std::string(sv);
      out.entries_.push_back(std::move(e));
    } else if (sv.starts_with(consts::kFilePrefix)) {
      if (out.entries_.empty())
        throw std::runtime_error("ledger: file record before any patch");
      sv.remove_prefix(consts::kFilePrefix.size());
      LedgerFile f;
      f.before = parse_oid_field(take_token(sv));
      f.after = parse_oid_field(take_token(sv));
      f.path = std::string(sv);
      out.entries_.back().files.push_back(std::move(f));
    } else {
      throw std::runtime_error("ledger: unexpected line '" + line + "'");
    }
  }
  return out;
}

void Ledger::save(WorkingTree &tree) const {
  std::ostringstream os;
  os << consts::kLedgerHeader << '\n';
  for (const auto &e : entries_) {
    os << consts::kPatchPrefix << e.digest << consts::kSpace << e.id << '\n';
    for (const auto &f : e.files) {
      os << consts::kFilePrefix << oid_field(f.before) << consts::kSpace << oid_field(f.after)
         << consts::kSpace << f.path << '\n';
    }
  }
  const std::string s = os.str();
  tree.write_state(consts::kLedgerFile, fs::as_bytes(s));
}

void Ledger::clear(WorkingTree &tree) {
  tree.remove_state(consts::kLedgerFile);
  tree.remove_state(consts::kObjectsDir);
}

std::vector<std::string> Ledger::ids() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &e : entries_)
    out.push_back(e.id);
  return out;
}

} // namespace patchwright
