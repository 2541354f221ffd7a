// Content ids and small string helpers
#include "patchwright/util.hpp"

#include "patchwright/consts.hpp"
#include "patchwright/hash.hpp"

#include <algorithm>
#include <cctype>

namespace patchwright {

bool looks_hex40(std::string_view str) {
  return str.size() == consts::kOidHexLen &&
         std::ranges::all_of(str, [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string content_id(std::span<const std::uint8_t> bytes) { return to_hex(blob_id(bytes)); }

namespace strutil {

void rstrip_newlines(std::string &s) {
  const auto last = s.find_last_not_of("\r\n");
  s.erase(last == std::string::npos ? 0 : last + 1);
}

std::string trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i)
      out.append(sep);
    out.append(parts[i]);
  }
  return out;
}

} // namespace strutil

} // namespace patchwright
