#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Id of a file image: SHA-1 over "blob <size>\0" + data, as 40-hex.
// Matches `git hash-object` for the same bytes.
auto content_id(std::span<const std::uint8_t> bytes) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip spaces, tabs and CR/LF on both ends
  auto trim(std::string_view sv) -> std::string;

  auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
}

} // namespace patchwright
