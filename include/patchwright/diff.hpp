#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright::diff {

enum class Op : std::uint8_t { Keep, Delete, Insert };

// Shortest edit script turning `a` into `b` (Myers O(ND)).
std::vector<Op> edit_script(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Unified rendering of the difference, `context` unchanged lines around each
// change, used to show how a file region differs from what a patch expects.
// Identical input yields the two header lines only.
std::string unified_diff(const std::vector<std::string>& a, const std::vector<std::string>& b,
                         std::string_view from_label, std::string_view to_label,
                         std::size_t context = 3);

// Split raw text into lines (newline characters dropped, CR stripped).
std::vector<std::string> split_lines(std::string_view text);

} // namespace patchwright::diff
