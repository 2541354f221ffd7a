#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);

// Write through a sibling temp file and rename over `p`.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Regular files under `dir` as generic relative paths, sorted.
std::vector<std::string> list_files(const std::filesystem::path& dir);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

inline std::string_view as_text(std::span<const std::uint8_t> b) {
  return {reinterpret_cast<const char*>(b.data()), b.size()};
}

} // namespace patchwright::fs
