#include "patchwright/working_tree.hpp"

#include "patchwright/consts.hpp"
#include "patchwright/fs.hpp"

#include <stdexcept>

namespace pfs = patchwright::fs;

namespace patchwright {

void check_relative(std::string_view rel) {
  if (rel.empty())
    throw std::runtime_error("empty tree path");
  if (rel.front() == '/' || rel.find('\\') != std::string_view::npos)
    throw std::runtime_error("tree path must be relative: " + std::string(rel));
  std::size_t pos = 0;
  while (pos <= rel.size()) {
    const std::size_t slash = rel.find('/', pos);
    const auto part = rel.substr(pos, slash == std::string_view::npos ? rel.npos : slash - pos);
    if (part.empty() || part == "." || part == "..")
      throw std::runtime_error("invalid tree path: " + std::string(rel));
    if (slash == std::string_view::npos)
      break;
    pos = slash + 1;
  }
}

static void check_state_name(std::string_view name) {
  check_relative(name);
}

// --- DiskWorkingTree ---

DiskWorkingTree::DiskWorkingTree(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  if (std::filesystem::is_directory(root_ / consts::kGitDir, ec))
    state_dir_ = root_ / consts::kGitDir / consts::kStateDirName;
  else
    state_dir_ = root_ / consts::kStateFallback;
}

bool DiskWorkingTree::exists(std::string_view rel) const {
  check_relative(rel);
  std::error_code ec;
  return std::filesystem::is_regular_file(root_ / rel, ec);
}

std::vector<std::uint8_t> DiskWorkingTree::read(std::string_view rel) const {
  check_relative(rel);
  return pfs::read_file(root_ / rel);
}

void DiskWorkingTree::write(std::string_view rel, std::span<const std::uint8_t> bytes) {
  check_relative(rel);
  pfs::write_file_atomic(root_ / rel, bytes);
}

void DiskWorkingTree::remove(std::string_view rel) {
  check_relative(rel);
  const auto p = root_ / rel;
  std::error_code ec;
  std::filesystem::remove(p, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + p.string() + ": " + ec.message());
  // Drop directories the removal left empty, up to the root.
  for (auto dir = p.parent_path(); dir != root_ && dir.has_parent_path();
       dir = dir.parent_path()) {
    if (!std::filesystem::is_empty(dir, ec) || ec)
      break;
    std::filesystem::remove(dir, ec);
  }
}

void DiskWorkingTree::remove_tree(std::string_view rel) {
  check_relative(rel);
  const auto p = root_ / rel;
  std::error_code ec;
  std::filesystem::remove_all(p, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + p.string() + ": " + ec.message());
}

std::set<std::string> DiskWorkingTree::list() const {
  std::set<std::string> out;
  for (auto it = std::filesystem::recursive_directory_iterator(root_);
       it != std::filesystem::recursive_directory_iterator(); ++it) {
    const auto &p = it->path();
    if (it.depth() == 0 &&
        (p.filename() == consts::kGitDir || p.filename() == consts::kStateFallback)) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file()) {
      continue;
    }
    out.insert(std::filesystem::relative(p, root_).generic_string());
  }
  return out;
}

bool DiskWorkingTree::has_state(std::string_view name) const {
  check_state_name(name);
  return pfs::exists(state_dir_ / name);
}

std::vector<std::uint8_t> DiskWorkingTree::read_state(std::string_view name) const {
  check_state_name(name);
  return pfs::read_file(state_dir_ / name);
}

bool DiskWorkingTree::is_executable(std::string_view rel) const {
  check_relative(rel);
  std::error_code ec;
  const auto st = std::filesystem::status(root_ / rel, ec);
  if (ec || !std::filesystem::is_regular_file(st))
    return false;
  return (st.permissions() & std::filesystem::perms::owner_exec) != std::filesystem::perms::none;
}

void DiskWorkingTree::set_executable(std::string_view rel) {
  check_relative(rel);
  using std::filesystem::perms;
  std::error_code ec;
  std::filesystem::permissions(root_ / rel, perms::owner_exec | perms::group_exec | perms::others_exec,
                               std::filesystem::perm_options::add, ec);
  if (ec)
    throw std::runtime_error("chmod failed: " + (root_ / rel).string() + ": " + ec.message());
}

void DiskWorkingTree::write_state(std::string_view name, std::span<const std::uint8_t> bytes) {
  check_state_name(name);
  pfs::write_file_atomic(state_dir_ / name, bytes);
}

void DiskWorkingTree::remove_state(std::string_view name) {
  check_state_name(name);
  std::error_code ec;
  std::filesystem::remove_all(state_dir_ / name, ec);
  if (ec)
    throw std::runtime_error("remove state failed: " + std::string(name) + ": " + ec.message());
}

// --- MemoryWorkingTree ---

MemoryWorkingTree::MemoryWorkingTree(std::filesystem::path root) : root_(std::move(root)) {}

bool MemoryWorkingTree::exists(std::string_view rel) const {
  check_relative(rel);
  return files_.find(rel) != files_.end();
}

std::vector<std::uint8_t> MemoryWorkingTree::read(std::string_view rel) const {
  check_relative(rel);
  const auto it = files_.find(rel);
  if (it == files_.end())
    throw std::runtime_error("open for read failed: " + std::string(rel));
  return it->second;
}

void MemoryWorkingTree::write(std::string_view rel, std::span<const std::uint8_t> bytes) {
  check_relative(rel);
  files_.insert_or_assign(std::string(rel), std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
  ++mutations_;
}

void MemoryWorkingTree::remove(std::string_view rel) {
  check_relative(rel);
  if (const auto it = files_.find(rel); it != files_.end()) {
    executable_.erase(it->first);
    files_.erase(it);
    ++mutations_;
  }
}

void MemoryWorkingTree::remove_tree(std::string_view rel) {
  check_relative(rel);
  const std::string prefix = std::string(rel) + "/";
  for (auto it = files_.begin(); it != files_.end();) {
    if (it->first == rel || it->first.starts_with(prefix)) {
      executable_.erase(it->first);
      it = files_.erase(it);
      ++mutations_;
    } else {
      ++it;
    }
  }
}

std::set<std::string> MemoryWorkingTree::list() const {
  std::set<std::string> out;
  for (const auto &[path, _] : files_)
    out.insert(path);
  return out;
}

bool MemoryWorkingTree::is_executable(std::string_view rel) const {
  check_relative(rel);
  return executable_.find(rel) != executable_.end();
}

void MemoryWorkingTree::set_executable(std::string_view rel) {
  check_relative(rel);
  if (files_.find(rel) == files_.end())
    throw std::runtime_error("chmod failed: " + std::string(rel));
  executable_.emplace(rel);
}

bool MemoryWorkingTree::has_state(std::string_view name) const {
  check_state_name(name);
  return state_.find(name) != state_.end();
}

std::vector<std::uint8_t> MemoryWorkingTree::read_state(std::string_view name) const {
  check_state_name(name);
  const auto it = state_.find(name);
  if (it == state_.end())
    throw std::runtime_error("open for read failed: state " + std::string(name));
  return it->second;
}

void MemoryWorkingTree::write_state(std::string_view name, std::span<const std::uint8_t> bytes) {
  check_state_name(name);
  state_.insert_or_assign(std::string(name), std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

void MemoryWorkingTree::remove_state(std::string_view name) {
  check_state_name(name);
  // A state name may denote a directory: drop everything beneath it too.
  const std::string prefix = std::string(name) + "/";
  for (auto it = state_.begin(); it != state_.end();) {
    if (it->first == name || it->first.starts_with(prefix))
      it = state_.erase(it);
    else
      ++it;
  }
}

void MemoryWorkingTree::put(std::string_view rel, std::string_view text) {
  write(rel, pfs::as_bytes(text));
}

std::string MemoryWorkingTree::text(std::string_view rel) const {
  const auto bytes = read(rel);
  return {bytes.begin(), bytes.end()};
}

} // namespace patchwright
