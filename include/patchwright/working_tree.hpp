#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

// Mutable checkout of the upstream project.
// Paths are tree-relative, '/'-separated, never absolute and never containing "..".
// The state area (ledger, object store, lock) is separate from the file namespace
// and never shows up in list().
class WorkingTree {
public:
  virtual ~WorkingTree() = default;

  [[nodiscard]] virtual auto root() const -> const std::filesystem::path& = 0;

  [[nodiscard]] virtual bool exists(std::string_view rel) const = 0;
  [[nodiscard]] virtual auto read(std::string_view rel) const -> std::vector<std::uint8_t> = 0;
  virtual void write(std::string_view rel, std::span<const std::uint8_t> bytes) = 0;
  virtual void remove(std::string_view rel) = 0;
  // Remove a file or a whole directory; absent paths are ignored.
  virtual void remove_tree(std::string_view rel) = 0;
  [[nodiscard]] virtual auto list() const -> std::set<std::string> = 0;

  // Exec bits. write() keeps the mode of a file it replaces.
  [[nodiscard]] virtual bool is_executable(std::string_view rel) const = 0;
  virtual void set_executable(std::string_view rel) = 0;

  [[nodiscard]] virtual bool has_state(std::string_view name) const = 0;
  [[nodiscard]] virtual auto read_state(std::string_view name) const
      -> std::vector<std::uint8_t> = 0;
  virtual void write_state(std::string_view name, std::span<const std::uint8_t> bytes) = 0;
  virtual void remove_state(std::string_view name) = 0;

  // Directory holding the state area on disk, if any (lock files need one).
  [[nodiscard]] virtual auto state_dir() const -> std::optional<std::filesystem::path> = 0;
};

// Throws std::runtime_error unless `rel` is a clean tree-relative path.
void check_relative(std::string_view rel);

class DiskWorkingTree final : public WorkingTree {
public:
  // State goes to <root>/.git/patchwright when .git is a directory,
  // otherwise to <root>/.patchwright.
  explicit DiskWorkingTree(std::filesystem::path root);

  [[nodiscard]] auto root() const -> const std::filesystem::path& override { return root_; }

  [[nodiscard]] bool exists(std::string_view rel) const override;
  [[nodiscard]] auto read(std::string_view rel) const -> std::vector<std::uint8_t> override;
  void write(std::string_view rel, std::span<const std::uint8_t> bytes) override;
  void remove(std::string_view rel) override;
  void remove_tree(std::string_view rel) override;
  [[nodiscard]] auto list() const -> std::set<std::string> override;
  [[nodiscard]] bool is_executable(std::string_view rel) const override;
  void set_executable(std::string_view rel) override;

  [[nodiscard]] bool has_state(std::string_view name) const override;
  [[nodiscard]] auto read_state(std::string_view name) const
      -> std::vector<std::uint8_t> override;
  void write_state(std::string_view name, std::span<const std::uint8_t> bytes) override;
  void remove_state(std::string_view name) override;
  [[nodiscard]] auto state_dir() const -> std::optional<std::filesystem::path> override {
    return state_dir_;
  }

private:
  std::filesystem::path root_;
  std::filesystem::path state_dir_;
};

class MemoryWorkingTree final : public WorkingTree {
public:
  explicit MemoryWorkingTree(std::filesystem::path root = "/memory");

  [[nodiscard]] auto root() const -> const std::filesystem::path& override { return root_; }

  [[nodiscard]] bool exists(std::string_view rel) const override;
  [[nodiscard]] auto read(std::string_view rel) const -> std::vector<std::uint8_t> override;
  void write(std::string_view rel, std::span<const std::uint8_t> bytes) override;
  void remove(std::string_view rel) override;
  void remove_tree(std::string_view rel) override;
  [[nodiscard]] auto list() const -> std::set<std::string> override;
  [[nodiscard]] bool is_executable(std::string_view rel) const override;
  void set_executable(std::string_view rel) override;

  [[nodiscard]] bool has_state(std::string_view name) const override;
  [[nodiscard]] auto read_state(std::string_view name) const
      -> std::vector<std::uint8_t> override;
  void write_state(std::string_view name, std::span<const std::uint8_t> bytes) override;
  void remove_state(std::string_view name) override;
  [[nodiscard]] auto state_dir() const -> std::optional<std::filesystem::path> override {
    return std::nullopt;
  }

  // Test helpers
  void put(std::string_view rel, std::string_view text);
  [[nodiscard]] auto text(std::string_view rel) const -> std::string;
  using FileMap = std::map<std::string, std::vector<std::uint8_t>, std::less<>>;
  [[nodiscard]] auto files() const -> const FileMap& { return files_; }
  // Number of write()/remove() calls since construction
  [[nodiscard]] std::size_t mutations() const { return mutations_; }

private:
  std::filesystem::path root_;
  FileMap files_;
  FileMap state_;
  std::set<std::string, std::less<>> executable_;
  std::size_t mutations_ = 0;
};

} // namespace patchwright
