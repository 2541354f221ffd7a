#pragma once
#include "patchwright/hash.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace patchwright {

class WorkingTree;

// Content-addressed, zlib-compressed file images kept in a tree's state area.
// Ids are git blob ids of the stored bytes.
class ObjectStore {
public:
  explicit ObjectStore(WorkingTree& tree) : tree_(tree) {}

  // Store bytes (no-op if already present). Returns 40-hex id.
  std::string write(std::span<const std::uint8_t> payload) const;

  // Read and decompress the image identified by 40-hex.
  std::vector<std::uint8_t> read(std::string_view hex_oid) const;

  [[nodiscard]] bool contains(std::string_view hex_oid) const;

  // State-area name for a binary id: objects/aa/bbbb...
  static std::string name_for_oid(const oid& object_id);

private:
  WorkingTree& tree_;
};

} // namespace patchwright
