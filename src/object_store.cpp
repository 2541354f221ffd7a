#include "patchwright/object_store.hpp"

#include "patchwright/consts.hpp"
#include "patchwright/fs.hpp"
#include "patchwright/working_tree.hpp"

#include <algorithm>
#include <stdexcept>

namespace pfs = patchwright::fs;

namespace patchwright {

namespace {

// Stored form: "blob <size>\0" + payload, zlib-compressed.
std::vector<std::uint8_t> framed(std::span<const std::uint8_t> payload) {
  std::string header(consts::kTypeBlob);
  header += consts::kSpace;
  header += std::to_string(payload.size());
  header += consts::kNul;
  std::vector<std::uint8_t> out(header.begin(), header.end());
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

oid parse_oid(std::string_view hex_oid) {
  oid id{};
  if (!from_hex(hex_oid, id))
    throw std::runtime_error("object store: bad object id '" + std::string(hex_oid) + "'");
  return id;
}

} // namespace

std::string ObjectStore::name_for_oid(const oid &object_id) {
  const std::string hex = to_hex(object_id);
  return std::string(consts::kObjectsDir) + "/" + hex.substr(0, consts::kFanoutDirHexLen) + "/" +
         hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  return from_hex(hex_oid, id) && tree_.has_state(name_for_oid(id));
}

std::vector<std::uint8_t> ObjectStore::read(std::string_view hex_oid) const {
  const oid id = parse_oid(hex_oid);
  const std::string name = name_for_oid(id);
  if (!tree_.has_state(name))
    throw std::runtime_error("object store: missing image " + std::string(hex_oid));
  const auto stored = pfs::z_decompress(tree_.read_state(name));

  const auto nul = std::ranges::find(stored, static_cast<std::uint8_t>(consts::kNul));
  const std::string header(stored.begin(), nul);
  const std::string expected_prefix = std::string(consts::kTypeBlob) + consts::kSpace;
  if (nul == stored.end() || !header.starts_with(expected_prefix))
    throw std::runtime_error("object store: bad header in " + std::string(hex_oid));

  std::vector<std::uint8_t> payload(nul + 1, stored.end());
  if (header.substr(expected_prefix.size()) != std::to_string(payload.size()) ||
      blob_id(payload) != id)
    throw std::runtime_error("object store: corrupt image " + std::string(hex_oid));
  return payload;
}

std::string ObjectStore::write(std::span<const std::uint8_t> payload) const {
  const oid id = blob_id(payload);
  const auto name = name_for_oid(id);
  if (!tree_.has_state(name))
    tree_.write_state(name, pfs::z_compress(framed(payload)));
  return to_hex(id);
}

} // namespace patchwright
