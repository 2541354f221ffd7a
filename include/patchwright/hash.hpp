#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace patchwright {

// Raw 20-byte SHA-1 digest (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

// Incremental SHA-1 over OpenSSL's EVP interface.
class Sha1 {
public:
  Sha1();
  ~Sha1();
  Sha1(Sha1&&) noexcept;
  Sha1& operator=(Sha1&&) noexcept;

  Sha1& update(std::span<const std::uint8_t> data);
  Sha1& update(std::string_view s) {
    return update({reinterpret_cast<const std::uint8_t *>(s.data()), s.size()});
  }

  // Digest of everything fed so far; the hasher cannot be reused afterwards.
  oid finish();

private:
  struct CtxFree {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxFree> ctx_;
};

inline oid sha1(std::string_view s) { return Sha1{}.update(s).finish(); }

// Git blob id of `bytes`: SHA-1 over "blob <size>\0" followed by the bytes.
oid blob_id(std::span<const std::uint8_t> bytes);

// 40-char lowercase hex.
std::string to_hex(const oid& id);

// Parse 40 hex chars (either case). False on bad length or characters.
bool from_hex(std::string_view hex, oid& out);

} // namespace patchwright
