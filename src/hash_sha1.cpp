#include "patchwright/hash.hpp"

#include "patchwright/consts.hpp"

#include <stdexcept>

#include <openssl/evp.h>

namespace patchwright {

void Sha1::CtxFree::operator()(evp_md_ctx_st *ctx) const { EVP_MD_CTX_free(ctx); }

Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_)
    throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1)
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
}

Sha1::~Sha1() = default;
Sha1::Sha1(Sha1 &&) noexcept = default;
Sha1 &Sha1::operator=(Sha1 &&) noexcept = default;

Sha1 &Sha1::update(std::span<const std::uint8_t> data) {
  if (!ctx_)
    throw std::runtime_error("sha1: update after finish");
  if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1)
    throw std::runtime_error("EVP_DigestUpdate failed");
  return *this;
}

oid Sha1::finish() {
  if (!ctx_)
    throw std::runtime_error("sha1: finish called twice");
  oid out{};
  unsigned int len = 0;
  const int rc = EVP_DigestFinal_ex(ctx_.get(), out.data(), &len);
  ctx_.reset();
  if (rc != 1 || len != out.size())
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  return out;
}

oid blob_id(std::span<const std::uint8_t> bytes) {
  Sha1 h;
  h.update(consts::kTypeBlob);
  h.update(" " + std::to_string(bytes.size()));
  h.update(std::string_view("\0", 1));
  h.update(bytes);
  return h.finish();
}

std::string to_hex(const oid &id) {
  static constexpr std::string_view kDigits = "0123456789abcdef";
  std::string s;
  s.reserve(consts::kOidHexLen);
  for (const std::uint8_t b : id) {
    s.push_back(kDigits[b >> 4]);
    s.push_back(kDigits[b & 0xF]);
  }
  return s;
}

namespace {

int nibble(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen)
    return false;
  oid tmp{};
  for (std::size_t i = 0; i < tmp.size(); ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      return false;
    tmp[i] = static_cast<std::uint8_t>(hi << 4 | lo);
  }
  out = tmp;
  return true;
}

} // namespace patchwright
