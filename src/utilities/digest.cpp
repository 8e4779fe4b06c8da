#include "chunkup/utilities/digest.hpp"

#include <cstring>
#include <stdexcept>

namespace chunkup {

size_t DigestHash::operator()(const Digest &d) const noexcept {
  // The digest is already uniformly distributed; its prefix is a fine hash.
  size_t h = 0;
  std::memcpy(&h, d.data(), sizeof(h));
  return h;
}

std::string digestToHex(const Digest &digest) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(DIGEST_SIZE * 2);
  for (uint8_t b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0f]);
  }
  return out;
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

Digest digestFromHex(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw std::invalid_argument("Invalid checksum length: '" + hex + "'");
  }
  Digest out{};
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    int hi = hexValue(hex[2 * i]);
    int lo = hexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("Invalid checksum character in '" + hex +
                                  "'");
    }
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

HashAlgorithm hashAlgorithmFromString(const std::string &name) {
  if (name == "sha1" || name == "SHA1" || name.empty())
    return HashAlgorithm::SHA1;
  throw std::invalid_argument("Unsupported hash algorithm: " + name);
}

Sha1Hasher::Sha1Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to allocate EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("Failed to initialize SHA-1 digest");
  }
}

Sha1Hasher::~Sha1Hasher() { EVP_MD_CTX_free(ctx_); }

void Sha1Hasher::update(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot update digest after finalize()");
  }
  if (data && size > 0) {
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
      throw std::runtime_error("SHA-1 update failed");
    }
  }
}

Digest Sha1Hasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called");
  }
  Digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != DIGEST_SIZE) {
    throw std::runtime_error("SHA-1 finalize failed");
  }
  finalized_ = true;
  return out;
}

Digest sha1(const std::byte *data, size_t size) {
  Sha1Hasher hasher;
  hasher.update(data, size);
  return hasher.finalize();
}

} // namespace chunkup
