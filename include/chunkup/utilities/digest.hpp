#ifndef CHUNKUP_DIGEST_HPP
#define CHUNKUP_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include <openssl/evp.h>

namespace chunkup {

/// Supported checksum algorithms. The chunk-upload protocol identifies
/// content by SHA-1.
enum class HashAlgorithm { SHA1 };

/// Digest size for SHA-1 (20 bytes).
inline constexpr size_t DIGEST_SIZE = 20;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/// Hash functor so digests can key unordered containers.
struct DigestHash {
  size_t operator()(const Digest &d) const noexcept;
};

/**
 * @brief Lower-case hex rendering of a digest.
 */
std::string digestToHex(const Digest &digest);

/**
 * @brief Parse a 40 character hex string.
 * @throws std::invalid_argument if the string is not a valid digest.
 */
Digest digestFromHex(const std::string &hex);

/**
 * @brief Parse an algorithm name as advertised by the server ("sha1").
 * @throws std::invalid_argument for unsupported algorithms.
 */
HashAlgorithm hashAlgorithmFromString(const std::string &name);

/**
 * @brief Incremental SHA-1 over OpenSSL's EVP interface.
 *
 * Feed data with update() and call finalize() exactly once.
 */
class Sha1Hasher {
public:
  Sha1Hasher();
  ~Sha1Hasher();

  Sha1Hasher(const Sha1Hasher &) = delete;
  Sha1Hasher &operator=(const Sha1Hasher &) = delete;

  void update(const std::byte *data, size_t size);

  /// @throw std::logic_error if called twice.
  Digest finalize();

private:
  EVP_MD_CTX *ctx_;
  bool finalized_ = false;
};

/// One-shot SHA-1 of a byte range.
Digest sha1(const std::byte *data, size_t size);

} // namespace chunkup

#endif // CHUNKUP_DIGEST_HPP
