#include "chunkup/utilities/digest.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace chunkup;

static Digest sha1Of(const std::string &s) {
  return sha1(reinterpret_cast<const std::byte *>(s.data()), s.size());
}

TEST(DigestTest, KnownSha1Vectors) {
  EXPECT_EQ(digestToHex(sha1Of("")),
            "da39a3ee5e6b4b0d3255bfef95601890afd80709");
  EXPECT_EQ(digestToHex(sha1Of("abc")),
            "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(DigestTest, IncrementalMatchesOneShot) {
  Sha1Hasher h;
  std::string a = "hello ", b = "world";
  h.update(reinterpret_cast<const std::byte *>(a.data()), a.size());
  h.update(reinterpret_cast<const std::byte *>(b.data()), b.size());
  EXPECT_EQ(h.finalize(), sha1Of("hello world"));
}

TEST(DigestTest, FinalizeTwiceThrows) {
  Sha1Hasher h;
  h.finalize();
  EXPECT_THROW(h.finalize(), std::logic_error);
}

TEST(DigestTest, HexParsing) {
  Digest d = sha1Of("abc");
  EXPECT_EQ(digestFromHex(digestToHex(d)), d);
  EXPECT_EQ(digestFromHex("A9993E364706816ABA3E25717850C26C9CD0D89D"), d);
  EXPECT_THROW(digestFromHex("abc"), std::invalid_argument);
  EXPECT_THROW(digestFromHex(std::string(40, 'z')), std::invalid_argument);
}

TEST(DigestTest, HashAlgorithmNames) {
  EXPECT_EQ(hashAlgorithmFromString("sha1"), HashAlgorithm::SHA1);
  EXPECT_THROW(hashAlgorithmFromString("blake3"), std::invalid_argument);
}
