#include "chunkup/utilities/compression.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace chunkup;

static std::vector<std::byte> bytesOf(const std::string &s) {
  std::vector<std::byte> out;
  for (char c : s)
    out.push_back(std::byte(c));
  return out;
}

TEST(CompressionTest, GzipInflatesBackToInput) {
  std::string text;
  for (int i = 0; i < 2000; ++i)
    text += "debug section " + std::to_string(i % 7) + "\n";
  std::vector<std::byte> input = bytesOf(text);

  std::vector<std::byte> packed = gzipCompress(input);
  ASSERT_GE(packed.size(), 2u);
  // gzip magic
  EXPECT_EQ(packed[0], std::byte{0x1f});
  EXPECT_EQ(packed[1], std::byte{0x8b});
  EXPECT_LT(packed.size(), input.size());
  EXPECT_EQ(gzipDecompress(packed.data(), packed.size()), input);
}

TEST(CompressionTest, EmptyInputStillProducesAStream) {
  std::vector<std::byte> packed = gzipCompress({});
  EXPECT_FALSE(packed.empty());
  EXPECT_TRUE(gzipDecompress(packed.data(), packed.size()).empty());
}

TEST(CompressionTest, CorruptInputThrows) {
  std::vector<std::byte> packed = gzipCompress(bytesOf("some chunk bytes"));
  std::vector<std::byte> truncated(packed.begin(),
                                   packed.begin() + packed.size() / 2);
  EXPECT_THROW(gzipDecompress(truncated.data(), truncated.size()),
               std::runtime_error);
  std::vector<std::byte> junk = bytesOf("not gzip at all");
  EXPECT_THROW(gzipDecompress(junk.data(), junk.size()), std::runtime_error);
}

TEST(CompressionTest, PicksBestAdvertisedCodec) {
  EXPECT_EQ(selectCompression({}), ChunkCompression::Uncompressed);
  EXPECT_EQ(selectCompression({"brotli"}), ChunkCompression::Uncompressed);
  EXPECT_EQ(selectCompression({"brotli", "gzip"}), ChunkCompression::Gzip);
  EXPECT_EQ(chunkCompressionFromString("none"),
            ChunkCompression::Uncompressed);
  EXPECT_THROW(chunkCompressionFromString("lz4"), std::invalid_argument);
  EXPECT_EQ(ChunkCompressionToString(ChunkCompression::Gzip), "gzip");
}
