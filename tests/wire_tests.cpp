#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/wire.hpp"
#include <functional>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace chunkup;
using nlohmann::json;

static Digest sha1Of(const std::string &s) {
  return sha1(reinterpret_cast<const std::byte *>(s.data()), s.size());
}

static ErrorKind kindOf(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const UploadException &e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected UploadException";
  return ErrorKind::Transport;
}

TEST(WireTest, ParsesServerOptions) {
  const std::string body = R"({
    "url": "https://example.invalid/api/0/chunk-upload/",
    "chunkSize": 8388608,
    "chunksPerRequest": 64,
    "maxRequestSize": 33554432,
    "maxFileSize": 2147483648,
    "maxWait": 60,
    "concurrency": 8,
    "hashAlgorithm": "sha1",
    "compression": ["gzip"],
    "accept": ["debug_files", "artifact_bundles"]
  })";
  auto opts = wire::parseServerOptions(body);
  EXPECT_EQ(opts.url, "https://example.invalid/api/0/chunk-upload/");
  EXPECT_EQ(opts.chunkSize, 8388608u);
  EXPECT_EQ(opts.compression, std::vector<std::string>{"gzip"});
  EXPECT_EQ(opts.maxFileSize, 2147483648u);
  EXPECT_EQ(opts.maxWait, 60u);
  EXPECT_EQ(opts.concurrency, 8u);
  EXPECT_EQ(opts.accept,
            (std::vector<std::string>{"debug_files", "artifact_bundles"}));
  EXPECT_EQ(wire::capabilityFor(ArtifactKind::DebugFile), "debug_files");
  EXPECT_EQ(wire::capabilityFor(ArtifactKind::SourceBundle), "sources");
  EXPECT_EQ(wire::capabilityFor(ArtifactKind::Other), "");
}

TEST(WireTest, ServerOptionsDefaultsAndErrors) {
  auto opts = wire::parseServerOptions(
      R"({"url":"u","chunkSize":1,"chunksPerRequest":1,"maxRequestSize":1,)"
      R"("concurrency":1,"hashAlgorithm":"sha1"})");
  EXPECT_EQ(opts.maxWait, 0u);
  EXPECT_EQ(opts.accept, std::vector<std::string>{"debug_files"});
  EXPECT_TRUE(opts.compression.empty());

  EXPECT_EQ(kindOf([] { wire::parseServerOptions("not json"); }),
            ErrorKind::Protocol);
  EXPECT_EQ(kindOf([] { wire::parseServerOptions(R"({"url":"u"})"); }),
            ErrorKind::Protocol);
  EXPECT_EQ(kindOf([] {
              wire::parseServerOptions(
                  R"({"url":"u","chunkSize":1,"chunksPerRequest":1,)"
                  R"("maxRequestSize":1,"concurrency":1,"hashAlgorithm":"md5"})");
            }),
            ErrorKind::Config);
}

TEST(WireTest, ChecksumListAndMissingList) {
  Digest a = sha1Of("a"), b = sha1Of("b");
  json doc = json::parse(wire::encodeChecksumList({a, b}));
  ASSERT_EQ(doc["checksums"].size(), 2u);
  EXPECT_EQ(doc["checksums"][0], digestToHex(a));

  auto missing = wire::decodeMissingList(
      json{{"missing", json::array({digestToHex(b)})}}.dump());
  ASSERT_EQ(missing.size(), 1u);
  EXPECT_EQ(missing[0], b);

  EXPECT_EQ(kindOf([] { wire::decodeMissingList("{}"); }), ErrorKind::Protocol);
  EXPECT_EQ(kindOf([] { wire::decodeMissingList(R"({"missing":["xyz"]})"); }),
            ErrorKind::Protocol);
}

TEST(WireTest, FileStates) {
  EXPECT_EQ(wire::parseFileState("created"), AssemblyStatus::Pending);
  EXPECT_EQ(wire::parseFileState("assembling"), AssemblyStatus::InProgress);
  EXPECT_EQ(wire::parseFileState("ok"), AssemblyStatus::Ok);
  EXPECT_EQ(wire::parseFileState("error"), AssemblyStatus::Error);
  EXPECT_EQ(wire::parseFileState("not_found"), AssemblyStatus::NotFound);
  EXPECT_EQ(kindOf([] { wire::parseFileState("exploded"); }),
            ErrorKind::Protocol);
}

TEST(WireTest, AssembleRequestIsKeyedByArtifactChecksum) {
  AssemblyManifest m;
  m.artifactChecksum = sha1Of("whole");
  m.chunks = {sha1Of("c1"), sha1Of("c2")};
  m.name = "libfoo.so.debug";
  m.debugId = "dfb8e43a-f242-3d73-a453-aeb6a777ef75";

  AssemblyManifest plain;
  plain.artifactChecksum = sha1Of("other");
  plain.name = "empty";

  json doc = json::parse(wire::encodeAssembleRequest({m, plain}));
  const auto &entry = doc[digestToHex(m.artifactChecksum)];
  EXPECT_EQ(entry["name"], "libfoo.so.debug");
  EXPECT_EQ(entry["debug_id"], "dfb8e43a-f242-3d73-a453-aeb6a777ef75");
  ASSERT_EQ(entry["chunks"].size(), 2u);
  EXPECT_EQ(entry["chunks"][1], digestToHex(sha1Of("c2")));

  const auto &other = doc[digestToHex(plain.artifactChecksum)];
  EXPECT_FALSE(other.contains("debug_id"));
  EXPECT_TRUE(other["chunks"].empty());
}

TEST(WireTest, DecodesAssembleResponse) {
  Digest art = sha1Of("art");
  Digest chunk = sha1Of("chunk");
  json body;
  body[digestToHex(art)] = {{"state", "not_found"},
                            {"missingChunks", json::array({digestToHex(chunk)})},
                            {"detail", nullptr}};
  auto decoded = wire::decodeAssembleResponse(body.dump());
  ASSERT_EQ(decoded.count(art), 1u);
  EXPECT_EQ(decoded[art].state, AssemblyStatus::NotFound);
  ASSERT_EQ(decoded[art].missingChunks.size(), 1u);
  EXPECT_EQ(decoded[art].missingChunks[0], chunk);
  EXPECT_TRUE(decoded[art].detail.empty());

  EXPECT_EQ(kindOf([] { wire::decodeAssembleResponse("[]"); }),
            ErrorKind::Protocol);
  EXPECT_EQ(kindOf([&] {
              wire::decodeAssembleResponse(
                  json{{digestToHex(art), {{"missingChunks", json::array()}}}}
                      .dump());
            }),
            ErrorKind::Protocol);
}

TEST(WireTest, MultipartCarriesChecksumAsFilename) {
  Digest d = sha1Of("xyz");
  std::vector<std::byte> data{std::byte{'x'}, std::byte{0}, std::byte{'z'}};
  std::string body = wire::encodeMultipartChunk("BOUNDARY", d, data);
  EXPECT_EQ(body.rfind("--BOUNDARY\r\n", 0), 0u);
  EXPECT_NE(body.find("name=\"file\"; filename=\"" + digestToHex(d) + "\""),
            std::string::npos);
  EXPECT_NE(body.find(std::string("x\0z", 3)), std::string::npos);
  EXPECT_NE(body.find("\r\n--BOUNDARY--\r\n"), std::string::npos);
  EXPECT_EQ(wire::multipartContentType("B"),
            "multipart/form-data; boundary=B");
}

TEST(WireTest, GzipChunksUseTheirOwnFieldName) {
  Digest d = sha1Of("xyz");
  std::vector<std::byte> data{std::byte{1}, std::byte{2}};
  std::string body = wire::encodeMultipartChunk("B", d, data,
                                                ChunkCompression::Gzip);
  EXPECT_NE(body.find("name=\"file_gzip\"; filename=\"" + digestToHex(d) +
                      "\""),
            std::string::npos);
  EXPECT_EQ(wire::chunkFieldName(ChunkCompression::Uncompressed), "file");
}
