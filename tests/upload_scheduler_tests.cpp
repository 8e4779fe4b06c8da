#include "chunkup/upload/chunk_index.hpp"
#include "chunkup/upload/chunker.hpp"
#include "chunkup/upload/upload_scheduler.hpp"
#include "chunkup/utilities/metrics.h"
#include "mocks/fake_server.h"
#include <atomic>
#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace chunkup;
using namespace std::chrono_literals;

namespace {

std::vector<std::byte> bytesOf(const std::string &s) {
  std::vector<std::byte> out;
  for (char c : s)
    out.push_back(std::byte(c));
  return out;
}

class UploadSchedulerTest : public ::testing::Test {
protected:
  FakeServer server_;
  ChunkIndex index_;
  std::map<ArtifactId, std::vector<std::byte>> contents_;
  std::vector<ChunkedArtifact> chunked_;

  void addArtifact(const std::string &data) {
    ArtifactId id = contents_.size();
    contents_[id] = bytesOf(data);
    Chunker chunker(4);
    chunked_.push_back(
        chunker.chunkBytes(id, contents_[id].data(), contents_[id].size()));
    index_.insertArtifact(chunked_.back());
  }

  ChunkReader reader() {
    return [this](const ChunkLocation &loc) {
      const auto &bytes = contents_.at(loc.artifact);
      return std::vector<std::byte>(bytes.begin() + loc.offset,
                                    bytes.begin() + loc.offset + loc.length);
    };
  }

  SchedulerOptions options(unsigned concurrency = 4) {
    SchedulerOptions o;
    o.concurrency = concurrency;
    o.uploadPath = Endpoints{}.chunkUpload;
    o.retry.initialDelay = 1ms;
    o.retry.maxDelay = 2ms;
    o.retry.jitter = false;
    return o;
  }

  std::vector<Digest> allChunks() { return index_.checksums(); }
};

} // namespace

TEST_F(UploadSchedulerTest, UploadsEachMissingChunkOnce) {
  addArtifact("AAAABBBBCCCC");
  addArtifact("BBBBDDDDAAAA");
  std::vector<Digest> missing;
  for (const auto &c : chunked_[0].chunks)
    missing.push_back(c.checksum);
  for (const auto &c : chunked_[1].chunks)
    missing.push_back(c.checksum);

  UploadScheduler scheduler(server_, index_, reader(), options());
  UploadReport report = scheduler.run(missing);

  EXPECT_EQ(report.uploaded, 4u);
  EXPECT_EQ(report.bytesUploaded, 16u);
  EXPECT_TRUE(report.failedChunks.empty());
  EXPECT_FALSE(report.cancelled);
  EXPECT_EQ(server_.uploadCount(), 4u);
  EXPECT_EQ(server_.storedChunks().size(), 4u);
  EXPECT_EQ(index_.presentCount(), 4u);
}

TEST_F(UploadSchedulerTest, PresentChunksAreSkipped) {
  addArtifact("AAAABBBB");
  const Digest &a = chunked_[0].chunks[0].checksum;
  ASSERT_TRUE(index_.tryClaim(a));
  index_.markPresent(a);

  std::vector<ProgressEvent> events;
  std::mutex m;
  UploadScheduler scheduler(server_, index_, reader(), options(1), {},
                            [&](const ProgressEvent &e) {
                              std::lock_guard<std::mutex> lk(m);
                              events.push_back(e);
                            });
  UploadReport report = scheduler.run(allChunks());
  EXPECT_EQ(report.uploaded, 1u);
  EXPECT_EQ(report.skipped, 1u);
  EXPECT_EQ(server_.uploadCount(a), 0u);
  ASSERT_EQ(events.size(), 2u);
}

TEST_F(UploadSchedulerTest, TransientFailuresAreRetried) {
  addArtifact("AAAABBBB");
  const Digest &a = chunked_[0].chunks[0].checksum;
  server_.failUploads(a, 2, 503);

  UploadScheduler scheduler(server_, index_, reader(), options());
  UploadReport report = scheduler.run(allChunks());
  EXPECT_EQ(report.uploaded, 2u);
  EXPECT_EQ(report.retries, 2u);
  EXPECT_TRUE(report.failedArtifacts.empty());
  EXPECT_EQ(server_.uploadCount(a), 3u);
  EXPECT_TRUE(index_.isPresent(a));
}

TEST_F(UploadSchedulerTest, ExhaustedRetriesFailOwningArtifacts) {
  addArtifact("AAAABBBB");
  addArtifact("CCCCAAAA");
  addArtifact("DDDD");
  const Digest &a = chunked_[0].chunks[0].checksum;
  server_.failUploads(a, 100, 500);

  const double before = MetricsRegistry::instance().counterValue(
      "chunkup_chunk_upload_failures_total");
  UploadScheduler scheduler(server_, index_, reader(), options());
  UploadReport report = scheduler.run(allChunks());

  EXPECT_EQ(server_.uploadCount(a), 5u);
  ASSERT_EQ(report.failedChunks.size(), 1u);
  EXPECT_EQ(report.failedChunks[0], a);
  EXPECT_EQ(report.failedArtifacts.size(), 2u);
  EXPECT_EQ(report.failedArtifacts.count(0), 1u);
  EXPECT_EQ(report.failedArtifacts.count(1), 1u);
  EXPECT_EQ(report.failedArtifacts.count(2), 0u);
  EXPECT_EQ(index_.state(a), ChunkState::Failed);
  EXPECT_EQ(report.uploaded, 3u);
  EXPECT_EQ(MetricsRegistry::instance().counterValue(
                "chunkup_chunk_upload_failures_total"),
            before + 1);
}

TEST_F(UploadSchedulerTest, RedirectIsNotFollowedOrRetried) {
  addArtifact("AAAA");
  const Digest &a = chunked_[0].chunks[0].checksum;
  server_.failUploads(a, 10, 302);

  UploadScheduler scheduler(server_, index_, reader(), options());
  UploadReport report = scheduler.run(allChunks());
  EXPECT_EQ(server_.uploadCount(a), 1u);
  ASSERT_EQ(report.failedArtifacts.count(0), 1u);
  EXPECT_NE(report.failedArtifacts[0].find("redirected"), std::string::npos);
}

TEST_F(UploadSchedulerTest, ConcurrencyIsBounded) {
  std::string data;
  for (int i = 0; i < 24; ++i)
    data += std::string(4, static_cast<char>('a' + i));
  addArtifact(data);
  server_.setUploadDelay(5ms);

  UploadScheduler scheduler(server_, index_, reader(), options(3));
  UploadReport report = scheduler.run(allChunks());
  EXPECT_EQ(report.uploaded, 24u);
  EXPECT_LE(server_.maxConcurrentUploads(), 3u);
  EXPECT_GE(server_.maxConcurrentUploads(), 1u);
}

TEST_F(UploadSchedulerTest, UnindexedChecksumsAreIgnored) {
  addArtifact("AAAA");
  Digest stranger{};
  std::vector<Digest> missing = allChunks();
  missing.push_back(stranger);
  UploadScheduler scheduler(server_, index_, reader(), options());
  UploadReport report = scheduler.run(missing);
  EXPECT_EQ(report.uploaded, 1u);
  EXPECT_TRUE(report.failedChunks.empty());
}

TEST_F(UploadSchedulerTest, ReaderErrorsFailTheChunk) {
  addArtifact("AAAA");
  UploadScheduler scheduler(
      server_, index_,
      [](const ChunkLocation &) -> std::vector<std::byte> {
        throw std::runtime_error("disk vanished");
      },
      options());
  UploadReport report = scheduler.run(allChunks());
  EXPECT_EQ(report.uploaded, 0u);
  ASSERT_EQ(report.failedArtifacts.count(0), 1u);
  EXPECT_NE(report.failedArtifacts[0].find("disk vanished"), std::string::npos);
  EXPECT_EQ(server_.uploadCount(), 0u);
}

TEST_F(UploadSchedulerTest, GzipBodiesAreStoredUnderTheirPlainChecksum) {
  addArtifact("AAAABBBBCCCC");
  SchedulerOptions opts = options();
  opts.compression = ChunkCompression::Gzip;
  UploadScheduler scheduler(server_, index_, reader(), opts);
  UploadReport report = scheduler.run(allChunks());
  EXPECT_EQ(report.uploaded, 3u);
  EXPECT_EQ(report.bytesUploaded, 12u);
  EXPECT_TRUE(report.failedChunks.empty());
  EXPECT_EQ(server_.gzipUploadCount(), 3u);
  for (const auto &c : chunked_[0].chunks)
    EXPECT_EQ(server_.storedChunks().count(c.checksum), 1u);
}

TEST_F(UploadSchedulerTest, ContentChangedSinceHashingFailsTheChunk) {
  addArtifact("AAAABBBB");
  const Digest &b = chunked_[0].chunks[1].checksum;
  // The second chunk is rewritten after it was hashed.
  contents_[0][5] = std::byte{'X'};

  UploadScheduler scheduler(server_, index_, reader(), options());
  UploadReport report = scheduler.run(allChunks());
  EXPECT_EQ(report.uploaded, 1u);
  ASSERT_EQ(report.failedChunks.size(), 1u);
  EXPECT_EQ(report.failedChunks[0], b);
  EXPECT_EQ(server_.uploadCount(b), 0u);
  ASSERT_EQ(report.failedArtifacts.count(0), 1u);
  EXPECT_NE(report.failedArtifacts[0].find("changed on disk"),
            std::string::npos);
  EXPECT_EQ(index_.state(b), ChunkState::Failed);
}

TEST_F(UploadSchedulerTest, CancelledRunLeavesChunksClaimable) {
  addArtifact("AAAABBBBCCCC");
  CancellationToken token;
  token.cancel();
  UploadScheduler scheduler(server_, index_, reader(), options(), token);
  UploadReport report = scheduler.run(allChunks());
  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.uploaded, 0u);
  EXPECT_EQ(server_.uploadCount(), 0u);
  for (const auto &d : allChunks())
    EXPECT_EQ(index_.state(d), ChunkState::Missing);
}

TEST_F(UploadSchedulerTest, CancelDuringBackoffReleasesClaim) {
  addArtifact("AAAA");
  const Digest &a = chunked_[0].chunks[0].checksum;
  server_.failUploads(a, 100, 503);
  CancellationToken token;
  SchedulerOptions opts = options(1);
  opts.retry.initialDelay = 10s;
  opts.retry.maxDelay = 10s;
  UploadScheduler scheduler(server_, index_, reader(), opts, token);

  std::thread canceller([token]() mutable {
    std::this_thread::sleep_for(20ms);
    token.cancel();
  });
  UploadReport report = scheduler.run(allChunks());
  canceller.join();
  EXPECT_TRUE(report.cancelled);
  EXPECT_TRUE(report.failedChunks.empty());
  EXPECT_EQ(index_.state(a), ChunkState::Missing);
}
