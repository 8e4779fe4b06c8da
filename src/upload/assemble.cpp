#include "chunkup/upload/assemble.hpp"
#include "chunkup/upload/retry.hpp"
#include "chunkup/utilities/logger.h"
#include "chunkup/utilities/metrics.h"

#include <filesystem>
#include <set>
#include <utility>

namespace chunkup {

namespace {

bool isGatewayError(int status) {
  return status == 502 || status == 503 || status == 504;
}

void failAll(const std::vector<AssemblyManifest> &batch, ErrorKind kind,
             const std::string &detail, AssembleRound &round) {
  for (const auto &m : batch)
    round.failures[m.artifactChecksum] = AssembleFailure{kind, detail};
}

} // namespace

AssembleCoordinator::AssembleCoordinator(http::Transport &transport,
                                         AssembleOptions options,
                                         CancellationToken token)
    : transport_(transport), options_(std::move(options)),
      token_(std::move(token)) {
  if (options_.batchSize == 0)
    options_.batchSize = 1;
}

AssemblyManifest
AssembleCoordinator::buildManifest(const Artifact &artifact,
                                   const ChunkedArtifact &chunked) {
  if (artifact.checksum && *artifact.checksum != chunked.checksum) {
    ThrowUploadException(ErrorKind::ChecksumMismatch,
                         "Checksum of " + artifact.displayName + " is " +
                             digestToHex(chunked.checksum) + ", expected " +
                             digestToHex(*artifact.checksum));
  }
  AssemblyManifest m;
  m.artifact = chunked.id;
  m.artifactChecksum = chunked.checksum;
  m.chunks = chunked.chunkChecksums();
  m.name = artifact.displayName.empty()
               ? std::filesystem::path(artifact.localPath).filename().string()
               : artifact.displayName;
  m.debugId = artifact.debugId;
  m.kind = artifact.kind;
  return m;
}

AssembleRound
AssembleCoordinator::submit(const std::vector<AssemblyManifest> &manifests) {
  AssembleRound round;
  std::set<Digest> seen;
  std::vector<AssemblyManifest> batch;
  for (const auto &m : manifests) {
    // Identical artifacts share one server-side assembly.
    if (!seen.insert(m.artifactChecksum).second)
      continue;
    batch.push_back(m);
    if (batch.size() == options_.batchSize) {
      submitBatch(batch, round);
      batch.clear();
    }
  }
  if (!batch.empty())
    submitBatch(batch, round);
  return round;
}

void AssembleCoordinator::submitBatch(
    const std::vector<AssemblyManifest> &batch, AssembleRound &round) {
  http::Request req;
  req.method = http::HttpMethod::POST;
  req.path = options_.path;
  req.headers["Content-Type"] = "application/json";
  req.body = wire::encodeAssembleRequest(batch);

  ++requests_;
  MetricsRegistry::instance().incrementCounter(
      "chunkup_assemble_requests_total");

  http::Response resp;
  try {
    resp = sendWithRetry(transport_, req, options_.retry, token_,
                         isGatewayError)
               .response;
  } catch (const http::TransportError &e) {
    failAll(batch, ErrorKind::Transport, e.what(), round);
    return;
  } catch (const UploadException &e) {
    failAll(batch, e.kind(), e.what(), round);
    return;
  }

  if (!resp.isSuccess()) {
    std::string detail = "assemble returned HTTP " +
                         std::to_string(resp.status) + " " +
                         http::ReasonPhrase(resp.status);
    Logger::getInstance().log(LogLevel::ERROR, detail);
    failAll(batch, ErrorKind::Protocol, detail, round);
    return;
  }

  std::map<Digest, wire::AssembleEntryResponse> decoded;
  try {
    decoded = wire::decodeAssembleResponse(resp.body);
  } catch (const UploadException &e) {
    failAll(batch, e.kind(), e.what(), round);
    return;
  }

  std::set<Digest> expected;
  for (const auto &m : batch)
    expected.insert(m.artifactChecksum);
  for (const auto &kv : decoded) {
    if (expected.count(kv.first) == 0) {
      std::string detail =
          "Server returned unexpected checksum " + digestToHex(kv.first);
      Logger::getInstance().log(LogLevel::ERROR, detail);
      failAll(batch, ErrorKind::Protocol, detail, round);
      return;
    }
  }
  for (const auto &m : batch) {
    auto it = decoded.find(m.artifactChecksum);
    if (it == decoded.end()) {
      round.failures[m.artifactChecksum] = AssembleFailure{
          ErrorKind::Protocol, "Server returned no state for " + m.name};
    } else {
      round.responses[m.artifactChecksum] = it->second;
    }
  }
}

} // namespace chunkup
