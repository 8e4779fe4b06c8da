#ifndef CHUNKUP_UPLOAD_CONFIG_HPP
#define CHUNKUP_UPLOAD_CONFIG_HPP

#include "chunkup/transport/http.hpp"
#include "chunkup/upload/poll_loop.hpp"
#include "chunkup/upload/wire.hpp"
#include "chunkup/utilities/backoff.hpp"
#include "chunkup/utilities/compression.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace chunkup {

/// Server paths used by the engine, relative to the API root.
struct Endpoints {
  std::string options{"chunk-upload/"};
  std::string chunkUpload{"chunk-upload/"};
  std::string chunkDiff{"chunk-upload/missing/"};
  std::string artifactDiff{"files/missing/"};
  std::string assemble{"files/assemble/"};
};

struct UploadConfig {
  uint64_t chunkSize{8ull * 1024 * 1024};
  uint64_t maxFileSize{2ull * 1024 * 1024 * 1024};
  unsigned concurrency{8};
  unsigned hashConcurrency{4};
  bool dedup{true};
  /// Checksums per diff request.
  size_t diffPageSize{1000};
  /// Manifests per assemble request.
  size_t assembleBatchSize{1};
  /// Codec for chunk bodies. Only what the server advertises is used.
  ChunkCompression compression{ChunkCompression::Uncompressed};
  /// Capabilities the server accepts; empty until the server is asked.
  std::vector<std::string> acceptedCapabilities;
  WaitPolicy wait;
  RetryPolicy retry;
  PollPolicy poll;
  Endpoints endpoints;

  /// Keys set explicitly by the file or the environment. Server-advertised
  /// options never override these.
  std::set<std::string> explicitKeys;

  bool isExplicit(const std::string &key) const {
    return explicitKeys.count(key) > 0;
  }
};

/**
 * @brief Load configuration from @p path, then apply environment overrides.
 *
 * A missing file yields the defaults.
 * @throw UploadException (Config) on malformed YAML or invalid values.
 */
UploadConfig loadUploadConfig(const std::string &path);

/// Same as above with the path taken from CHUNKUP_CONFIG (default
/// chunkup.yaml).
UploadConfig loadUploadConfig();

/**
 * @brief Apply CHUNKUP_* environment variables on top of @p config.
 *
 * CHUNKUP_HTTP_MAX_RETRIES counts retries, so the attempt limit becomes
 * its value plus one.
 */
void applyEnvironmentOverrides(UploadConfig &config);

/// @throw UploadException (Config) if a size, count or limit is zero.
void validateUploadConfig(const UploadConfig &config);

/**
 * @brief Merge server-advertised chunk-upload options.
 *
 * Server values fill everything that was not set explicitly. An explicit
 * chunk size is capped at the server's, and the server's maxWait caps both
 * wait ceilings. Compression falls back to none when the server does not
 * advertise the configured codec.
 */
void applyServerOptions(UploadConfig &config,
                        const wire::ChunkServerOptions &options);

/**
 * @brief GET the chunk-upload options from the server.
 * @throw UploadException (Protocol) on non-2xx or malformed bodies,
 *        (Transport) when the request cannot be sent.
 */
wire::ChunkServerOptions fetchServerOptions(http::Transport &transport,
                                            const std::string &path);

/// Render @p config as YAML in the same layout loadUploadConfig reads.
std::string configToYaml(const UploadConfig &config);

} // namespace chunkup

#endif // CHUNKUP_UPLOAD_CONFIG_HPP
