#ifndef CHUNKUP_WIRE_HPP
#define CHUNKUP_WIRE_HPP

#include "chunkup/upload/types.hpp"
#include "chunkup/utilities/compression.hpp"
#include "chunkup/utilities/digest.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chunkup {
namespace wire {

/**
 * @brief Chunk-upload capabilities advertised by the server.
 *
 * Zero means "not advertised" for the optional limits.
 */
struct ChunkServerOptions {
  std::string url;
  uint64_t chunkSize{0};
  uint64_t maxRequestSize{0};
  uint64_t maxFileSize{0};
  uint64_t maxWait{0}; ///< seconds
  unsigned concurrency{0};
  HashAlgorithm hashAlgorithm{HashAlgorithm::SHA1};
  std::vector<std::string> compression;
  /// Artifact capabilities, "debug_files" when the server lists none.
  std::vector<std::string> accept;
};

/**
 * @brief Capability name the server must accept for @p kind.
 *
 * Empty for kinds that need no capability.
 */
std::string capabilityFor(ArtifactKind kind);

/**
 * @brief Parse the options document.
 * @throw UploadException Protocol on malformed JSON or missing fields,
 *        Config on an unsupported hash algorithm.
 */
ChunkServerOptions parseServerOptions(const std::string &body);

/// {"checksums": ["<hex>", ...]}
std::string encodeChecksumList(const std::vector<Digest> &checksums);

/**
 * @brief Decode {"missing": ["<hex>", ...]}.
 * @throw UploadException (Protocol) on malformed input.
 */
std::vector<Digest> decodeMissingList(const std::string &body);

/**
 * @brief Map a server file state onto AssemblyStatus.
 *
 * created -> Pending, assembling -> InProgress, ok, error, not_found.
 * @throw UploadException (Protocol) for unknown states.
 */
AssemblyStatus parseFileState(const std::string &state);

/// Per-artifact entry of an assemble response.
struct AssembleEntryResponse {
  AssemblyStatus state{AssemblyStatus::Pending};
  std::vector<Digest> missingChunks;
  std::string detail;
};

/// JSON object keyed by artifact checksum: {name, debug_id?, chunks}.
std::string encodeAssembleRequest(const std::vector<AssemblyManifest> &batch);

/// @throw UploadException (Protocol) on malformed input.
std::map<Digest, AssembleEntryResponse>
decodeAssembleResponse(const std::string &body);

/// Content-Type header value for a multipart body using @p boundary.
std::string multipartContentType(const std::string &boundary);

/// Multipart field name for a chunk body: "file" or "file_gzip".
std::string chunkFieldName(ChunkCompression compression);

/**
 * @brief Build a multipart/form-data body carrying one chunk.
 *
 * The part is named after @p compression and its filename is the checksum
 * of the uncompressed chunk. @p data is sent as given.
 */
std::string encodeMultipartChunk(
    const std::string &boundary, const Digest &checksum,
    const std::vector<std::byte> &data,
    ChunkCompression compression = ChunkCompression::Uncompressed);

} // namespace wire
} // namespace chunkup

#endif // CHUNKUP_WIRE_HPP
