#include "chunkup/upload/chunker.hpp"
#include "chunkup/upload/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace chunkup {

Chunker::Chunker(uint64_t chunkSize) : chunkSize_(chunkSize) {
  if (chunkSize_ == 0) {
    throw std::invalid_argument("chunk size must be greater than zero");
  }
}

ChunkedArtifact Chunker::chunkBytes(ArtifactId id, const std::byte *data,
                                    size_t size) const {
  ChunkedArtifact out;
  out.id = id;
  out.size = size;
  Sha1Hasher whole;
  uint64_t offset = 0;
  while (offset < size) {
    uint64_t len = std::min<uint64_t>(chunkSize_, size - offset);
    whole.update(data + offset, len);
    out.chunks.push_back({sha1(data + offset, len), offset, len});
    offset += len;
  }
  out.checksum = whole.finalize();
  return out;
}

ChunkedArtifact Chunker::chunk(ArtifactId id, const Artifact &artifact) const {
  if (artifact.contents) {
    return chunkBytes(id, artifact.contents->data(), artifact.contents->size());
  }

  std::ifstream in(artifact.localPath, std::ios::binary);
  if (!in.is_open()) {
    ThrowUploadException(ErrorKind::Io,
                         "Cannot open artifact " + artifact.localPath);
  }

  ChunkedArtifact out;
  out.id = id;
  Sha1Hasher whole;
  // Only one chunk buffer is alive at a time.
  std::vector<std::byte> buf(static_cast<size_t>(chunkSize_));
  uint64_t offset = 0;
  while (true) {
    in.read(reinterpret_cast<char *>(buf.data()),
            static_cast<std::streamsize>(buf.size()));
    std::streamsize got = in.gcount();
    if (got > 0) {
      auto len = static_cast<uint64_t>(got);
      whole.update(buf.data(), len);
      out.chunks.push_back({sha1(buf.data(), len), offset, len});
      offset += len;
    }
    if (in.eof())
      break;
    if (in.fail()) {
      ThrowUploadException(ErrorKind::Io, "Read error in " +
                                              artifact.localPath +
                                              " at offset " +
                                              std::to_string(offset));
    }
  }
  out.size = offset;
  out.checksum = whole.finalize();
  return out;
}

uint64_t Chunker::measure(const Artifact &artifact) {
  if (artifact.contents)
    return artifact.contents->size();
  std::error_code ec;
  auto size = std::filesystem::file_size(artifact.localPath, ec);
  if (ec) {
    ThrowUploadException(ErrorKind::Io, "Cannot stat " + artifact.localPath +
                                            ": " + ec.message());
  }
  return size;
}

std::vector<std::byte> Chunker::readRange(const Artifact &artifact,
                                          uint64_t offset, uint64_t length) {
  if (artifact.contents) {
    const auto &bytes = *artifact.contents;
    if (offset + length > bytes.size()) {
      ThrowUploadException(ErrorKind::Io, "Range past end of " +
                                              artifact.displayName);
    }
    auto first = bytes.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<std::byte>(first,
                                  first + static_cast<std::ptrdiff_t>(length));
  }

  std::ifstream in(artifact.localPath, std::ios::binary);
  if (!in.is_open()) {
    ThrowUploadException(ErrorKind::Io,
                         "Cannot open artifact " + artifact.localPath);
  }
  in.seekg(static_cast<std::streamoff>(offset));
  std::vector<std::byte> out(static_cast<size_t>(length));
  in.read(reinterpret_cast<char *>(out.data()),
          static_cast<std::streamsize>(length));
  if (static_cast<uint64_t>(in.gcount()) != length) {
    ThrowUploadException(ErrorKind::Io, "Short read from " +
                                            artifact.localPath +
                                            " at offset " +
                                            std::to_string(offset));
  }
  return out;
}

} // namespace chunkup
