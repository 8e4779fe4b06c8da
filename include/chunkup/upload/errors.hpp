#pragma once
#ifndef CHUNKUP_ERRORS_HPP
#define CHUNKUP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace chunkup {

/**
 * @brief Classification of upload engine failures.
 */
enum class ErrorKind {
  Transport,         ///< Transient transport failure after retries
  Protocol,          ///< Unexpected status or malformed server response
  ChecksumMismatch,  ///< Manifest checksum differs from recomputed one
  SizeLimit,         ///< Artifact exceeds the configured ceiling
  Assembly,          ///< Server rejected the content
  LostAssembly,      ///< Server lost track of the assembly twice
  ChunkUploadFailed, ///< A chunk exhausted its retries
  Cancelled,         ///< User-triggered cancellation
  Io,                ///< Local read failure
  Config             ///< Invalid configuration
};

std::string ErrorKindToString(ErrorKind kind);

class UploadException : public std::runtime_error {
public:
  UploadException(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

/**
 * @brief Log @p message at ERROR and throw an UploadException of @p kind.
 */
[[noreturn]] void ThrowUploadException(ErrorKind kind,
                                       const std::string &message);

} // namespace chunkup

#endif // CHUNKUP_ERRORS_HPP
