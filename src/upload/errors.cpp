#include "chunkup/upload/errors.hpp"
#include "chunkup/utilities/logger.h"

namespace chunkup {

std::string ErrorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Transport:
    return "transport";
  case ErrorKind::Protocol:
    return "protocol";
  case ErrorKind::ChecksumMismatch:
    return "checksum-mismatch";
  case ErrorKind::SizeLimit:
    return "size-limit";
  case ErrorKind::Assembly:
    return "assembly";
  case ErrorKind::LostAssembly:
    return "lost-assembly";
  case ErrorKind::ChunkUploadFailed:
    return "chunk-upload-failed";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Config:
    return "config";
  }
  return "unknown";
}

void ThrowUploadException(ErrorKind kind, const std::string &message) {
  std::string msg = ErrorKindToString(kind) + " error: " + message;
  Logger::getInstance().log(LogLevel::ERROR, msg);
  throw UploadException(kind, message);
}

} // namespace chunkup
