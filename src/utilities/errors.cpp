#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include <iostream>

namespace chunkvault {

const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::SessionNotFound:
    return "SessionNotFound";
  case ErrorCode::SessionExpired:
    return "SessionExpired";
  case ErrorCode::InvalidChunkIndex:
    return "InvalidChunkIndex";
  case ErrorCode::EmptyChunk:
    return "EmptyChunk";
  case ErrorCode::DuplicateChunkIndex:
    return "DuplicateChunkIndex";
  case ErrorCode::ChunkDigestMismatch:
    return "ChunkDigestMismatch";
  case ErrorCode::ChecksumMismatch:
    return "ChecksumMismatch";
  case ErrorCode::SizeMismatch:
    return "SizeMismatch";
  case ErrorCode::IncompleteUpload:
    return "IncompleteUpload";
  case ErrorCode::VersionConflict:
    return "VersionConflict";
  case ErrorCode::ManifestCommitted:
    return "ManifestCommitted";
  case ErrorCode::ObjectNotFound:
    return "ObjectNotFound";
  case ErrorCode::InsufficientShards:
    return "InsufficientShards";
  case ErrorCode::CorruptedChunk:
    return "CorruptedChunk";
  case ErrorCode::DigestCollision:
    return "DigestCollision";
  case ErrorCode::StorageWriteFailure:
    return "StorageWriteFailure";
  case ErrorCode::StorageReadFailure:
    return "StorageReadFailure";
  case ErrorCode::IndexUnavailable:
    return "IndexUnavailable";
  case ErrorCode::InvalidConfig:
    return "InvalidConfig";
  }
  return "Unknown";
}

bool isRetryable(ErrorCode code) {
  return code == ErrorCode::StorageWriteFailure ||
         code == ErrorCode::StorageReadFailure ||
         code == ErrorCode::IndexUnavailable;
}

void ThrowVaultException(ErrorCode code, const std::string &message) {
  std::string msg = std::string(errorCodeName(code)) + " (" +
                    std::to_string(static_cast<int>(code)) + "): " + message;
  try {
    Logger::getInstance().log(LogLevel::ERROR, msg);
  } catch (const std::runtime_error &e) {
    std::cerr << "Logger not initialized. Original error: " << msg
              << " Logger error: " << e.what() << std::endl;
  }
  throw VaultException(code, message);
}

} // namespace chunkvault
