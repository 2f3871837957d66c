#ifndef CHUNKVAULT_ERRORS_HPP
#define CHUNKVAULT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace chunkvault {

/// Failure kinds surfaced by the ingest, storage and read paths.
enum class ErrorCode {
  None = 0,
  SessionNotFound = 1001,
  SessionExpired = 1002,
  InvalidChunkIndex = 1003,
  EmptyChunk = 1004,
  DuplicateChunkIndex = 1005,
  ChunkDigestMismatch = 1006,
  ChecksumMismatch = 1007,
  SizeMismatch = 1008,
  IncompleteUpload = 1009,
  VersionConflict = 1010,
  ManifestCommitted = 1011,
  ObjectNotFound = 2001,
  InsufficientShards = 2002,
  CorruptedChunk = 2003,
  DigestCollision = 2004,
  StorageWriteFailure = 3001,
  StorageReadFailure = 3002,
  IndexUnavailable = 3003,
  InvalidConfig = 4001
};

/** Human readable name of @p code, e.g. "InsufficientShards". */
const char *errorCodeName(ErrorCode code);

/**
 * @brief Transient failures the client may retry through the resumable
 * protocol without changing the request.
 */
bool isRetryable(ErrorCode code);

/**
 * @brief Exception type thrown by all ChunkVault components.
 *
 * Carries the ErrorCode so callers can distinguish, for example, a missing
 * object from a chunk that lost too many shards.
 */
class VaultException : public std::runtime_error {
public:
  VaultException(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

/**
 * @brief Log @p message at ERROR level and throw a VaultException.
 *
 * Falls back to stderr when the logger cannot be reached.
 */
[[noreturn]] void ThrowVaultException(ErrorCode code,
                                      const std::string &message);

} // namespace chunkvault

#endif // CHUNKVAULT_ERRORS_HPP
