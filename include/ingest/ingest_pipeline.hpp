#ifndef CHUNKVAULT_INGEST_PIPELINE_HPP
#define CHUNKVAULT_INGEST_PIPELINE_HPP

#include "ingest/digest_claims.hpp"
#include "ingest/upload_session.hpp"
#include "metadata/metadata_index.hpp"
#include "storage/chunk_store.hpp"
#include "utilities/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkvault {

struct IngestOptions {
  bool verifyOnDedup = false;
  uint64_t maxObjectSizeBytes = 20ull * 1024 * 1024 * 1024;
  uint64_t maxChunksPerUpload = 1ull << 20;
};

/// Request to open an upload. version 0 selects the next free version.
struct UploadRequest {
  std::string objectId;
  uint64_t version = 0;
  uint64_t totalChunks = 0;
  std::string originalChecksum;
  uint64_t totalSizeBytes = 0;
};

struct UploadTicket {
  std::string uploadId;
  std::string objectId;
  uint64_t version = 0;
  uint64_t totalChunks = 0;
};

/// One chunk as sent by a client.
struct ChunkUpload {
  std::string uploadId;
  uint64_t chunkIndex = 0;
  std::optional<uint64_t> totalChunks; ///< Checked against the session
  std::vector<std::byte> rawBytes;
  std::string contentDigest; ///< Optional client-computed hex digest
};

enum class AdmitStatus { Ok, Duplicate, Error };

const char *admitStatusName(AdmitStatus status);

struct AdmitResult {
  AdmitStatus status = AdmitStatus::Error;
  bool dedupHit = false; ///< Content was already stored
  std::string digest;
  ErrorCode error = ErrorCode::None;
  std::string message;
};

struct FinalizeRequest {
  std::string uploadId;
  std::string objectId; ///< Optional, must match the session when set
  uint64_t version = 0; ///< Optional, must match the session when non-zero
  std::string originalChecksum; ///< Overrides the checksum given at creation
};

enum class FinalizeStatus { Complete, Mismatch, Incomplete, Error };

const char *finalizeStatusName(FinalizeStatus status);

struct FinalizeResult {
  FinalizeStatus status = FinalizeStatus::Error;
  std::vector<uint64_t> missing;
  ErrorCode error = ErrorCode::None;
  std::string message;
  std::string computedDigest;
  uint64_t sizeBytes = 0;
};

/**
 * @brief Admits chunks of resumable uploads and finalizes objects.
 *
 * Per chunk: hash, dedup lookup, then either skip storage or compress,
 * encode and place the shards, then append the manifest row and mark the
 * index received. Concurrent admissions of the same digest are serialised
 * by a per-digest claim, held until the manifest row is written, so each
 * unique digest is written once and garbage collection sharing the claims
 * never deletes a chunk an admission is about to reference. Nothing holds
 * a session-wide lock while compressing, encoding or writing.
 */
class IngestPipeline {
public:
  IngestPipeline(MetadataIndex &index, const ChunkStore &store,
                 UploadSessionManager &sessions, IngestOptions options = {},
                 std::shared_ptr<DigestClaims> claims = nullptr);

  /** Number of chunks of @p chunkSize needed for @p totalSize bytes. */
  static uint64_t planChunks(uint64_t totalSize, uint64_t chunkSize);

  /**
   * @brief Open an upload session for a new object version.
   * @throws VaultException(VersionConflict) if the version is committed or
   *         reserved by another live upload.
   * @throws VaultException(SizeMismatch) if totalSizeBytes exceeds the
   *         configured maximum.
   * @throws VaultException(InvalidChunkIndex) if totalChunks is zero or
   *         above maxChunksPerUpload.
   */
  UploadTicket createUpload(const UploadRequest &request);

  AdmitResult admit(const ChunkUpload &upload);
  AdmitResult admitChunk(const std::string &uploadId, uint64_t chunkIndex,
                         const std::vector<std::byte> &rawBytes);

  /**
   * @brief Verify and commit the object once every chunk is in.
   *
   * The manifest's chunks are streamed back through the store and hashed;
   * on a checksum or size mismatch the manifest is invalidated and the
   * session returns to receiving. Stored chunks are kept either way.
   */
  FinalizeResult finalize(const FinalizeRequest &request);

  /** @throws VaultException(SessionNotFound) */
  SessionStatus status(const std::string &uploadId) const;

  /** Drop a session and its uncommitted manifest. */
  bool cancel(const std::string &uploadId);

  /** Expire stale sessions. Returns how many were expired. */
  size_t reapExpired(SystemClock::time_point now);

  /** Claims to share with a ChunkGarbageCollector. */
  std::shared_ptr<DigestClaims> claims() const { return claims_; }

private:
  AdmitResult admitUnchecked(const ChunkUpload &upload);
  /**
   * @brief Ensure @p digest is stored. Returns true on a dedup hit.
   *
   * Caller holds the claim on @p digest.
   */
  bool storeOrDedup(const std::string &digest,
                    const std::vector<std::byte> &raw);
  void releaseVersion(const std::string &objectId, uint64_t version);

  MetadataIndex &index_;
  const ChunkStore &store_;
  UploadSessionManager &sessions_;
  IngestOptions options_;
  std::shared_ptr<DigestClaims> claims_;

  std::mutex versionsMutex_;
  std::map<std::string, std::set<uint64_t>> reservedVersions_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_INGEST_PIPELINE_HPP
