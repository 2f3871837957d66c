#ifndef CHUNKVAULT_UPLOAD_SESSION_HPP
#define CHUNKVAULT_UPLOAD_SESSION_HPP

#include "ingest/chunk_bitmap.hpp"
#include "metadata/chunk_meta.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkvault {

enum class SessionState { Created, Receiving, Finalizing, Committed, Expired };

const char *sessionStateName(SessionState state);

/// Bookkeeping for one in-flight upload.
struct UploadSession {
  std::string uploadId;
  std::string objectId;
  uint64_t version = 0;
  uint64_t totalChunks = 0;
  uint64_t totalSizeBytes = 0; ///< 0 when the client did not announce it
  std::string originalChecksum;
  ChunkBitmap receivedMask;
  uint64_t receivedBytes = 0;
  SessionState state = SessionState::Created;
  SystemClock::time_point createdAt{};
  SystemClock::time_point lastActivity{};
  SystemClock::time_point expiresAt{};
  SystemClock::time_point committedAt{};
};

struct SessionRequest {
  std::string objectId;
  uint64_t version = 0;
  uint64_t totalChunks = 0;
  std::string originalChecksum;
  uint64_t totalSizeBytes = 0;
};

struct SessionStatus {
  std::string uploadId;
  SessionState state = SessionState::Created;
  uint64_t totalChunks = 0;
  uint64_t receivedChunks = 0;
  std::vector<uint64_t> missing;
  double progress = 0.0; ///< receivedChunks / totalChunks
  SystemClock::time_point expiresAt{};
};

/// Where an admitted chunk belongs, resolved under the session lock.
struct AdmissionTarget {
  std::string objectId;
  uint64_t version = 0;
  uint64_t totalChunks = 0;
  bool alreadyReceived = false;
};

enum class FinalizeOutcome { Committed, AlreadyCommitted, Incomplete, Rejected };

struct FinalizeDecision {
  FinalizeOutcome outcome = FinalizeOutcome::Incomplete;
  std::vector<uint64_t> missing;
};

/**
 * @brief Registry of in-flight upload sessions.
 *
 * The registry lock is held only to find, add or drop a session. Every
 * session has its own state mutex guarding the received mask, plus a
 * finalize mutex so that at most one finalization runs per session.
 * Nothing here touches chunk content; callers clean up manifests of the
 * sessions returned by cancel() and reapExpired().
 */
class UploadSessionManager {
public:
  /**
   * @param timeout Inactivity window before a session expires.
   * @param retention How long a committed session stays queryable.
   */
  UploadSessionManager(std::chrono::seconds timeout,
                       std::chrono::seconds retention);

  /**
   * @brief Register a new session and return its id.
   *
   * Ids are 32 hex characters drawn from libsodium's CSPRNG.
   * @throws VaultException(InvalidChunkIndex) if totalChunks is 0.
   */
  std::string createSession(const SessionRequest &request);

  std::optional<UploadSession> snapshot(const std::string &uploadId) const;

  /** @throws VaultException(SessionNotFound) */
  SessionStatus status(const std::string &uploadId) const;

  /**
   * @brief Validate that a chunk may be admitted now.
   *
   * An index that was already received is reported through
   * AdmissionTarget::alreadyReceived rather than rejected.
   * @throws VaultException(SessionNotFound, SessionExpired,
   *         InvalidChunkIndex)
   */
  AdmissionTarget checkAdmissible(const std::string &uploadId,
                                  uint64_t chunkIndex);

  /**
   * @brief Set the received bit and refresh the expiry.
   * @return true if @p chunkIndex was not yet received.
   * @throws VaultException(SessionNotFound, InvalidChunkIndex)
   */
  bool markReceived(const std::string &uploadId, uint64_t chunkIndex,
                    uint64_t bytes);

  /**
   * @brief Run one finalization of @p uploadId.
   *
   * @p verifier is invoked without the state lock held, with a copy of the
   * session, and returns true to commit. A false result or an exception
   * puts the session back into Receiving; on false the mask is cleared so
   * the client re-sends the object. A concurrent caller waits for the
   * running finalization and then observes AlreadyCommitted.
   * @throws VaultException(SessionNotFound, SessionExpired)
   */
  FinalizeDecision
  finalize(const std::string &uploadId,
           const std::function<bool(const UploadSession &)> &verifier);

  /** Remove a session. Returns it so the caller can drop its manifest. */
  std::optional<UploadSession> cancel(const std::string &uploadId);

  /**
   * @brief Drop expired sessions and committed ones past retention.
   * @return The uncommitted sessions that were expired.
   */
  std::vector<UploadSession> reapExpired(SystemClock::time_point now);

  size_t size() const;

private:
  struct Entry {
    mutable std::mutex stateMutex;
    std::mutex finalizeMutex;
    UploadSession session;
  };

  std::shared_ptr<Entry> find(const std::string &uploadId) const;
  std::shared_ptr<Entry> require(const std::string &uploadId) const;

  std::chrono::seconds timeout_;
  std::chrono::seconds retention_;

  mutable std::shared_mutex registryMutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_UPLOAD_SESSION_HPP
