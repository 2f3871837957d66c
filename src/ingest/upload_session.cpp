#include "ingest/upload_session.hpp"
#include "utilities/chunk_hasher.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <array>
#include <iterator>

namespace chunkvault {

const char *sessionStateName(SessionState state) {
  switch (state) {
  case SessionState::Created:
    return "created";
  case SessionState::Receiving:
    return "receiving";
  case SessionState::Finalizing:
    return "finalizing";
  case SessionState::Committed:
    return "committed";
  case SessionState::Expired:
    return "expired";
  }
  return "created";
}

namespace {

std::string newUploadId() {
  ensureSodiumInitialized();
  std::array<unsigned char, 16> raw{};
  randombytes_buf(raw.data(), raw.size());
  std::array<char, 33> hex{};
  sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
  return std::string(hex.data());
}

bool isOpen(SessionState state) {
  return state == SessionState::Created || state == SessionState::Receiving;
}

} // namespace

UploadSessionManager::UploadSessionManager(std::chrono::seconds timeout,
                                           std::chrono::seconds retention)
    : timeout_(timeout), retention_(retention) {}

std::string UploadSessionManager::createSession(const SessionRequest &request) {
  if (request.totalChunks == 0) {
    ThrowVaultException(ErrorCode::InvalidChunkIndex,
                        "upload of " + request.objectId +
                            " must announce at least one chunk");
  }
  auto entry = std::make_shared<Entry>();
  UploadSession &s = entry->session;
  s.objectId = request.objectId;
  s.version = request.version;
  s.totalChunks = request.totalChunks;
  s.totalSizeBytes = request.totalSizeBytes;
  s.originalChecksum = request.originalChecksum;
  s.receivedMask = ChunkBitmap(request.totalChunks);
  s.state = SessionState::Created;
  s.createdAt = SystemClock::now();
  s.lastActivity = s.createdAt;
  s.expiresAt = s.createdAt + timeout_;

  std::unique_lock<std::shared_mutex> lock(registryMutex_);
  do {
    s.uploadId = newUploadId();
  } while (sessions_.count(s.uploadId));
  sessions_.emplace(s.uploadId, entry);
  Logger::getInstance().log(
      LogLevel::INFO, "Upload " + s.uploadId + " opened for " + s.objectId +
                          " v" + std::to_string(s.version) + " (" +
                          std::to_string(s.totalChunks) + " chunks)");
  return s.uploadId;
}

std::shared_ptr<UploadSessionManager::Entry>
UploadSessionManager::find(const std::string &uploadId) const {
  std::shared_lock<std::shared_mutex> lock(registryMutex_);
  auto it = sessions_.find(uploadId);
  return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<UploadSessionManager::Entry>
UploadSessionManager::require(const std::string &uploadId) const {
  auto entry = find(uploadId);
  if (!entry) {
    throw VaultException(ErrorCode::SessionNotFound,
                         "Unknown upload session " + uploadId);
  }
  return entry;
}

std::optional<UploadSession>
UploadSessionManager::snapshot(const std::string &uploadId) const {
  auto entry = find(uploadId);
  if (!entry)
    return std::nullopt;
  std::lock_guard<std::mutex> lock(entry->stateMutex);
  return entry->session;
}

SessionStatus UploadSessionManager::status(const std::string &uploadId) const {
  auto entry = require(uploadId);
  std::lock_guard<std::mutex> lock(entry->stateMutex);
  const UploadSession &s = entry->session;
  SessionStatus st;
  st.uploadId = s.uploadId;
  st.state = s.state;
  st.totalChunks = s.totalChunks;
  st.receivedChunks = s.receivedMask.count();
  st.missing = s.receivedMask.missing();
  st.progress = s.totalChunks == 0 ? 0.0
                                   : static_cast<double>(st.receivedChunks) /
                                         static_cast<double>(s.totalChunks);
  st.expiresAt = s.expiresAt;
  return st;
}

AdmissionTarget UploadSessionManager::checkAdmissible(const std::string &uploadId,
                                                      uint64_t chunkIndex) {
  auto entry = require(uploadId);
  std::lock_guard<std::mutex> lock(entry->stateMutex);
  UploadSession &s = entry->session;
  if (s.state == SessionState::Expired ||
      (isOpen(s.state) && SystemClock::now() >= s.expiresAt)) {
    s.state = SessionState::Expired;
    throw VaultException(ErrorCode::SessionExpired,
                         "Upload session " + uploadId + " has expired");
  }
  if (chunkIndex >= s.totalChunks) {
    throw VaultException(ErrorCode::InvalidChunkIndex,
                         "Chunk index " + std::to_string(chunkIndex) +
                             " outside [0, " + std::to_string(s.totalChunks) +
                             ") for upload " + uploadId);
  }
  AdmissionTarget target;
  target.objectId = s.objectId;
  target.version = s.version;
  target.totalChunks = s.totalChunks;
  target.alreadyReceived = s.state == SessionState::Committed ||
                           s.receivedMask.test(chunkIndex);
  return target;
}

bool UploadSessionManager::markReceived(const std::string &uploadId,
                                        uint64_t chunkIndex, uint64_t bytes) {
  auto entry = require(uploadId);
  std::lock_guard<std::mutex> lock(entry->stateMutex);
  UploadSession &s = entry->session;
  if (chunkIndex >= s.totalChunks) {
    throw VaultException(ErrorCode::InvalidChunkIndex,
                         "Chunk index " + std::to_string(chunkIndex) +
                             " outside upload " + uploadId);
  }
  if (s.state == SessionState::Committed)
    return false;
  const bool fresh = s.receivedMask.set(chunkIndex);
  if (fresh)
    s.receivedBytes += bytes;
  if (s.state == SessionState::Created)
    s.state = SessionState::Receiving;
  s.lastActivity = SystemClock::now();
  s.expiresAt = s.lastActivity + timeout_;
  return fresh;
}

FinalizeDecision UploadSessionManager::finalize(
    const std::string &uploadId,
    const std::function<bool(const UploadSession &)> &verifier) {
  auto entry = require(uploadId);
  std::lock_guard<std::mutex> finalizeLock(entry->finalizeMutex);

  UploadSession copy;
  {
    std::lock_guard<std::mutex> lock(entry->stateMutex);
    UploadSession &s = entry->session;
    if (s.state == SessionState::Committed)
      return FinalizeDecision{FinalizeOutcome::AlreadyCommitted, {}};
    if (s.state == SessionState::Expired) {
      throw VaultException(ErrorCode::SessionExpired,
                           "Upload session " + uploadId + " has expired");
    }
    if (!s.receivedMask.full())
      return FinalizeDecision{FinalizeOutcome::Incomplete,
                              s.receivedMask.missing()};
    s.state = SessionState::Finalizing;
    copy = s;
  }

  bool accepted = false;
  try {
    accepted = verifier(copy);
  } catch (const std::exception &e) {
    std::lock_guard<std::mutex> lock(entry->stateMutex);
    entry->session.state = SessionState::Receiving;
    Logger::getInstance().log(LogLevel::WARN, "Finalization of upload " +
                                                  uploadId +
                                                  " aborted: " + e.what());
    throw;
  }

  std::lock_guard<std::mutex> lock(entry->stateMutex);
  UploadSession &s = entry->session;
  if (accepted) {
    s.state = SessionState::Committed;
    s.committedAt = SystemClock::now();
    return FinalizeDecision{FinalizeOutcome::Committed, {}};
  }
  s.state = SessionState::Receiving;
  s.receivedMask.clear();
  s.receivedBytes = 0;
  s.lastActivity = SystemClock::now();
  s.expiresAt = s.lastActivity + timeout_;
  return FinalizeDecision{FinalizeOutcome::Rejected, s.receivedMask.missing()};
}

std::optional<UploadSession>
UploadSessionManager::cancel(const std::string &uploadId) {
  std::shared_ptr<Entry> entry;
  {
    std::unique_lock<std::shared_mutex> lock(registryMutex_);
    auto it = sessions_.find(uploadId);
    if (it == sessions_.end())
      return std::nullopt;
    entry = it->second;
    sessions_.erase(it);
  }
  std::lock_guard<std::mutex> lock(entry->stateMutex);
  Logger::getInstance().log(LogLevel::INFO,
                            "Upload " + uploadId + " cancelled");
  return entry->session;
}

std::vector<UploadSession>
UploadSessionManager::reapExpired(SystemClock::time_point now) {
  std::vector<UploadSession> expired;
  size_t retired = 0;
  std::unique_lock<std::shared_mutex> lock(registryMutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    std::unique_lock<std::mutex> stateLock(it->second->stateMutex);
    UploadSession &s = it->second->session;
    bool drop = false;
    if (s.state == SessionState::Committed) {
      drop = now >= s.committedAt + retention_;
      retired += drop ? 1 : 0;
    } else if (s.state != SessionState::Finalizing &&
               (s.state == SessionState::Expired || now >= s.expiresAt)) {
      s.state = SessionState::Expired;
      expired.push_back(s);
      drop = true;
    }
    stateLock.unlock();
    it = drop ? sessions_.erase(it) : std::next(it);
  }
  if (!expired.empty() || retired > 0) {
    Logger::getInstance().log(LogLevel::INFO,
                              "Reaped " + std::to_string(expired.size()) +
                                  " expired and " + std::to_string(retired) +
                                  " committed upload sessions");
  }
  return expired;
}

size_t UploadSessionManager::size() const {
  std::shared_lock<std::shared_mutex> lock(registryMutex_);
  return sessions_.size();
}

} // namespace chunkvault
