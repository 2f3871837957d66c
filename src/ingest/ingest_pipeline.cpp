#include "ingest/ingest_pipeline.hpp"
#include "utilities/chunk_hasher.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <cctype>

namespace chunkvault {

const char *admitStatusName(AdmitStatus status) {
  switch (status) {
  case AdmitStatus::Ok:
    return "ok";
  case AdmitStatus::Duplicate:
    return "duplicate";
  case AdmitStatus::Error:
    return "error";
  }
  return "error";
}

const char *finalizeStatusName(FinalizeStatus status) {
  switch (status) {
  case FinalizeStatus::Complete:
    return "complete";
  case FinalizeStatus::Mismatch:
    return "mismatch";
  case FinalizeStatus::Incomplete:
    return "incomplete";
  case FinalizeStatus::Error:
    return "error";
  }
  return "error";
}

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

AdmitResult admitError(ErrorCode code, const std::string &message) {
  AdmitResult r;
  r.status = AdmitStatus::Error;
  r.error = code;
  r.message = message;
  MetricsRegistry::instance().incrementCounter(
      "chunkvault_admit_errors", 1.0, {{"code", errorCodeName(code)}});
  return r;
}

FinalizeResult finalizeError(ErrorCode code, const std::string &message) {
  FinalizeResult r;
  r.status = FinalizeStatus::Error;
  r.error = code;
  r.message = message;
  return r;
}

} // namespace

IngestPipeline::IngestPipeline(MetadataIndex &index, const ChunkStore &store,
                               UploadSessionManager &sessions,
                               IngestOptions options,
                               std::shared_ptr<DigestClaims> claims)
    : index_(index), store_(store), sessions_(sessions), options_(options),
      claims_(claims ? std::move(claims) : std::make_shared<DigestClaims>()) {}

uint64_t IngestPipeline::planChunks(uint64_t totalSize, uint64_t chunkSize) {
  if (chunkSize == 0)
    throw std::invalid_argument("chunk size must be positive");
  if (totalSize == 0)
    return 0;
  return (totalSize + chunkSize - 1) / chunkSize;
}

UploadTicket IngestPipeline::createUpload(const UploadRequest &request) {
  if (request.totalSizeBytes > options_.maxObjectSizeBytes) {
    ThrowVaultException(ErrorCode::SizeMismatch,
                        request.objectId + " is " +
                            std::to_string(request.totalSizeBytes) +
                            " bytes, above the limit of " +
                            std::to_string(options_.maxObjectSizeBytes));
  }
  if (request.totalChunks > options_.maxChunksPerUpload) {
    ThrowVaultException(ErrorCode::InvalidChunkIndex,
                        request.objectId + " declares " +
                            std::to_string(request.totalChunks) +
                            " chunks, above the limit of " +
                            std::to_string(options_.maxChunksPerUpload));
  }
  if (request.totalSizeBytes > 0 &&
      request.totalChunks > request.totalSizeBytes) {
    ThrowVaultException(ErrorCode::InvalidChunkIndex,
                        request.objectId + " declares " +
                            std::to_string(request.totalChunks) +
                            " non-empty chunks for " +
                            std::to_string(request.totalSizeBytes) +
                            " bytes");
  }

  uint64_t version = request.version;
  {
    std::lock_guard<std::mutex> lock(versionsMutex_);
    const uint64_t committed =
        index_.latestCommittedVersion(request.objectId).value_or(0);
    auto &reserved = reservedVersions_[request.objectId];
    if (version == 0) {
      version = committed + 1;
      if (!reserved.empty())
        version = std::max(version, *reserved.rbegin() + 1);
    } else if (version <= committed || reserved.count(version)) {
      if (reserved.empty())
        reservedVersions_.erase(request.objectId);
      ThrowVaultException(ErrorCode::VersionConflict,
                          request.objectId + " v" + std::to_string(version) +
                              " is already committed or being uploaded");
    }
    reserved.insert(version);
  }

  SessionRequest sessionRequest;
  sessionRequest.objectId = request.objectId;
  sessionRequest.version = version;
  sessionRequest.totalChunks = request.totalChunks;
  sessionRequest.originalChecksum = toLower(request.originalChecksum);
  sessionRequest.totalSizeBytes = request.totalSizeBytes;

  UploadTicket ticket;
  try {
    ticket.uploadId = sessions_.createSession(sessionRequest);
  } catch (...) {
    releaseVersion(request.objectId, version);
    throw;
  }
  try {
    index_.openManifest(request.objectId, version, ticket.uploadId);
  } catch (...) {
    sessions_.cancel(ticket.uploadId);
    releaseVersion(request.objectId, version);
    throw;
  }
  ticket.objectId = request.objectId;
  ticket.version = version;
  ticket.totalChunks = request.totalChunks;
  return ticket;
}

void IngestPipeline::releaseVersion(const std::string &objectId,
                                    uint64_t version) {
  std::lock_guard<std::mutex> lock(versionsMutex_);
  auto it = reservedVersions_.find(objectId);
  if (it == reservedVersions_.end())
    return;
  it->second.erase(version);
  if (it->second.empty())
    reservedVersions_.erase(it);
}

AdmitResult IngestPipeline::admitChunk(const std::string &uploadId,
                                       uint64_t chunkIndex,
                                       const std::vector<std::byte> &rawBytes) {
  ChunkUpload upload;
  upload.uploadId = uploadId;
  upload.chunkIndex = chunkIndex;
  upload.rawBytes = rawBytes;
  return admit(upload);
}

AdmitResult IngestPipeline::admit(const ChunkUpload &upload) {
  try {
    return admitUnchecked(upload);
  } catch (const VaultException &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Chunk " + std::to_string(upload.chunkIndex) +
                                  " of upload " + upload.uploadId +
                                  " rejected: " + e.what());
    return admitError(e.code(), e.what());
  } catch (const std::runtime_error &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Chunk " + std::to_string(upload.chunkIndex) +
                                  " of upload " + upload.uploadId +
                                  " failed: " + e.what());
    return admitError(ErrorCode::StorageWriteFailure, e.what());
  }
}

AdmitResult IngestPipeline::admitUnchecked(const ChunkUpload &upload) {
  if (upload.rawBytes.empty()) {
    return admitError(ErrorCode::EmptyChunk,
                      "chunk " + std::to_string(upload.chunkIndex) +
                          " of upload " + upload.uploadId + " is empty");
  }
  AdmissionTarget target =
      sessions_.checkAdmissible(upload.uploadId, upload.chunkIndex);
  if (upload.totalChunks && *upload.totalChunks != target.totalChunks) {
    return admitError(ErrorCode::InvalidChunkIndex,
                      "upload " + upload.uploadId + " expects " +
                          std::to_string(target.totalChunks) +
                          " chunks, request says " +
                          std::to_string(*upload.totalChunks));
  }

  const std::string digest = ChunkHasher::hash(upload.rawBytes);
  if (!upload.contentDigest.empty() &&
      toLower(upload.contentDigest) != digest) {
    return admitError(ErrorCode::ChunkDigestMismatch,
                      "chunk " + std::to_string(upload.chunkIndex) +
                          " hashes to " + digest + ", client sent " +
                          upload.contentDigest);
  }

  AdmitResult result;
  result.digest = digest;

  if (target.alreadyReceived) {
    auto recorded = index_.manifestEntry(target.objectId, target.version,
                                         upload.chunkIndex);
    if (recorded && *recorded == digest) {
      result.status = AdmitStatus::Duplicate;
      result.message = "chunk already received";
      return result;
    }
    if (recorded) {
      return admitError(ErrorCode::DuplicateChunkIndex,
                        "chunk " + std::to_string(upload.chunkIndex) +
                            " was received as " + *recorded);
    }
  }

  {
    DigestClaims::Claim claim(*claims_, digest);
    result.dedupHit = storeOrDedup(digest, upload.rawBytes);
    try {
      index_.appendManifestEntry(target.objectId, target.version,
                                 upload.uploadId, upload.chunkIndex, digest);
    } catch (const VaultException &e) {
      if (e.code() != ErrorCode::ObjectNotFound)
        throw;
      return admitError(ErrorCode::SessionNotFound,
                        "upload " + upload.uploadId +
                            " was cancelled or expired: " + e.what());
    }
  }
  sessions_.markReceived(upload.uploadId, upload.chunkIndex,
                         upload.rawBytes.size());

  auto &metrics = MetricsRegistry::instance();
  metrics.incrementCounter("chunkvault_chunks_admitted");
  metrics.observe("chunkvault_chunk_size_bytes",
                  static_cast<double>(upload.rawBytes.size()));
  if (result.dedupHit) {
    metrics.incrementCounter("chunkvault_dedup_hits");
    result.status = AdmitStatus::Duplicate;
    result.message = "content already stored";
  } else {
    result.status = AdmitStatus::Ok;
  }
  Logger::getInstance().log(
      LogLevel::DEBUG,
      "Admitted chunk " + std::to_string(upload.chunkIndex) + " of upload " +
          upload.uploadId + " as " + digest +
          (result.dedupHit ? " (dedup)" : ""));
  return result;
}

bool IngestPipeline::storeOrDedup(const std::string &digest,
                                  const std::vector<std::byte> &raw) {
  if (auto existing = index_.lookup(digest)) {
    if (options_.verifyOnDedup) {
      std::vector<std::byte> stored = store_.getChunk(*existing);
      if (stored != raw) {
        ThrowVaultException(ErrorCode::DigestCollision,
                            "stored bytes of " + digest +
                                " differ from the uploaded chunk");
      }
    }
    index_.touch(digest, SystemClock::now());
    return true;
  }

  ChunkMeta meta = store_.putChunk(digest, raw);
  if (index_.insertIfAbsent(meta) == InsertOutcome::AlreadyExists) {
    // Row added by another process sharing the index; same shard files.
    return true;
  }
  return false;
}

FinalizeResult IngestPipeline::finalize(const FinalizeRequest &request) {
  auto session = sessions_.snapshot(request.uploadId);
  if (!session) {
    return finalizeError(ErrorCode::SessionNotFound,
                         "Unknown upload session " + request.uploadId);
  }
  if ((!request.objectId.empty() && request.objectId != session->objectId) ||
      (request.version != 0 && request.version != session->version)) {
    return finalizeError(ErrorCode::VersionConflict,
                         "upload " + request.uploadId + " targets " +
                             session->objectId + " v" +
                             std::to_string(session->version));
  }

  FinalizeResult result;
  const std::string expected = toLower(request.originalChecksum.empty()
                                           ? session->originalChecksum
                                           : request.originalChecksum);

  auto verifier = [&](const UploadSession &s) {
    ObjectManifest manifest = index_.getManifest(s.objectId, s.version);
    if (manifest.entries.size() != s.totalChunks) {
      ThrowVaultException(ErrorCode::IncompleteUpload,
                          s.objectId + " manifest holds " +
                              std::to_string(manifest.entries.size()) +
                              " of " + std::to_string(s.totalChunks) +
                              " chunks");
    }
    ChunkHasher hasher;
    uint64_t total = 0;
    for (const auto &entry : manifest.entries) {
      auto meta = index_.lookup(entry.digest);
      if (!meta) {
        ThrowVaultException(ErrorCode::CorruptedChunk,
                            "manifest references unknown chunk " +
                                entry.digest);
      }
      std::vector<std::byte> bytes = store_.getChunk(*meta);
      hasher.update(bytes);
      total += bytes.size();
    }
    result.computedDigest = hasher.finalizeHex();
    result.sizeBytes = total;

    if (expected.empty()) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Upload " + s.uploadId +
                                    " has no checksum; committing unverified");
    } else if (expected != result.computedDigest) {
      result.error = ErrorCode::ChecksumMismatch;
      result.message = "object hashes to " + result.computedDigest +
                       ", expected " + expected;
    }
    if (result.error == ErrorCode::None && s.totalSizeBytes > 0 &&
        s.totalSizeBytes != total) {
      result.error = ErrorCode::SizeMismatch;
      result.message = "object is " + std::to_string(total) +
                       " bytes, expected " + std::to_string(s.totalSizeBytes);
    }
    if (result.error != ErrorCode::None) {
      index_.invalidateManifest(s.objectId, s.version);
      return false;
    }
    index_.commitManifest(s.objectId, s.version, s.totalChunks);
    return true;
  };

  FinalizeDecision decision;
  try {
    decision = sessions_.finalize(request.uploadId, verifier);
  } catch (const VaultException &e) {
    MetricsRegistry::instance().incrementCounter("chunkvault_finalize_total",
                                                 1.0, {{"status", "error"}});
    return finalizeError(e.code(), e.what());
  }

  switch (decision.outcome) {
  case FinalizeOutcome::Committed:
    result.status = FinalizeStatus::Complete;
    releaseVersion(session->objectId, session->version);
    Logger::getInstance().log(LogLevel::INFO,
                              "Committed " + session->objectId + " v" +
                                  std::to_string(session->version) + " (" +
                                  std::to_string(result.sizeBytes) +
                                  " bytes, " +
                                  std::to_string(session->totalChunks) +
                                  " chunks)");
    break;
  case FinalizeOutcome::AlreadyCommitted:
    result.status = FinalizeStatus::Complete;
    result.message = "already committed";
    break;
  case FinalizeOutcome::Incomplete:
    result.status = FinalizeStatus::Incomplete;
    result.error = ErrorCode::IncompleteUpload;
    result.missing = std::move(decision.missing);
    break;
  case FinalizeOutcome::Rejected:
    result.status = FinalizeStatus::Mismatch;
    result.missing = std::move(decision.missing);
    Logger::getInstance().log(LogLevel::WARN, "Upload " + request.uploadId +
                                                  " failed verification: " +
                                                  result.message);
    break;
  }
  MetricsRegistry::instance().incrementCounter(
      "chunkvault_finalize_total", 1.0,
      {{"status", finalizeStatusName(result.status)}});
  return result;
}

SessionStatus IngestPipeline::status(const std::string &uploadId) const {
  return sessions_.status(uploadId);
}

bool IngestPipeline::cancel(const std::string &uploadId) {
  auto session = sessions_.cancel(uploadId);
  if (!session)
    return false;
  if (session->state != SessionState::Committed) {
    index_.discardManifest(session->objectId, session->version);
    releaseVersion(session->objectId, session->version);
  }
  return true;
}

size_t IngestPipeline::reapExpired(SystemClock::time_point now) {
  std::vector<UploadSession> expired = sessions_.reapExpired(now);
  for (const auto &s : expired) {
    index_.discardManifest(s.objectId, s.version);
    releaseVersion(s.objectId, s.version);
  }
  if (!expired.empty()) {
    MetricsRegistry::instance().incrementCounter(
        "chunkvault_sessions_expired", static_cast<double>(expired.size()));
  }
  return expired.size();
}

} // namespace chunkvault
