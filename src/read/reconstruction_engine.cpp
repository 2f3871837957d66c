#include "read/reconstruction_engine.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace chunkvault {

bool ObjectStream::next(std::vector<std::byte> &out) {
  if (position_ >= manifest_.entries.size())
    return false;
  const ManifestEntry &entry = manifest_.entries[position_];
  try {
    out = engine_->readChunk(entry.digest);
  } catch (const VaultException &e) {
    Logger::getInstance().log(
        LogLevel::ERROR, "Reading " + manifest_.objectId + " v" +
                             std::to_string(manifest_.version) +
                             " stopped at chunk " +
                             std::to_string(entry.chunkIndex) + ": " +
                             e.what());
    throw;
  }
  ++position_;
  return true;
}

ObjectStream ReconstructionEngine::open(const std::string &objectId,
                                        uint64_t version,
                                        uint64_t startIndex) const {
  ObjectManifest manifest = index_.getManifest(objectId, version);
  if (manifest.state != ManifestState::Committed) {
    throw VaultException(ErrorCode::ObjectNotFound,
                         objectId + " v" + std::to_string(version) +
                             " is not committed");
  }
  if (startIndex > manifest.entries.size()) {
    throw VaultException(ErrorCode::InvalidChunkIndex,
                         "start index " + std::to_string(startIndex) +
                             " past the " +
                             std::to_string(manifest.entries.size()) +
                             " chunks of " + objectId);
  }
  return ObjectStream(*this, std::move(manifest), startIndex);
}

ObjectStream ReconstructionEngine::openLatest(const std::string &objectId) const {
  auto version = index_.latestCommittedVersion(objectId);
  if (!version) {
    throw VaultException(ErrorCode::ObjectNotFound,
                         "No committed version of " + objectId);
  }
  return open(objectId, *version);
}

std::vector<std::byte>
ReconstructionEngine::readChunk(const std::string &digest) const {
  auto meta = index_.lookup(digest);
  if (!meta) {
    throw VaultException(ErrorCode::CorruptedChunk,
                         "Manifest references unknown chunk " + digest);
  }
  std::vector<std::byte> bytes = store_.getChunk(*meta);
  index_.touch(digest, SystemClock::now());
  MetricsRegistry::instance().incrementCounter(
      "chunkvault_bytes_read", static_cast<double>(bytes.size()));
  return bytes;
}

uint64_t ReconstructionEngine::readTo(const std::string &objectId,
                                      uint64_t version,
                                      std::ostream &out) const {
  ObjectStream stream = open(objectId, version);
  std::vector<std::byte> chunk;
  uint64_t written = 0;
  while (stream.next(chunk)) {
    out.write(reinterpret_cast<const char *>(chunk.data()),
              static_cast<std::streamsize>(chunk.size()));
    if (!out) {
      throw VaultException(ErrorCode::StorageWriteFailure,
                           "Output stream failed while writing " + objectId);
    }
    written += chunk.size();
  }
  return written;
}

std::vector<std::byte> ReconstructionEngine::readAll(const std::string &objectId,
                                                     uint64_t version) const {
  ObjectStream stream = open(objectId, version);
  std::vector<std::byte> all;
  std::vector<std::byte> chunk;
  while (stream.next(chunk))
    all.insert(all.end(), chunk.begin(), chunk.end());
  return all;
}

} // namespace chunkvault
