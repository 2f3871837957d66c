#include "storage/chunk_store.hpp"
#include "utilities/chunk_hasher.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <stdexcept>

namespace chunkvault {

ChunkStore::ChunkStore(std::vector<std::shared_ptr<ShardBackend>> backends,
                       std::shared_ptr<const ErasureCoder> coder,
                       Compressor compressor, size_t digestPrefixLength,
                       std::shared_ptr<BackendHealthCache> health)
    : backends_(std::move(backends)), coder_(std::move(coder)),
      compressor_(compressor), digestPrefixLength_(digestPrefixLength),
      health_(std::move(health)) {
  if (backends_.empty()) {
    throw std::invalid_argument("ChunkStore needs at least one backend");
  }
  if (!coder_) {
    throw std::invalid_argument("ChunkStore needs an erasure coder");
  }
  for (const auto &b : backends_) {
    backendIndex_[b->id()] = b.get();
  }
  if (backends_.size() < coder_->totalShards()) {
    Logger::getInstance().log(
        LogLevel::WARN,
        "Only " + std::to_string(backends_.size()) + " storage backends for " +
            std::to_string(coder_->totalShards()) +
            " shards per chunk; one device failure may lose several shards");
  }
}

std::string ChunkStore::shardRelativePath(const std::string &digest,
                                          size_t shardIndex,
                                          size_t prefixLength) {
  return digest.substr(0, prefixLength) + "/" + digest + "." +
         std::to_string(shardIndex) + ".shard";
}

std::shared_ptr<const ErasureCoder>
ChunkStore::coderFor(const ChunkMeta &meta) const {
  if (meta.dataShards == coder_->dataShards() &&
      meta.parityShards == coder_->parityShards()) {
    return coder_;
  }
  // Chunk written under an older k/m setting.
  try {
    return std::make_shared<ReedSolomonCoder>(meta.dataShards,
                                              meta.parityShards);
  } catch (const std::invalid_argument &e) {
    ThrowVaultException(ErrorCode::CorruptedChunk,
                        "chunk " + meta.digest + " has unusable shard counts " +
                            std::to_string(meta.dataShards) + "+" +
                            std::to_string(meta.parityShards) + ": " +
                            e.what());
  }
}

ShardBackend *ChunkStore::backendById(const std::string &id) const {
  auto it = backendIndex_.find(id);
  return it == backendIndex_.end() ? nullptr : it->second;
}

size_t ChunkStore::placementOffset(const std::string &digest) const {
  unsigned long prefix = 0;
  try {
    prefix = std::stoul(digest.substr(0, 4), nullptr, 16);
  } catch (const std::exception &) {
    prefix = 0;
  }
  return static_cast<size_t>(prefix % backends_.size());
}

ChunkMeta ChunkStore::putChunk(const std::string &digest,
                               const std::vector<std::byte> &raw) const {
  std::vector<std::byte> compressed = compressor_.compress(raw);
  std::vector<Shard> shards = coder_->encode(compressed);

  ChunkMeta meta;
  meta.digest = digest;
  meta.sizeBytes = raw.size();
  meta.compressedSizeBytes = compressed.size();
  meta.dataShards = coder_->dataShards();
  meta.parityShards = coder_->parityShards();
  meta.tier = StorageTier::Hot;
  meta.createdAt = SystemClock::now();
  meta.lastAccessedAt = meta.createdAt;

  const size_t offset = placementOffset(digest);
  for (size_t i = 0; i < shards.size(); ++i) {
    ShardBackend *backend = backends_[(offset + i) % backends_.size()].get();
    std::string rel = shardRelativePath(digest, i, digestPrefixLength_);
    try {
      std::string path = backend->write(rel, shards[i]);
      meta.shardLocations.push_back(ShardLocation{
          i, path, backend->id(), ChunkHasher::hash(shards[i])});
      if (health_)
        health_->recordSuccess(backend->id());
    } catch (const VaultException &) {
      if (health_)
        health_->recordFailure(backend->id());
      throw;
    }
  }

  auto &metrics = MetricsRegistry::instance();
  metrics.incrementCounter("chunkvault_raw_bytes_stored",
                           static_cast<double>(raw.size()));
  metrics.incrementCounter("chunkvault_compressed_bytes_stored",
                           static_cast<double>(compressed.size()));
  Logger::getInstance().log(
      LogLevel::DEBUG, "Stored chunk " + digest + " (" +
                           std::to_string(raw.size()) + " -> " +
                           std::to_string(compressed.size()) + " bytes, " +
                           std::to_string(shards.size()) + " shards)");
  return meta;
}

std::vector<ShardLocation>
ChunkStore::orderedLocations(const ChunkMeta &meta) const {
  std::vector<ShardLocation> locations = meta.shardLocations;
  if (!health_)
    return locations;

  std::vector<BackendID> ids;
  for (const auto &loc : locations) {
    if (std::find(ids.begin(), ids.end(), loc.backendId) == ids.end())
      ids.push_back(loc.backendId);
  }
  std::vector<BackendID> ranked = health_->orderByHealth(ids);
  auto rankOf = [&ranked](const std::string &id) {
    return std::find(ranked.begin(), ranked.end(), id) - ranked.begin();
  };
  std::stable_sort(locations.begin(), locations.end(),
                   [&](const ShardLocation &a, const ShardLocation &b) {
                     return rankOf(a.backendId) < rankOf(b.backendId);
                   });
  return locations;
}

ShardMap ChunkStore::fetchShards(const ChunkMeta &meta, size_t shardLen,
                                 size_t wanted) const {
  ShardMap available;
  for (const auto &loc : orderedLocations(meta)) {
    if (available.size() >= wanted)
      break;
    ShardBackend *backend = backendById(loc.backendId);
    if (!backend) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Unknown storage backend " + loc.backendId +
                                    " for shard " + loc.storagePath);
      continue;
    }
    std::optional<std::vector<std::byte>> data;
    try {
      data = backend->read(loc.storagePath);
    } catch (const VaultException &) {
      if (health_)
        health_->recordFailure(loc.backendId);
      continue;
    }
    if (!data) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Shard missing: " + loc.storagePath);
      MetricsRegistry::instance().incrementCounter(
          "chunkvault_shard_read_failures", 1.0, {{"reason", "missing"}});
      if (health_)
        health_->recordFailure(loc.backendId);
      continue;
    }
    if (data->size() != shardLen) {
      Logger::getInstance().log(
          LogLevel::WARN, "Shard " + loc.storagePath + " has " +
                              std::to_string(data->size()) +
                              " bytes, expected " + std::to_string(shardLen));
      MetricsRegistry::instance().incrementCounter(
          "chunkvault_shard_read_failures", 1.0, {{"reason", "size"}});
      continue;
    }
    if (health_)
      health_->recordSuccess(loc.backendId);
    if (!loc.checksum.empty() && ChunkHasher::hash(*data) != loc.checksum) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Shard " + loc.storagePath +
                                    " fails its checksum; trying others");
      MetricsRegistry::instance().incrementCounter(
          "chunkvault_shard_read_failures", 1.0, {{"reason", "checksum"}});
      continue;
    }
    available.emplace(loc.shardIndex, std::move(*data));
  }
  return available;
}

std::vector<std::byte> ChunkStore::getChunk(const ChunkMeta &meta) const {
  auto coder = coderFor(meta);
  const size_t shardLen = coder->shardSize(meta.compressedSizeBytes);
  ShardMap available = fetchShards(meta, shardLen, coder->dataShards());
  if (available.size() < coder->dataShards()) {
    ThrowVaultException(ErrorCode::InsufficientShards,
                        "chunk " + meta.digest + ": " +
                            std::to_string(available.size()) + " of " +
                            std::to_string(coder->totalShards()) +
                            " shards readable, " +
                            std::to_string(coder->dataShards()) + " needed");
  }

  std::vector<std::byte> compressed =
      coder->decode(available, meta.compressedSizeBytes);
  std::vector<std::byte> raw;
  try {
    raw = compressor_.decompress(compressed, meta.sizeBytes);
  } catch (const std::runtime_error &e) {
    ThrowVaultException(ErrorCode::CorruptedChunk,
                        "chunk " + meta.digest + " failed to decompress: " +
                            e.what());
  }
  if (ChunkHasher::hash(raw) != meta.digest) {
    ThrowVaultException(ErrorCode::CorruptedChunk,
                        "chunk " + meta.digest +
                            " does not match its digest after decoding");
  }
  return raw;
}

size_t ChunkStore::countAvailableShards(const ChunkMeta &meta) const {
  auto coder = coderFor(meta);
  return fetchShards(meta, coder->shardSize(meta.compressedSizeBytes),
                     coder->totalShards())
      .size();
}

size_t ChunkStore::repairChunk(const ChunkMeta &meta) const {
  auto coder = coderFor(meta);
  ShardMap available =
      fetchShards(meta, coder->shardSize(meta.compressedSizeBytes),
                  coder->totalShards());
  if (available.size() == meta.shardLocations.size())
    return 0;

  std::vector<Shard> shards =
      coder->reconstructAll(available, meta.compressedSizeBytes);
  size_t rewritten = 0;
  for (const auto &loc : meta.shardLocations) {
    if (available.count(loc.shardIndex))
      continue;
    ShardBackend *backend = backendById(loc.backendId);
    if (!backend || loc.shardIndex >= shards.size())
      continue;
    backend->write(
        shardRelativePath(meta.digest, loc.shardIndex, digestPrefixLength_),
        shards[loc.shardIndex]);
    ++rewritten;
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Repaired " + std::to_string(rewritten) +
                                " shards of chunk " + meta.digest);
  return rewritten;
}

size_t ChunkStore::removeChunk(const ChunkMeta &meta) const {
  size_t removed = 0;
  for (const auto &loc : meta.shardLocations) {
    ShardBackend *backend = backendById(loc.backendId);
    if (backend && backend->remove(loc.storagePath))
      ++removed;
  }
  return removed;
}

} // namespace chunkvault
