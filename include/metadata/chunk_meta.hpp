#ifndef CHUNKVAULT_CHUNK_META_HPP
#define CHUNKVAULT_CHUNK_META_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkvault {

using SystemClock = std::chrono::system_clock;

/// Storage class reflecting access recency. Never affects correctness.
enum class StorageTier { Hot, Warm, Cold };

const char *tierName(StorageTier tier);
/** @throws std::invalid_argument for unknown names. */
StorageTier parseTier(const std::string &name);

struct ShardLocation {
  size_t shardIndex = 0;
  std::string storagePath;
  std::string backendId; ///< ShardBackend::id() holding the file
  std::string checksum;  ///< Hex SHA-256 of the shard, empty if unknown
};

/**
 * @brief Durable row describing one stored chunk.
 *
 * Keyed by digest. Everything except tier and lastAccessedAt is fixed when
 * the row is first inserted.
 */
struct ChunkMeta {
  std::string digest;
  uint64_t sizeBytes = 0;
  uint64_t compressedSizeBytes = 0;
  size_t dataShards = 0;
  size_t parityShards = 0;
  std::vector<ShardLocation> shardLocations; ///< Ordered by shardIndex
  StorageTier tier = StorageTier::Hot;
  SystemClock::time_point createdAt{};
  SystemClock::time_point lastAccessedAt{};
};

enum class ManifestState { Open, Committed, Invalid };

const char *manifestStateName(ManifestState state);
/** @throws std::invalid_argument for unknown names. */
ManifestState parseManifestState(const std::string &name);

struct ManifestEntry {
  uint64_t chunkIndex = 0;
  std::string digest;
};

/**
 * @brief Snapshot of one object version's chunk list.
 *
 * Entries are sorted by chunkIndex. Only a Committed manifest is guaranteed
 * to be contiguous from 0 to N-1.
 */
struct ObjectManifest {
  std::string objectId;
  uint64_t version = 0;
  ManifestState state = ManifestState::Open;
  std::vector<ManifestEntry> entries;

  std::vector<std::string> digests() const {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto &e : entries)
      out.push_back(e.digest);
    return out;
  }
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_META_HPP
