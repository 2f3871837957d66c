#ifndef CHUNKVAULT_CHUNK_STORE_HPP
#define CHUNKVAULT_CHUNK_STORE_HPP

#include "cluster/BackendHealthCache.h"
#include "metadata/chunk_meta.hpp"
#include "storage/erasure_coder.hpp"
#include "storage/shard_backend.hpp"
#include "utilities/compressor.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkvault {

/**
 * @brief Content-addressed shard storage for chunks.
 *
 * A chunk is compressed, split into k data + m parity shards and each shard
 * is written to its own backend, round-robin from an offset derived from the
 * digest. Shard files live at
 * "{backend}/{digest[0:prefix]}/{digest}.{shardIndex}.shard".
 *
 * The store itself holds no index; callers persist the returned ChunkMeta.
 * Writing the same digest twice rewrites identical files, so concurrent
 * ingestors of the same content are harmless.
 */
class ChunkStore {
public:
  ChunkStore(std::vector<std::shared_ptr<ShardBackend>> backends,
             std::shared_ptr<const ErasureCoder> coder, Compressor compressor,
             size_t digestPrefixLength = 2,
             std::shared_ptr<BackendHealthCache> health = nullptr);

  /**
   * @brief Compress, encode and durably write @p raw.
   * @param digest Hex digest of @p raw, computed by the caller.
   * @return Metadata describing where every shard landed.
   * @throws VaultException(StorageWriteFailure)
   */
  ChunkMeta putChunk(const std::string &digest,
                     const std::vector<std::byte> &raw) const;

  /**
   * @brief Reconstruct the raw bytes of a stored chunk.
   *
   * Shards on healthy backends are read first and reading stops as soon as
   * k valid shards are in hand. A shard is valid when it has the expected
   * size and matches its recorded checksum, so a silently corrupted shard
   * is skipped in favour of the next one.
   * @throws VaultException(InsufficientShards) if fewer than k shards can be
   *         read.
   * @throws VaultException(CorruptedChunk) if the decoded bytes do not
   *         decompress or do not hash to meta.digest.
   */
  std::vector<std::byte> getChunk(const ChunkMeta &meta) const;

  /** Number of shards currently readable and passing their checksum. */
  size_t countAvailableShards(const ChunkMeta &meta) const;

  /**
   * @brief Rewrite lost or corrupted shards from the surviving ones.
   * @return Number of shards rewritten.
   * @throws VaultException(InsufficientShards)
   */
  size_t repairChunk(const ChunkMeta &meta) const;

  /** Delete every shard of @p meta. Returns the number of files removed. */
  size_t removeChunk(const ChunkMeta &meta) const;

  static std::string shardRelativePath(const std::string &digest,
                                       size_t shardIndex,
                                       size_t prefixLength);

  const ErasureCoder &coder() const { return *coder_; }
  const Compressor &compressor() const { return compressor_; }
  size_t backendCount() const { return backends_.size(); }

private:
  std::shared_ptr<const ErasureCoder> coderFor(const ChunkMeta &meta) const;
  ShardBackend *backendById(const std::string &id) const;
  size_t placementOffset(const std::string &digest) const;
  /** Locations of @p meta, healthiest backends first. */
  std::vector<ShardLocation> orderedLocations(const ChunkMeta &meta) const;
  /** Read up to @p wanted valid shards of @p meta. */
  ShardMap fetchShards(const ChunkMeta &meta, size_t shardLen,
                       size_t wanted) const;

  std::vector<std::shared_ptr<ShardBackend>> backends_;
  std::unordered_map<std::string, ShardBackend *> backendIndex_;
  std::shared_ptr<const ErasureCoder> coder_;
  Compressor compressor_;
  size_t digestPrefixLength_;
  std::shared_ptr<BackendHealthCache> health_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNK_STORE_HPP
