#ifndef CHUNKVAULT_METADATA_INDEX_HPP
#define CHUNKVAULT_METADATA_INDEX_HPP

#include "metadata/chunk_meta.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace chunkvault {

enum class InsertOutcome { Inserted, AlreadyExists };
enum class AppendOutcome { Appended, AlreadyPresent };

/**
 * @brief Durable digest -> chunk mapping plus object manifests.
 *
 * This is the single source of truth consulted before any chunk write or
 * read. Implementations must provide read-your-writes consistency and an
 * atomic insert-unless-present on the chunk table. Transient backend
 * failures surface as VaultException(IndexUnavailable).
 */
class MetadataIndex {
public:
  virtual ~MetadataIndex() = default;

  // Chunk table

  virtual std::optional<ChunkMeta> lookup(const std::string &digest) const = 0;

  /**
   * @brief Insert @p meta unless a row with the same digest exists.
   *
   * Exactly one of several concurrent callers sees Inserted; the others see
   * AlreadyExists and the stored row is left untouched.
   */
  virtual InsertOutcome insertIfAbsent(const ChunkMeta &meta) = 0;

  /** Returns false if the digest is unknown. */
  virtual bool updateTier(const std::string &digest, StorageTier tier) = 0;
  /** Record a read of @p digest at @p when. Returns false if unknown. */
  virtual bool touch(const std::string &digest,
                     SystemClock::time_point when) = 0;
  /** Delete a chunk row. Returns false if it did not exist. */
  virtual bool removeChunk(const std::string &digest) = 0;
  virtual std::vector<ChunkMeta> listChunks() const = 0;
  virtual size_t chunkCount() const = 0;

  // Manifests

  /**
   * @brief Open an empty manifest owned by upload @p uploadId.
   *
   * A stale uncommitted manifest of the same version is replaced.
   * @throws VaultException(ManifestCommitted) if the version is committed.
   */
  virtual void openManifest(const std::string &objectId, uint64_t version,
                            const std::string &uploadId) = 0;

  /**
   * @brief Record that @p digest is chunk @p chunkIndex of the version.
   *
   * Reopens an Invalid manifest with its entries cleared. Re-sending the
   * same digest at the same index is AlreadyPresent.
   * @throws VaultException(ObjectNotFound) unless @p uploadId opened the
   *         manifest and it has not been discarded since.
   * @throws VaultException(DuplicateChunkIndex) if a different digest is
   *         already recorded at @p chunkIndex.
   * @throws VaultException(ManifestCommitted) if the version is committed.
   */
  virtual AppendOutcome appendManifestEntry(const std::string &objectId,
                                            uint64_t version,
                                            const std::string &uploadId,
                                            uint64_t chunkIndex,
                                            const std::string &digest) = 0;

  /** Digest recorded at @p chunkIndex, if any. */
  virtual std::optional<std::string>
  manifestEntry(const std::string &objectId, uint64_t version,
                uint64_t chunkIndex) const = 0;

  /**
   * @brief Manifest of one object version in chunkIndex order.
   * @throws VaultException(ObjectNotFound) if no such manifest exists.
   */
  virtual ObjectManifest getManifest(const std::string &objectId,
                                     uint64_t version) const = 0;

  /**
   * @brief Atomically mark the manifest Committed.
   *
   * Idempotent on an already committed manifest with the same chunk count.
   * @throws VaultException(IncompleteUpload) unless the entries are exactly
   *         0..totalChunks-1.
   * @throws VaultException(ObjectNotFound)
   */
  virtual void commitManifest(const std::string &objectId, uint64_t version,
                              uint64_t totalChunks) = 0;

  /** Mark an uncommitted manifest Invalid. No-op on committed ones. */
  virtual void invalidateManifest(const std::string &objectId,
                                  uint64_t version) = 0;

  /** Drop an uncommitted manifest entirely. No-op on committed ones. */
  virtual void discardManifest(const std::string &objectId,
                               uint64_t version) = 0;

  virtual std::optional<uint64_t>
  latestCommittedVersion(const std::string &objectId) const = 0;

  /** Digests referenced by any manifest, committed or not. */
  virtual std::unordered_set<std::string> referencedDigests() const = 0;
  /** Whether any manifest, committed or not, references @p digest. */
  virtual bool isReferenced(const std::string &digest) const = 0;
};

/**
 * @brief MetadataIndex kept in memory, with YAML snapshots for persistence.
 *
 * The chunk table is split into stripes keyed by digest hash, so writers of
 * unrelated digests never contend. Each manifest has its own mutex; the
 * manifest directory lock is held only to find, open or drop a manifest.
 */
class InMemoryMetadataIndex : public MetadataIndex {
public:
  InMemoryMetadataIndex() = default;

  std::optional<ChunkMeta> lookup(const std::string &digest) const override;
  InsertOutcome insertIfAbsent(const ChunkMeta &meta) override;
  bool updateTier(const std::string &digest, StorageTier tier) override;
  bool touch(const std::string &digest, SystemClock::time_point when) override;
  bool removeChunk(const std::string &digest) override;
  std::vector<ChunkMeta> listChunks() const override;
  size_t chunkCount() const override;

  void openManifest(const std::string &objectId, uint64_t version,
                    const std::string &uploadId) override;
  AppendOutcome appendManifestEntry(const std::string &objectId,
                                    uint64_t version,
                                    const std::string &uploadId,
                                    uint64_t chunkIndex,
                                    const std::string &digest) override;
  std::optional<std::string> manifestEntry(const std::string &objectId,
                                           uint64_t version,
                                           uint64_t chunkIndex) const override;
  ObjectManifest getManifest(const std::string &objectId,
                             uint64_t version) const override;
  void commitManifest(const std::string &objectId, uint64_t version,
                      uint64_t totalChunks) override;
  void invalidateManifest(const std::string &objectId,
                          uint64_t version) override;
  void discardManifest(const std::string &objectId, uint64_t version) override;
  std::optional<uint64_t>
  latestCommittedVersion(const std::string &objectId) const override;
  std::unordered_set<std::string> referencedDigests() const override;
  bool isReferenced(const std::string &digest) const override;

  /**
   * @brief Write every chunk row and manifest to @p path.
   *
   * The file is written beside @p path and renamed into place.
   * @return false if the file could not be written.
   */
  bool saveSnapshot(const std::string &path) const;

  /**
   * @brief Replace the current contents with a snapshot.
   * @return false if @p path is missing or malformed; the index is then
   *         left unchanged.
   */
  bool loadSnapshot(const std::string &path);

private:
  static constexpr size_t kStripeCount = 64;

  struct ChunkStripe {
    mutable std::mutex mutex;
    std::unordered_map<std::string, ChunkMeta> rows;
  };

  struct ManifestRecord {
    mutable std::mutex mutex;
    std::string uploadId; ///< Upload that opened the manifest
    ManifestState state = ManifestState::Open;
    std::map<uint64_t, std::string> entries;
  };

  using ManifestKey = std::pair<std::string, uint64_t>;

  ChunkStripe &stripeFor(const std::string &digest) const;
  std::shared_ptr<ManifestRecord> findManifest(const std::string &objectId,
                                               uint64_t version) const;

  mutable std::array<ChunkStripe, kStripeCount> stripes_;

  mutable std::shared_mutex manifestsMutex_;
  std::map<ManifestKey, std::shared_ptr<ManifestRecord>> manifests_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_METADATA_INDEX_HPP
