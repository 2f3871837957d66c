#ifndef CHUNKVAULT_RECONSTRUCTION_ENGINE_HPP
#define CHUNKVAULT_RECONSTRUCTION_ENGINE_HPP

#include "metadata/metadata_index.hpp"
#include "storage/chunk_store.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace chunkvault {

class ReconstructionEngine;

/**
 * @brief Lazy in-order reader over a committed object version.
 *
 * Each call to next() resolves, fetches and verifies exactly one chunk.
 * Failures are thrown from the next() call of the offending entry, so the
 * chunks before it have already been delivered. A stream can be reopened
 * at any position via ReconstructionEngine::open(..., startIndex).
 */
class ObjectStream {
public:
  /**
   * @brief Produce the next chunk into @p out.
   * @return false at end of object.
   * @throws VaultException(InsufficientShards, CorruptedChunk)
   */
  bool next(std::vector<std::byte> &out);

  /** Index of the chunk the next call to next() returns. */
  uint64_t position() const { return position_; }
  uint64_t chunkCount() const { return manifest_.entries.size(); }
  const ObjectManifest &manifest() const { return manifest_; }

private:
  friend class ReconstructionEngine;
  ObjectStream(const ReconstructionEngine &engine, ObjectManifest manifest,
               uint64_t start)
      : engine_(&engine), manifest_(std::move(manifest)), position_(start) {}

  const ReconstructionEngine *engine_;
  ObjectManifest manifest_;
  uint64_t position_;
};

/**
 * @brief Rebuilds committed objects from their manifests.
 */
class ReconstructionEngine {
public:
  ReconstructionEngine(MetadataIndex &index, const ChunkStore &store)
      : index_(index), store_(store) {}

  /**
   * @brief Open a stream at chunk @p startIndex.
   * @throws VaultException(ObjectNotFound) if the version does not exist or
   *         is not committed.
   * @throws VaultException(InvalidChunkIndex) if @p startIndex is past the
   *         end.
   */
  ObjectStream open(const std::string &objectId, uint64_t version,
                    uint64_t startIndex = 0) const;

  /** Open the newest committed version. */
  ObjectStream openLatest(const std::string &objectId) const;

  /** Fetch and verify the chunk stored under @p digest. */
  std::vector<std::byte> readChunk(const std::string &digest) const;

  /** Stream the whole version into @p out. Returns the bytes written. */
  uint64_t readTo(const std::string &objectId, uint64_t version,
                  std::ostream &out) const;

  std::vector<std::byte> readAll(const std::string &objectId,
                                 uint64_t version) const;

private:
  MetadataIndex &index_;
  const ChunkStore &store_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_RECONSTRUCTION_ENGINE_HPP
