#pragma once
#include "ingest/digest_claims.hpp"
#include "metadata/metadata_index.hpp"
#include "storage/chunk_store.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace chunkvault {

struct GCStats {
    size_t totalChunks{0};
    size_t reclaimableChunks{0};
    uint64_t reclaimableBytes{0};
    size_t freedChunks{0};
    uint64_t freedBytes{0};
    size_t shardFilesRemoved{0};
};

/**
 * @brief Deletes chunks that no manifest references.
 *
 * Manifests of every state count as references, so chunks of an upload in
 * progress survive. Chunks created or accessed within the grace period are
 * also kept. Each deletion holds the digest's claim, shared with the
 * IngestPipeline, and re-checks the row and its references under it, so a
 * dedup hit racing the collector either sees the chunk gone and stores it
 * again or has already recorded its reference.
 */
class ChunkGarbageCollector {
public:
    ChunkGarbageCollector(MetadataIndex& index, const ChunkStore& store,
                          std::chrono::seconds gracePeriod = std::chrono::seconds(3600),
                          std::shared_ptr<DigestClaims> claims = nullptr)
        : index_(index), store_(store), gracePeriod_(gracePeriod),
          claims_(claims ? std::move(claims) : std::make_shared<DigestClaims>()) {}

    /**
     * @brief Remove unreferenced chunks.
     * @param dryRun Only report what would be freed.
     */
    GCStats collect(bool dryRun = false,
                    SystemClock::time_point now = SystemClock::now());

private:
    MetadataIndex& index_;
    const ChunkStore& store_;
    std::chrono::seconds gracePeriod_;
    std::shared_ptr<DigestClaims> claims_;
};

} // namespace chunkvault
