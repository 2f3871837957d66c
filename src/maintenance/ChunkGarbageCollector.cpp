#include "maintenance/ChunkGarbageCollector.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <algorithm>

namespace chunkvault {

GCStats ChunkGarbageCollector::collect(bool dryRun, SystemClock::time_point now) {
    GCStats stats;
    std::vector<ChunkMeta> chunks = index_.listChunks();
    // Taken after the listing so rows appended meanwhile are seen.
    std::unordered_set<std::string> referenced = index_.referencedDigests();
    stats.totalChunks = chunks.size();

    for (const auto& meta : chunks) {
        if (referenced.count(meta.digest)) continue;
        auto lastUse = std::max(meta.createdAt, meta.lastAccessedAt);
        if (now - lastUse < gracePeriod_) continue;

        stats.reclaimableChunks++;
        stats.reclaimableBytes += meta.compressedSizeBytes;
        if (dryRun) continue;

        DigestClaims::Claim claim(*claims_, meta.digest);
        auto current = index_.lookup(meta.digest);
        if (!current || current->lastAccessedAt != meta.lastAccessedAt ||
            index_.isReferenced(meta.digest)) {
            Logger::getInstance().log(LogLevel::DEBUG,
                "GC keeps " + meta.digest + ": reused since listing");
            continue;
        }
        if (!index_.removeChunk(meta.digest)) continue;
        stats.shardFilesRemoved += store_.removeChunk(*current);
        stats.freedChunks++;
        stats.freedBytes += meta.compressedSizeBytes;
    }

    MetricsRegistry::instance().incrementCounter("chunkvault_gc_freed_chunks",
                                                 static_cast<double>(stats.freedChunks));
    Logger::getInstance().log(LogLevel::INFO,
        std::string(dryRun ? "GC dry run: " : "GC: ") +
        std::to_string(stats.reclaimableChunks) + " of " +
        std::to_string(stats.totalChunks) + " chunks reclaimable, " +
        std::to_string(stats.freedChunks) + " freed");
    return stats;
}

} // namespace chunkvault
