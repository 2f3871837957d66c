#include "maintenance/TieringSweeper.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace chunkvault {

StorageTier TieringSweeper::classify(SystemClock::time_point lastAccess,
                                     SystemClock::time_point now) const {
    auto idle = now - lastAccess;
    if (idle < warmAfter_) return StorageTier::Hot;
    if (idle < coldAfter_) return StorageTier::Warm;
    return StorageTier::Cold;
}

TieringStats TieringSweeper::runOnce(SystemClock::time_point now) {
    TieringStats stats;
    for (const auto& meta : index_.listChunks()) {
        ++stats.scanned;
        StorageTier tier = classify(meta.lastAccessedAt, now);
        if (tier != meta.tier && index_.updateTier(meta.digest, tier)) {
            ++stats.changed;
        }
        switch (tier) {
        case StorageTier::Hot: ++stats.hot; break;
        case StorageTier::Warm: ++stats.warm; break;
        case StorageTier::Cold: ++stats.cold; break;
        }
    }

    auto& metrics = MetricsRegistry::instance();
    metrics.setGauge("chunkvault_tier_chunks", static_cast<double>(stats.hot), {{"tier", "hot"}});
    metrics.setGauge("chunkvault_tier_chunks", static_cast<double>(stats.warm), {{"tier", "warm"}});
    metrics.setGauge("chunkvault_tier_chunks", static_cast<double>(stats.cold), {{"tier", "cold"}});
    metrics.incrementCounter("chunkvault_tier_changes", static_cast<double>(stats.changed));

    Logger::getInstance().log(LogLevel::DEBUG,
        "Tiering sweep: " + std::to_string(stats.scanned) + " chunks, " +
        std::to_string(stats.changed) + " reclassified");
    return stats;
}

} // namespace chunkvault
