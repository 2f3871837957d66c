#pragma once
#include "maintenance/PeriodicWorker.h"
#include "metadata/metadata_index.hpp"
#include <chrono>
#include <cstddef>

namespace chunkvault {

struct TieringStats {
    size_t scanned{0};
    size_t changed{0};
    size_t hot{0};
    size_t warm{0};
    size_t cold{0};
};

/**
 * @brief Reclassifies chunk tiers by time since last access.
 *
 * Chunks read within warmAfter are hot, within coldAfter warm, cold
 * otherwise. Tiers are advisory and never change what a read returns.
 */
class TieringSweeper : public PeriodicWorker {
public:
    TieringSweeper(MetadataIndex& index,
                   std::chrono::seconds warmAfter,
                   std::chrono::seconds coldAfter,
                   std::chrono::seconds tick = std::chrono::seconds(300))
        : PeriodicWorker("TieringSweeper", tick), index_(index),
          warmAfter_(warmAfter), coldAfter_(coldAfter) {}
    ~TieringSweeper() override { stop(); }

    /** Perform one sweep as of @p now. */
    TieringStats runOnce(SystemClock::time_point now = SystemClock::now());

    StorageTier classify(SystemClock::time_point lastAccess,
                         SystemClock::time_point now) const;

protected:
    void runPass() override { runOnce(); }

private:
    MetadataIndex& index_;
    std::chrono::seconds warmAfter_;
    std::chrono::seconds coldAfter_;
};

} // namespace chunkvault
