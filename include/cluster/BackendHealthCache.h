#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file BackendHealthCache.h
 * @brief Thread-safe liveness tracker for storage backends (mount points).
 */

namespace chunkvault {

using BackendID = std::string;
using SteadyClock = std::chrono::steady_clock;

enum class BackendState { ALIVE, SUSPECT, DEAD };

/**
 * @brief Tracks shard I/O successes and failures for each backend.
 *
 * A backend becomes SUSPECT after its first failure and DEAD after
 * failureThreshold consecutive failures. A SUSPECT backend recovers on its
 * next success. A DEAD backend needs
 * successThreshold successes, and the cooldown to have elapsed since its last
 * failure, before it is ALIVE again. Unknown backends are ALIVE.
 */
class BackendHealthCache {
public:
    struct StateInfo { BackendState state; SteadyClock::time_point lastChange; };

    BackendHealthCache(std::size_t failureThreshold = 2,
                       std::size_t successThreshold = 3,
                       std::chrono::seconds cooldown = std::chrono::seconds(15));

    BackendState state(const BackendID &id) const;
    void recordSuccess(const BackendID &id);
    void recordFailure(const BackendID &id);

    /**
     * @brief Stable-sort @p ids so ALIVE backends come first, then SUSPECT,
     * then DEAD.
     */
    std::vector<BackendID> orderByHealth(const std::vector<BackendID> &ids) const;

    std::unordered_map<BackendID, StateInfo> snapshot() const;

private:
    struct Entry {
        BackendState state{BackendState::ALIVE};
        std::size_t failures{0};
        std::size_t successes{0};
        SteadyClock::time_point lastChange{SteadyClock::now()};
        SteadyClock::time_point lastFailure{SteadyClock::now()};
    };

    void publish(const BackendID &id, BackendState s) const;

    mutable std::mutex mutex_;
    std::unordered_map<BackendID, Entry> map_;
    const std::size_t failureThreshold_;
    const std::size_t successThreshold_;
    const std::chrono::seconds cooldown_;
};

} // namespace chunkvault
