#include "cluster/BackendHealthCache.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <algorithm>

namespace chunkvault {

BackendHealthCache::BackendHealthCache(std::size_t failureTh,
                                       std::size_t successTh,
                                       std::chrono::seconds cooldown)
    : failureThreshold_(failureTh),
      successThreshold_(successTh),
      cooldown_(cooldown) {}

static int rank(BackendState s) {
    switch (s) {
        case BackendState::ALIVE: return 0;
        case BackendState::SUSPECT: return 1;
        case BackendState::DEAD: return 2;
    }
    return 2;
}

void BackendHealthCache::publish(const BackendID &id, BackendState s) const {
    MetricsRegistry::instance().setGauge("chunkvault_backend_health", rank(s),
                                         {{"backend", id}});
}

BackendState BackendHealthCache::state(const BackendID &id) const {
    std::lock_guard<std::mutex> lg(mutex_);
    auto it = map_.find(id);
    return it == map_.end() ? BackendState::ALIVE : it->second.state;
}

void BackendHealthCache::recordSuccess(const BackendID &id) {
    std::lock_guard<std::mutex> lg(mutex_);
    auto &e = map_[id];
    auto now = SteadyClock::now();
    e.failures = 0;
    ++e.successes;
    if (e.state == BackendState::ALIVE) {
        if (e.successes > successThreshold_) e.successes = successThreshold_;
        return;
    }
    if (e.state == BackendState::DEAD && (now - e.lastFailure) < cooldown_)
        return;
    if (e.state == BackendState::SUSPECT || e.successes >= successThreshold_) {
        e.state = BackendState::ALIVE;
        e.successes = 0;
        e.lastChange = now;
        Logger::getInstance().log(LogLevel::INFO, "Storage backend " + id + " is healthy again");
        publish(id, e.state);
    }
}

void BackendHealthCache::recordFailure(const BackendID &id) {
    std::lock_guard<std::mutex> lg(mutex_);
    auto &e = map_[id];
    auto now = SteadyClock::now();
    e.successes = 0;
    e.lastFailure = now;
    if (e.state == BackendState::DEAD) {
        return;
    }
    ++e.failures;
    if (e.failures >= failureThreshold_) {
        e.state = BackendState::DEAD;
        e.failures = 0;
        Logger::getInstance().log(LogLevel::WARN, "Storage backend " + id + " marked DEAD");
        MetricsRegistry::instance().incrementCounter("chunkvault_backend_failures_total", 1.0,
                                                     {{"backend", id}});
    } else {
        e.state = BackendState::SUSPECT;
    }
    e.lastChange = now;
    publish(id, e.state);
}

std::vector<BackendID> BackendHealthCache::orderByHealth(const std::vector<BackendID> &ids) const {
    std::lock_guard<std::mutex> lg(mutex_);
    auto rankOf = [this](const BackendID &id) {
        auto it = map_.find(id);
        return it == map_.end() ? 0 : rank(it->second.state);
    };
    std::vector<BackendID> ordered = ids;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [&](const BackendID &a, const BackendID &b) { return rankOf(a) < rankOf(b); });
    return ordered;
}

std::unordered_map<BackendID, BackendHealthCache::StateInfo> BackendHealthCache::snapshot() const {
    std::lock_guard<std::mutex> lg(mutex_);
    std::unordered_map<BackendID, StateInfo> res;
    for (const auto &kv : map_) {
        res.emplace(kv.first, StateInfo{kv.second.state, kv.second.lastChange});
    }
    return res;
}

} // namespace chunkvault
