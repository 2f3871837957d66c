#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace chunkvault {

/**
 * @brief Background thread that runs a pass every tick until stopped.
 *
 * Subclasses implement runPass() and must call stop() from their own
 * destructor so the thread never sees a half-destroyed object.
 */
class PeriodicWorker {
public:
    PeriodicWorker(std::string name, std::chrono::seconds tick)
        : name_(std::move(name)), tick_(tick) {}
    virtual ~PeriodicWorker();

    PeriodicWorker(const PeriodicWorker&) = delete;
    PeriodicWorker& operator=(const PeriodicWorker&) = delete;

    /** Start the background thread. No-op if already running. */
    void start();
    /** Wake the thread and join it. */
    void stop();
    bool running() const { return running_; }

protected:
    virtual void runPass() = 0;

private:
    void threadFunc();

    std::string name_;
    std::chrono::seconds tick_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
};

} // namespace chunkvault
