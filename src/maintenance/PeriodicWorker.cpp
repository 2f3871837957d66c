#include "maintenance/PeriodicWorker.h"
#include "utilities/logger.h"
#include <exception>

namespace chunkvault {

PeriodicWorker::~PeriodicWorker() { stop(); }

void PeriodicWorker::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&PeriodicWorker::threadFunc, this);
    Logger::getInstance().log(LogLevel::INFO, name_ + " started");
}

void PeriodicWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    Logger::getInstance().log(LogLevel::INFO, name_ + " stopped");
}

void PeriodicWorker::threadFunc() {
    while (running_) {
        try {
            runPass();
        } catch (const std::exception& e) {
            Logger::getInstance().log(LogLevel::ERROR, name_ + " pass failed: " + e.what());
        }
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, tick_, [this] { return !running_; });
    }
}

} // namespace chunkvault
