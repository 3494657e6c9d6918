/**
 * @file repair_scheduler.cpp
 * @brief Thread-backed periodic scheduler for pool repair passes
 */

#include "ipc/repair_scheduler.h"
#include "utils/log.h"
#include <exception>

namespace rpcpool {
namespace ipc {

PeriodicRepairScheduler::PeriodicRepairScheduler()
    : running_(false)
    , should_stop_(false)
    , tick_count_(0) {
}

PeriodicRepairScheduler::~PeriodicRepairScheduler() {
    stop();
}

bool PeriodicRepairScheduler::start(std::chrono::milliseconds interval, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        LOGW_FMT("PeriodicRepairScheduler::start: already running");
        return false;
    }
    if (interval.count() <= 0 || !task) {
        LOGE_FMT("PeriodicRepairScheduler::start: invalid interval or empty task");
        return false;
    }

    // A previous run may have left a joined-but-not-reset thread object
    if (worker_.joinable()) {
        worker_.join();
    }

    interval_ = interval;
    task_ = std::move(task);
    should_stop_ = false;
    running_ = true;
    worker_ = std::thread(&PeriodicRepairScheduler::loop, this);

    LOGD_FMT("PeriodicRepairScheduler started, interval=" << interval_.count() << "ms");
    return true;
}

void PeriodicRepairScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        should_stop_ = true;
        running_ = false;
    }

    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    LOGD_FMT("PeriodicRepairScheduler stopped after " << tick_count_.load() << " ticks");
}

bool PeriodicRepairScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PeriodicRepairScheduler::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!should_stop_) {
        if (cv_.wait_for(lock, interval_, [this] { return should_stop_; })) {
            break;
        }

        // Run the tick unlocked so stop() can flag us while it executes
        lock.unlock();
        try {
            task_();
        } catch (const std::exception& e) {
            LOGE_FMT("Repair task threw: " << e.what());
        }
        tick_count_++;
        lock.lock();
    }
}

RepairSchedulerFactory periodicRepairSchedulerFactory() {
    return [] { return std::make_unique<PeriodicRepairScheduler>(); };
}

} // namespace ipc
} // namespace rpcpool
