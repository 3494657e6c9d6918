/**
 * @file repair_scheduler.h
 * @brief Periodic trigger for the connection pool repair pass
 *
 * Pools never start timers on their own; they receive a scheduler from
 * PoolDependencies. Production code uses PeriodicRepairScheduler, tests
 * inject a scheduler they can tick by hand.
 */

#ifndef RPCPOOL_IPC_REPAIR_SCHEDULER_H
#define RPCPOOL_IPC_REPAIR_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace rpcpool {
namespace ipc {

/**
 * @brief Scheduler interface for one pool's repair task
 */
class IRepairScheduler {
public:
    using Task = std::function<void()>;

    virtual ~IRepairScheduler() = default;

    /**
     * @brief Run @p task every @p interval until stop()
     * @return false if already running
     */
    virtual bool start(std::chrono::milliseconds interval, Task task) = 0;

    /**
     * @brief Stop ticking
     *
     * On return no tick is executing and none will execute afterwards.
     * Must not be called from inside the task.
     */
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;
};

using RepairSchedulerPtr = std::unique_ptr<IRepairScheduler>;
using RepairSchedulerFactory = std::function<RepairSchedulerPtr()>;

/**
 * @brief Thread-backed scheduler
 *
 * One worker thread waits on a condition variable with the interval as
 * timeout and runs the task on each expiry. Ticks never overlap.
 */
class PeriodicRepairScheduler : public IRepairScheduler {
public:
    PeriodicRepairScheduler();
    ~PeriodicRepairScheduler() override;

    PeriodicRepairScheduler(const PeriodicRepairScheduler&) = delete;
    PeriodicRepairScheduler& operator=(const PeriodicRepairScheduler&) = delete;

    bool start(std::chrono::milliseconds interval, Task task) override;
    void stop() override;
    bool isRunning() const override;

    /**
     * @brief Number of ticks executed so far
     */
    uint64_t tickCount() const { return tick_count_.load(); }

private:
    void loop();

    std::chrono::milliseconds interval_{0};
    Task task_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_;
    bool should_stop_;
    std::atomic<uint64_t> tick_count_;
    std::thread worker_;
};

/**
 * @brief Factory producing PeriodicRepairScheduler instances
 */
RepairSchedulerFactory periodicRepairSchedulerFactory();

} // namespace ipc
} // namespace rpcpool

#endif // RPCPOOL_IPC_REPAIR_SCHEDULER_H
