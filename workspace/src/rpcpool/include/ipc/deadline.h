/**
 * @file deadline.h
 * @brief Deadline and cancellation signal for bounded waits
 */

#ifndef RPCPOOL_IPC_DEADLINE_H
#define RPCPOOL_IPC_DEADLINE_H

#include <atomic>
#include <chrono>
#include <memory>

namespace rpcpool {
namespace ipc {

/**
 * @brief Point in time after which a wait gives up, plus a cancel flag
 *
 * Copies share the cancellation flag, so a caller can hand a copy to
 * ConnectionPool::getHealthy() and cancel it from another thread.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(Clock::time_point when)
        : when_(when)
        , cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Deadline @p timeout from now
     *
     * Non-positive timeouts are already expired; timeouts beyond the
     * clock's range saturate to never().
     */
    static Deadline after(std::chrono::milliseconds timeout) {
        const auto now = Clock::now();
        if (timeout.count() <= 0) {
            return Deadline(now);
        }
        const auto headroom =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
        if (timeout >= headroom) {
            return never();
        }
        return Deadline(now + timeout);
    }

    static Deadline never() {
        return Deadline(Clock::time_point::max());
    }

    Clock::time_point when() const { return when_; }

    void cancel() { cancelled_->store(true); }

    bool isCancelled() const { return cancelled_->load(); }

    /**
     * @brief True once the time point has passed or the wait was cancelled
     */
    bool expired() const {
        return isCancelled() || Clock::now() >= when_;
    }

    /**
     * @brief Time left before the deadline, zero when expired
     */
    std::chrono::milliseconds remaining() const {
        if (expired()) {
            return std::chrono::milliseconds(0);
        }
        if (when_ == Clock::time_point::max()) {
            return std::chrono::milliseconds::max();
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(when_ - Clock::now());
    }

private:
    Clock::time_point when_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace ipc
} // namespace rpcpool

#endif // RPCPOOL_IPC_DEADLINE_H
