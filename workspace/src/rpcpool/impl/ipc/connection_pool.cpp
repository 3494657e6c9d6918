/**
 * @file connection_pool.cpp
 * @brief Implementation of the fixed-size RPC connection pool
 */

#include "ipc/connection_pool.h"
#include "ipc/grpc_connection.h"
#include "utils/log.h"
#include <grpc/grpc.h>
#include <algorithm>
#include <limits>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <utility>

namespace rpcpool {
namespace ipc {

namespace {

int toIntMillis(std::chrono::milliseconds value) {
    auto count = value.count();
    if (count < 0) {
        return 0;
    }
    if (count > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(count);
}

/**
 * @brief Replacement prepared for one unhealthy slot
 */
struct SlotRepair {
    size_t index;
    ConnectionPtr old_conn;
    ConnectionPtr new_conn;
};

} // namespace

ChannelOptions buildChannelOptions(const PoolConfig& config) {
    ChannelOptions options;
    options.use_tls = config.use_tls;
    options.tls_root_certs_path = config.tls_root_certs_path;

    options.args.push_back({GRPC_ARG_KEEPALIVE_TIME_MS, toIntMillis(config.keepalive_time)});
    options.args.push_back({GRPC_ARG_KEEPALIVE_TIMEOUT_MS, toIntMillis(config.keepalive_timeout)});
    options.args.push_back({GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1});
    options.args.push_back({GRPC_ARG_CLIENT_IDLE_TIMEOUT_MS, toIntMillis(config.max_connection_idle)});
    options.args.push_back({GRPC_ARG_MAX_CONNECTION_AGE_MS, toIntMillis(config.max_connection_age)});
    options.args.push_back({GRPC_ARG_MAX_CONNECTION_AGE_GRACE_MS,
                            toIntMillis(config.max_connection_age_grace)});
    options.args.push_back({GRPC_ARG_MAX_RECEIVE_MESSAGE_LENGTH, config.max_message_size});
    options.args.push_back({GRPC_ARG_MAX_SEND_MESSAGE_LENGTH, config.max_message_size});

    // One subchannel per channel; channels with equal target and args
    // would otherwise share a single transport
    options.args.push_back({GRPC_ARG_USE_LOCAL_SUBCHANNEL_POOL, 1});

    if (!config.tls_server_name.empty()) {
        options.args.push_back({GRPC_SSL_TARGET_NAME_OVERRIDE_ARG, config.tls_server_name});
    }

    for (const auto& arg : config.extra_args) {
        options.args.push_back(arg);
    }
    return options;
}

PoolDependencies PoolDependencies::defaults() {
    PoolDependencies deps;
    deps.dialer = grpcConnectionDialer();
    deps.scheduler_factory = periodicRepairSchedulerFactory();
    return deps;
}

/**
 * @brief ConnectionPool implementation
 */
class ConnectionPool::Impl {
public:
    Impl(const PoolConfig& config, const PoolDependencies& deps)
        : target_(config.target)
        , pool_size_(static_cast<size_t>(config.pool_size))
        , repair_interval_(config.repair_interval)
        , options_(buildChannelOptions(config))
        , dialer_(deps.dialer)
        , scheduler_(deps.scheduler_factory())
        , cursor_(0)
        , closed_(false) {
        connections_.reserve(pool_size_);
    }

    PoolResult<bool> dialAll() {
        for (size_t i = 0; i < pool_size_; ++i) {
            auto result = dialer_(target_, options_);
            if (!result || !result.value) {
                std::string cause = result ? "dialer returned no connection" : result.error_message;
                LOGE_FMT("Failed to create connection " << i << " to " << target_ << ": " << cause);

                // Never hand out a partially built pool
                for (size_t j = 0; j < connections_.size(); ++j) {
                    auto close_result = connections_[j]->close();
                    if (!close_result) {
                        LOGW_FMT("Failed to close connection " << j << " to " << target_
                                 << " during rollback: " << close_result.error_message);
                    }
                }
                connections_.clear();
                closed_ = true;

                std::ostringstream oss;
                oss << "failed to create connection " << i << ": " << cause;
                return PoolResult<bool>::fail(PoolError::DIAL_FAILED, oss.str());
            }
            connections_.push_back(result.value);
        }
        return PoolResult<bool>::ok(true);
    }

    bool startRepair() {
        if (!scheduler_) {
            LOGE_FMT("No repair scheduler for pool " << target_);
            return false;
        }
        return scheduler_->start(repair_interval_, [this] { repair(); });
    }

    ConnectionPtr get() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (closed_) {
            throw PoolClosedException(target_);
        }

        ConnectionPtr conn = connections_[cursor_];
        cursor_ = (cursor_ + 1) % pool_size_;
        return conn;
    }

    PoolResult<ConnectionPtr> getHealthy(const Deadline& deadline) {
        std::vector<ConnectionPtr> snapshot;
        size_t start = 0;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (closed_) {
                return PoolResult<ConnectionPtr>::fail(PoolError::POOL_CLOSED,
                                                       "connection pool is closed: " + target_);
            }
            snapshot = connections_;
            start = cursor_;
        }

        for (size_t i = 0; i < pool_size_; ++i) {
            const auto& conn = snapshot[(start + i) % pool_size_];
            if (isUsable(conn->getState())) {
                return PoolResult<ConnectionPtr>::ok(conn);
            }
        }

        // Nothing usable right now: give each slot a chance to recover
        for (size_t i = 0; i < pool_size_; ++i) {
            if (deadline.expired()) {
                break;
            }
            const auto& conn = snapshot[(start + i) % pool_size_];
            if (conn->waitForStateChange(ConnectivityState::TRANSIENT_FAILURE, deadline) &&
                isUsable(conn->getState())) {
                return PoolResult<ConnectionPtr>::ok(conn);
            }
        }

        if (deadline.isCancelled()) {
            return PoolResult<ConnectionPtr>::fail(PoolError::CANCELLED,
                                                   "wait for healthy connection cancelled");
        }
        LOGD_FMT("No healthy connection available for " << target_);
        return PoolResult<ConnectionPtr>::fail(PoolError::NO_HEALTHY_CONNECTION,
                                               "no healthy connection available");
    }

    std::vector<ConnectionPtr> getAll() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return connections_;
    }

    PoolStats getStats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        PoolStats stats;
        stats.pool_size = pool_size_;
        stats.target = target_;
        stats.connections.reserve(connections_.size());
        for (size_t i = 0; i < connections_.size(); ++i) {
            stats.record(i, connections_[i]->getState());
        }
        return stats;
    }

    size_t repair() {
        std::lock_guard<std::mutex> repair_lock(repair_mutex_);

        std::vector<SlotRepair> repairs;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (closed_) {
                return 0;
            }
            for (size_t i = 0; i < connections_.size(); ++i) {
                auto state = connections_[i]->getState();
                if (needsRepair(state)) {
                    LOGW_FMT("Connection " << i << " to " << target_ << " is unhealthy (state: "
                             << state << "), attempting to reconnect");
                    repairs.push_back(SlotRepair{i, connections_[i], nullptr});
                }
            }
        }

        if (repairs.empty()) {
            return 0;
        }

        // Dial without holding the slot lock so selection keeps going
        for (auto& repair : repairs) {
            auto result = dialer_(target_, options_);
            if (!result || !result.value) {
                LOGW_FMT("Failed to recreate connection " << repair.index << " to " << target_
                         << ": " << (result ? "dialer returned no connection" : result.error_message));
                continue;
            }
            repair.new_conn = result.value;
        }

        std::vector<ConnectionPtr> retired;
        size_t replaced = 0;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            for (auto& repair : repairs) {
                if (!repair.new_conn) {
                    continue;
                }
                if (closed_ || connections_[repair.index] != repair.old_conn) {
                    retired.push_back(repair.new_conn);
                    continue;
                }
                connections_[repair.index] = repair.new_conn;
                retired.push_back(repair.old_conn);
                replaced++;
            }
        }

        for (const auto& conn : retired) {
            auto result = conn->close();
            if (!result && result.error != PoolError::CONNECTION_CLOSED) {
                LOGW_FMT("Failed to close retired connection to " << target_ << ": "
                         << result.error_message);
            }
        }

        for (const auto& repair : repairs) {
            if (repair.new_conn) {
                LOGI_FMT("Successfully recreated connection " << repair.index << " to " << target_);
            }
        }
        return replaced;
    }

    PoolResult<bool> close() {
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (closed_) {
                return PoolResult<bool>::ok(true);
            }
            closed_ = true;
        }

        if (scheduler_) {
            scheduler_->stop();
        }

        // Wait out a manual repair pass still in flight
        std::lock_guard<std::mutex> repair_lock(repair_mutex_);

        std::vector<ConnectionPtr> to_close;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            to_close = connections_;
        }

        std::vector<std::string> errors;
        for (size_t i = 0; i < to_close.size(); ++i) {
            auto result = to_close[i]->close();
            if (!result) {
                std::ostringstream oss;
                oss << "failed to close connection " << i << ": " << result.error_message;
                errors.push_back(oss.str());
            }
        }

        if (!errors.empty()) {
            std::ostringstream oss;
            oss << "errors closing connections: [";
            for (size_t i = 0; i < errors.size(); ++i) {
                oss << (i > 0 ? "; " : "") << errors[i];
            }
            oss << "]";
            LOGE_FMT("Pool " << target_ << ": " << oss.str());
            return PoolResult<bool>::fail(PoolError::CLOSE_FAILED, oss.str());
        }

        LOGI_FMT("Connection pool to " << target_ << " closed");
        return PoolResult<bool>::ok(true);
    }

    bool isClosed() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return closed_;
    }

    const std::string target_;
    const size_t pool_size_;

private:
    std::chrono::milliseconds repair_interval_;
    ChannelOptions options_;
    ConnectionDialer dialer_;
    RepairSchedulerPtr scheduler_;

    // Guards connections_, cursor_ and closed_
    mutable std::shared_mutex mutex_;
    std::vector<ConnectionPtr> connections_;
    size_t cursor_;
    bool closed_;

    // Serializes repair passes
    std::mutex repair_mutex_;
};

PoolResult<ConnectionPoolPtr> ConnectionPool::create(const PoolConfig& config,
                                                     const PoolDependencies& deps) {
    PoolConfig effective = config;
    if (effective.pool_size <= 0) {
        LOGD_FMT("Pool size " << effective.pool_size << " for " << effective.target
                 << " is not positive, using " << DEFAULT_POOL_SIZE);
        effective.pool_size = DEFAULT_POOL_SIZE;
    }

    if (effective.target.empty()) {
        return PoolResult<ConnectionPoolPtr>::fail(PoolError::INVALID_CONFIG,
                                                   "pool target must not be empty");
    }
    if (!deps.dialer || !deps.scheduler_factory) {
        return PoolResult<ConnectionPoolPtr>::fail(PoolError::INVALID_CONFIG,
                                                   "pool dependencies are incomplete");
    }

    ConnectionPoolPtr pool(new ConnectionPool(effective, deps));

    auto dialed = pool->pImpl_->dialAll();
    if (!dialed) {
        return PoolResult<ConnectionPoolPtr>::fail(dialed.error, dialed.error_message);
    }

    if (!pool->pImpl_->startRepair()) {
        auto closed = pool->close();
        if (!closed) {
            LOGW_FMT("Rollback of pool " << effective.target << " failed: " << closed.error_message);
        }
        return PoolResult<ConnectionPoolPtr>::fail(PoolError::INVALID_CONFIG,
                                                   "failed to start repair scheduler");
    }

    LOGI_FMT("Created connection pool to " << effective.target << " with "
             << effective.pool_size << " connections");
    return PoolResult<ConnectionPoolPtr>::ok(pool);
}

PoolResult<ConnectionPoolPtr> ConnectionPool::create(const PoolConfig& config) {
    return create(config, PoolDependencies::defaults());
}

ConnectionPool::ConnectionPool(const PoolConfig& config, const PoolDependencies& deps)
    : pImpl_(std::make_unique<Impl>(config, deps)) {
}

ConnectionPool::~ConnectionPool() {
    if (pImpl_) {
        auto result = pImpl_->close();
        if (!result) {
            LOGE_FMT("Error closing pool " << pImpl_->target_ << " on destruction: "
                     << result.error_message);
        }
    }
}

ConnectionPtr ConnectionPool::get() {
    return pImpl_->get();
}

PoolResult<ConnectionPtr> ConnectionPool::getHealthy(const Deadline& deadline) {
    return pImpl_->getHealthy(deadline);
}

std::vector<ConnectionPtr> ConnectionPool::getAll() const {
    return pImpl_->getAll();
}

size_t ConnectionPool::size() const {
    return pImpl_->pool_size_;
}

const std::string& ConnectionPool::target() const {
    return pImpl_->target_;
}

PoolStats ConnectionPool::getStats() const {
    return pImpl_->getStats();
}

size_t ConnectionPool::repairNow() {
    return pImpl_->repair();
}

PoolResult<bool> ConnectionPool::close() {
    return pImpl_->close();
}

bool ConnectionPool::isClosed() const {
    return pImpl_->isClosed();
}

nlohmann::json toJson(const PoolStats& stats) {
    nlohmann::json connections = nlohmann::json::array();
    for (const auto& slot : stats.connections) {
        connections.push_back({{"index", slot.index}, {"state", to_string(slot.state)}});
    }

    return {
        {"target", stats.target},
        {"pool_size", stats.pool_size},
        {"ready", stats.ready_count},
        {"idle", stats.idle_count},
        {"connecting", stats.connecting_count},
        {"transient_failure", stats.transient_failure_count},
        {"shutdown", stats.shutdown_count},
        {"healthy", stats.isHealthy()},
        {"healthy_percentage", stats.healthyPercentage()},
        {"connections", connections}
    };
}

} // namespace ipc
} // namespace rpcpool
