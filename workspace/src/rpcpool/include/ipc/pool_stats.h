/**
 * @file pool_stats.h
 * @brief Point-in-time statistics of a connection pool
 */

#ifndef RPCPOOL_IPC_POOL_STATS_H
#define RPCPOOL_IPC_POOL_STATS_H

#include "pool_types.h"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace rpcpool {
namespace ipc {

/**
 * @brief State of one pool slot
 */
struct SlotState {
    size_t index = 0;
    ConnectivityState state = ConnectivityState::IDLE;
};

/**
 * @brief Connection pool statistics snapshot
 */
struct PoolStats {
    /** Number of slots in the pool */
    size_t pool_size = 0;

    /** Target address of the pool */
    std::string target;

    size_t ready_count = 0;
    size_t idle_count = 0;
    size_t connecting_count = 0;
    size_t transient_failure_count = 0;
    size_t shutdown_count = 0;

    /** Per-slot states in slot order */
    std::vector<SlotState> connections;

    /**
     * @brief At least one connection is READY or IDLE
     */
    bool isHealthy() const {
        return ready_count > 0 || idle_count > 0;
    }

    /**
     * @brief Share of READY and IDLE connections, in percent
     */
    double healthyPercentage() const {
        if (pool_size == 0) {
            return 0.0;
        }
        return static_cast<double>(ready_count + idle_count) /
               static_cast<double>(pool_size) * 100.0;
    }

    /**
     * @brief Count one connection in the matching state bucket
     */
    void record(size_t index, ConnectivityState state) {
        connections.push_back(SlotState{index, state});
        switch (state) {
            case ConnectivityState::READY:             ready_count++; break;
            case ConnectivityState::IDLE:              idle_count++; break;
            case ConnectivityState::CONNECTING:        connecting_count++; break;
            case ConnectivityState::TRANSIENT_FAILURE: transient_failure_count++; break;
            case ConnectivityState::SHUTDOWN:          shutdown_count++; break;
        }
    }
};

/**
 * @brief Render statistics for health and readiness endpoints
 */
nlohmann::json toJson(const PoolStats& stats);

} // namespace ipc
} // namespace rpcpool

#endif // RPCPOOL_IPC_POOL_STATS_H
