/**
 * @file pool_types.h
 * @brief Shared types for RPC connection pooling
 *
 * Connectivity states observed on pooled connections, error codes and
 * the result type returned by pool and manager operations.
 */

#ifndef RPCPOOL_IPC_POOL_TYPES_H
#define RPCPOOL_IPC_POOL_TYPES_H

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace rpcpool {
namespace ipc {

/**
 * @brief Connectivity state of a single client connection
 *
 * Mirrors the channel states of the RPC runtime. The set is closed:
 * every switch over it is expected to handle all five values.
 */
enum class ConnectivityState {
    /** No activity, will connect on demand */
    IDLE,

    /** Connection attempt in progress */
    CONNECTING,

    /** Connected and able to carry calls */
    READY,

    /** Last attempt failed, waiting to retry */
    TRANSIENT_FAILURE,

    /** Closed, never usable again */
    SHUTDOWN
};

inline const char* to_string(ConnectivityState state) {
    switch (state) {
        case ConnectivityState::IDLE:              return "IDLE";
        case ConnectivityState::CONNECTING:        return "CONNECTING";
        case ConnectivityState::READY:             return "READY";
        case ConnectivityState::TRANSIENT_FAILURE: return "TRANSIENT_FAILURE";
        case ConnectivityState::SHUTDOWN:          return "SHUTDOWN";
    }
    return "INVALID";
}

inline std::ostream& operator<<(std::ostream& os, ConnectivityState state) {
    os << to_string(state);
    return os;
}

/**
 * @brief A connection in this state can be handed out for calls
 */
inline bool isUsable(ConnectivityState state) {
    return state == ConnectivityState::READY || state == ConnectivityState::IDLE;
}

/**
 * @brief A connection in this state is replaced by the repair pass
 */
inline bool needsRepair(ConnectivityState state) {
    return state == ConnectivityState::SHUTDOWN ||
           state == ConnectivityState::TRANSIENT_FAILURE;
}

/**
 * @brief Pool error codes
 */
enum class PoolError {
    SUCCESS = 0,
    INVALID_CONFIG,
    DIAL_FAILED,
    NO_HEALTHY_CONNECTION,
    CANCELLED,
    POOL_CLOSED,
    CLOSE_FAILED,
    CONNECTION_CLOSED,
    NOT_FOUND
};

inline const char* to_string(PoolError error) {
    switch (error) {
        case PoolError::SUCCESS:               return "SUCCESS";
        case PoolError::INVALID_CONFIG:        return "INVALID_CONFIG";
        case PoolError::DIAL_FAILED:           return "DIAL_FAILED";
        case PoolError::NO_HEALTHY_CONNECTION: return "NO_HEALTHY_CONNECTION";
        case PoolError::CANCELLED:             return "CANCELLED";
        case PoolError::POOL_CLOSED:           return "POOL_CLOSED";
        case PoolError::CLOSE_FAILED:          return "CLOSE_FAILED";
        case PoolError::CONNECTION_CLOSED:     return "CONNECTION_CLOSED";
        case PoolError::NOT_FOUND:             return "NOT_FOUND";
    }
    return "INVALID";
}

inline std::ostream& operator<<(std::ostream& os, PoolError error) {
    os << to_string(error);
    return os;
}

/**
 * @brief Result type for pool operations
 */
template<typename T>
struct PoolResult {
    PoolError error = PoolError::SUCCESS;
    T value = T{};
    std::string error_message;

    bool success() const { return error == PoolError::SUCCESS; }
    explicit operator bool() const { return success(); }

    static PoolResult ok(T v) {
        return {PoolError::SUCCESS, std::move(v), ""};
    }

    static PoolResult fail(PoolError e, std::string message) {
        return {e, T{}, std::move(message)};
    }
};

/**
 * @brief Thrown when a closed pool is used for selection
 */
class PoolClosedException : public std::runtime_error {
public:
    explicit PoolClosedException(const std::string& target)
        : std::runtime_error("Connection pool is closed: " + target) {}
};

} // namespace ipc
} // namespace rpcpool

#endif // RPCPOOL_IPC_POOL_TYPES_H
