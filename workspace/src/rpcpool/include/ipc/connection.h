/**
 * @file connection.h
 * @brief Abstract client connection handed out by connection pools
 *
 * A connection is an opaque handle to one long-lived client channel to a
 * remote target. Pools only observe its connectivity state, wait for
 * state changes and close it; building typed RPC clients on top of it is
 * left to the caller.
 */

#ifndef RPCPOOL_IPC_CONNECTION_H
#define RPCPOOL_IPC_CONNECTION_H

#include "deadline.h"
#include "pool_types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace rpcpool {
namespace ipc {

/**
 * @brief Transport-level channel argument, passed through unmodified
 */
struct ChannelArg {
    std::string key;
    std::variant<int, std::string> value;
};

/**
 * @brief Transport options shared by every connection of a pool
 *
 * Built once from the pool configuration and reused for the initial
 * dials and for every reconnect performed by the repair pass.
 */
struct ChannelOptions {
    /** Channel arguments in the order they are applied */
    std::vector<ChannelArg> args;

    /** Use TLS channel credentials instead of insecure ones */
    bool use_tls = false;

    /** PEM file with root certificates (empty = runtime defaults) */
    std::string tls_root_certs_path;

    /**
     * @brief Find an integer argument by key
     * @return Pointer to the value, nullptr if absent or not an integer
     */
    const int* findInt(const std::string& key) const {
        for (const auto& arg : args) {
            if (arg.key == key) {
                return std::get_if<int>(&arg.value);
            }
        }
        return nullptr;
    }

    const std::string* findString(const std::string& key) const {
        for (const auto& arg : args) {
            if (arg.key == key) {
                return std::get_if<std::string>(&arg.value);
            }
        }
        return nullptr;
    }
};

/**
 * @brief Client connection interface
 *
 * Implementations must be thread-safe: a pooled connection is shared by
 * every caller that selected it.
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    /**
     * @brief Current connectivity state
     * @param try_to_connect Kick an IDLE connection into CONNECTING
     */
    virtual ConnectivityState getState(bool try_to_connect = false) = 0;

    /**
     * @brief Block until the state differs from @p last_observed
     * @param last_observed State the caller last saw
     * @param deadline Give up at this point or when cancelled
     * @return true if the state changed, false on deadline or cancellation
     */
    virtual bool waitForStateChange(ConnectivityState last_observed,
                                    const Deadline& deadline) = 0;

    /**
     * @brief Close the connection
     *
     * Closing an already-closed connection fails with CONNECTION_CLOSED.
     */
    virtual PoolResult<bool> close() = 0;

    /**
     * @brief Target address this connection was dialed to
     */
    virtual const std::string& target() const = 0;

    /**
     * @brief Process-unique handle identity
     */
    virtual uint64_t id() const = 0;
};

using ConnectionPtr = std::shared_ptr<IConnection>;

/**
 * @brief Creates one connection to a target with the given options
 */
using ConnectionDialer = std::function<PoolResult<ConnectionPtr>(
    const std::string& target, const ChannelOptions& options)>;

/**
 * @brief Allocate the next process-unique connection id
 */
uint64_t nextConnectionId();

} // namespace ipc
} // namespace rpcpool

#endif // RPCPOOL_IPC_CONNECTION_H
