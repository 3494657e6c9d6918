/**
 * @file connection_manager.h
 * @brief Registry of named connection pools
 *
 * A ConnectionManager maps a logical downstream service name (for
 * example "order-service") to the ConnectionPool serving it. Pools are
 * created lazily or provisioned in bulk at startup, and are closed
 * together on shutdown.
 *
 * The manager is an ordinary object: create one per application (or per
 * test) and pass it to whoever needs a pool.
 */

#ifndef RPCPOOL_IPC_CONNECTION_MANAGER_H
#define RPCPOOL_IPC_CONNECTION_MANAGER_H

#include "connection_pool.h"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rpcpool {
namespace ipc {

/**
 * @brief Logical service name to target address
 *
 * An empty target means the service is not configured.
 */
using ServiceTargets = std::map<std::string, std::string>;

/**
 * @brief Service name to the full configuration of its pool
 */
using ServicePoolConfigs = std::map<std::string, PoolConfig>;

/**
 * @brief Thread-safe registry of connection pools by service name
 */
class ConnectionManager {
public:
    /**
     * @brief Construct with the default gRPC dependencies
     */
    ConnectionManager();

    /**
     * @brief Construct with custom dependencies, handed to every pool
     */
    explicit ConnectionManager(PoolDependencies deps);

    /**
     * @brief Destructor - closes all pools
     */
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Return the pool registered under @p name, creating it if absent
     *
     * Concurrent callers asking for the same unregistered name get the
     * same instance; the pool is constructed once.
     *
     * @return The pool, or the construction error tagged with the name
     */
    PoolResult<ConnectionPoolPtr> getOrCreate(const std::string& name, const PoolConfig& config);

    /**
     * @brief Look up a pool without creating it
     * @return The pool, or nullptr if none is registered
     */
    ConnectionPoolPtr get(const std::string& name) const;

    /**
     * @brief Provision pools for a set of downstream services
     *
     * Entries with an empty target are skipped. Stops at the first pool
     * that fails to build; pools created before it stay registered.
     *
     * @param targets Service name to target address
     * @param default_pool_size Pool size for each service (non-positive = 5)
     */
    PoolResult<bool> createCommonPools(const ServiceTargets& targets, int default_pool_size);

    /**
     * @brief Provision pools using @p base for everything but the target
     */
    PoolResult<bool> createCommonPools(const ServiceTargets& targets, const PoolConfig& base);

    /**
     * @brief Provision pools from a complete configuration per service
     *
     * Lets services differ in TLS credentials or pool size. Entries with
     * an empty target are skipped; failure handling is the same as above.
     */
    PoolResult<bool> createCommonPools(const ServicePoolConfigs& configs);

    /**
     * @brief Statistics of every registered pool
     */
    std::map<std::string, PoolStats> getAllStats() const;

    /**
     * @brief Names of all registered pools, sorted
     */
    std::vector<std::string> list() const;

    size_t size() const;

    /**
     * @brief Close and unregister one pool
     * @return NOT_FOUND if no pool is registered under @p name
     */
    PoolResult<bool> remove(const std::string& name);

    /**
     * @brief Health summary for readiness endpoints
     *
     * "status" is "healthy" when every pool has a usable connection and
     * "degraded" otherwise.
     */
    nlohmann::json healthReport() const;

    /**
     * @brief Close every pool and empty the registry
     *
     * Every pool is closed even if an earlier one fails; errors are
     * aggregated into one CLOSE_FAILED result.
     */
    PoolResult<bool> close();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace ipc
} // namespace rpcpool

#endif // RPCPOOL_IPC_CONNECTION_MANAGER_H
