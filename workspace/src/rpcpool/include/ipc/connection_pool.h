/**
 * @file connection_pool.h
 * @brief Fixed-size pool of long-lived RPC client connections
 *
 * A ConnectionPool keeps exactly pool_size connections to one remote
 * target, hands them out round-robin (optionally filtered by health),
 * and replaces broken connections from a periodic repair pass. Callers
 * never write reconnect logic of their own.
 */

#ifndef RPCPOOL_IPC_CONNECTION_POOL_H
#define RPCPOOL_IPC_CONNECTION_POOL_H

#include "connection.h"
#include "deadline.h"
#include "pool_stats.h"
#include "pool_types.h"
#include "repair_scheduler.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace rpcpool {
namespace ipc {

/** Pool size used when the configured size is not positive */
constexpr int DEFAULT_POOL_SIZE = 5;

/** Default send/receive message size limit (10 MiB) */
constexpr int DEFAULT_MAX_MESSAGE_SIZE = 10 * 1024 * 1024;

/**
 * @brief Connection pool configuration
 */
struct PoolConfig {
    /** Target address of the remote endpoint (e.g. "user-service:50051") */
    std::string target;

    /** Number of parallel connections */
    int pool_size = DEFAULT_POOL_SIZE;

    /** Interval between keepalive pings */
    std::chrono::milliseconds keepalive_time{30000};

    /** Time to wait for a keepalive ack before the connection is dropped */
    std::chrono::milliseconds keepalive_timeout{10000};

    /** Idle time after which a connection goes back to IDLE */
    std::chrono::milliseconds max_connection_idle{300000};

    /** Maximum connection lifetime */
    std::chrono::milliseconds max_connection_age{1800000};

    /** Grace period for in-flight calls once max age is reached */
    std::chrono::milliseconds max_connection_age_grace{300000};

    /** Interval of the background repair pass */
    std::chrono::milliseconds repair_interval{30000};

    /** Send and receive message size limit in bytes */
    int max_message_size = DEFAULT_MAX_MESSAGE_SIZE;

    /** Use TLS credentials */
    bool use_tls = false;

    /** PEM root certificates for TLS (empty = runtime defaults) */
    std::string tls_root_certs_path;

    /** Name expected in the server certificate, when it differs from the target host */
    std::string tls_server_name;

    /** Additional channel arguments, appended after the built-in ones */
    std::vector<ChannelArg> extra_args;
};

/**
 * @brief Build the transport options shared by all connections of a pool
 */
ChannelOptions buildChannelOptions(const PoolConfig& config);

/**
 * @brief Collaborators a pool needs from the outside world
 */
struct PoolDependencies {
    /** Creates connections; defaults to gRPC channels */
    ConnectionDialer dialer;

    /** Creates the repair scheduler; defaults to a background thread */
    RepairSchedulerFactory scheduler_factory;

    /**
     * @brief gRPC dialer and thread-backed scheduler
     */
    static PoolDependencies defaults();
};

class ConnectionPool;
using ConnectionPoolPtr = std::shared_ptr<ConnectionPool>;

/**
 * @brief Pool of connections to one target
 *
 * Slots are addressed by index and replaced in place; the pool never
 * grows or shrinks. The slot array and the round-robin cursor are
 * guarded by a single reader/writer lock.
 *
 * Thread-safe for concurrent selection, statistics and repair.
 */
class ConnectionPool {
public:
    /**
     * @brief Create a pool and dial all of its connections
     *
     * All-or-nothing: if any dial fails, the connections created so far
     * are closed and the error is returned. On success the repair
     * scheduler is started.
     *
     * @param config Pool configuration (non-positive pool_size becomes 5)
     * @param deps Dialer and scheduler factory
     * @return The pool, or INVALID_CONFIG / DIAL_FAILED
     */
    static PoolResult<ConnectionPoolPtr> create(const PoolConfig& config,
                                                const PoolDependencies& deps);

    /**
     * @brief Create a pool with the default gRPC dependencies
     */
    static PoolResult<ConnectionPoolPtr> create(const PoolConfig& config);

    /**
     * @brief Destructor - closes the pool
     */
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Next connection in round-robin order, without health checks
     * @throws PoolClosedException if the pool was closed
     */
    ConnectionPtr get();

    /**
     * @brief First READY or IDLE connection, waiting up to @p deadline
     *
     * Scans from the cursor without advancing it. When no slot is usable,
     * waits on each slot in turn for it to leave TRANSIENT_FAILURE.
     *
     * @return The connection, or NO_HEALTHY_CONNECTION, CANCELLED, POOL_CLOSED
     */
    PoolResult<ConnectionPtr> getHealthy(const Deadline& deadline);

    /**
     * @brief Snapshot of all slots in index order
     */
    std::vector<ConnectionPtr> getAll() const;

    size_t size() const;

    const std::string& target() const;

    /**
     * @brief Consistent snapshot of per-slot connectivity
     */
    PoolStats getStats() const;

    /**
     * @brief Run one repair pass now
     *
     * Same code path as a scheduled tick. Never fails: dial errors are
     * logged and the slot is retried on the next pass.
     *
     * @return Number of slots replaced
     */
    size_t repairNow();

    /**
     * @brief Stop the repair scheduler and close every slot
     *
     * Per-slot close errors are aggregated into one CLOSE_FAILED result.
     * Closing a closed pool is a successful no-op.
     */
    PoolResult<bool> close();

    bool isClosed() const;

private:
    ConnectionPool(const PoolConfig& config, const PoolDependencies& deps);

    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace ipc
} // namespace rpcpool

#endif // RPCPOOL_IPC_CONNECTION_POOL_H
