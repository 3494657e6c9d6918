/**
 * @file grpc_connection.h
 * @brief gRPC channel backed connection
 *
 * Wraps one grpc::Channel. Channel creation is lazy in gRPC, so dialing
 * only fails on invalid configuration (empty target, unreadable TLS
 * root certificates); network problems show up as connectivity states.
 */

#ifndef RPCPOOL_IPC_GRPC_CONNECTION_H
#define RPCPOOL_IPC_GRPC_CONNECTION_H

#include "connection.h"
#include <memory>
#include <mutex>
#include <string>

// Forward declarations for gRPC types to avoid heavy includes in header
namespace grpc {
class Channel;
}

namespace rpcpool {
namespace ipc {

/**
 * @brief Connection over a gRPC client channel
 */
class GrpcConnection : public IConnection {
public:
    GrpcConnection(std::string target, std::shared_ptr<grpc::Channel> channel);
    ~GrpcConnection() override;

    GrpcConnection(const GrpcConnection&) = delete;
    GrpcConnection& operator=(const GrpcConnection&) = delete;

    ConnectivityState getState(bool try_to_connect = false) override;

    bool waitForStateChange(ConnectivityState last_observed,
                            const Deadline& deadline) override;

    /**
     * @brief Drop the channel; the connection reports SHUTDOWN afterwards
     */
    PoolResult<bool> close() override;

    const std::string& target() const override { return target_; }

    uint64_t id() const override { return id_; }

    /**
     * @brief Underlying channel for building typed stubs
     * @return Channel, or nullptr once closed
     */
    std::shared_ptr<grpc::Channel> channel() const;

private:
    std::shared_ptr<grpc::Channel> currentChannel() const;

    const std::string target_;
    const uint64_t id_;

    mutable std::mutex mutex_;
    std::shared_ptr<grpc::Channel> channel_;
};

/**
 * @brief Dial one gRPC connection
 * @return INVALID_CONFIG for an empty target, DIAL_FAILED when TLS
 *         material cannot be loaded
 */
PoolResult<ConnectionPtr> dialGrpcConnection(const std::string& target,
                                             const ChannelOptions& options);

/**
 * @brief ConnectionDialer that calls dialGrpcConnection()
 */
ConnectionDialer grpcConnectionDialer();

} // namespace ipc
} // namespace rpcpool

#endif // RPCPOOL_IPC_GRPC_CONNECTION_H
