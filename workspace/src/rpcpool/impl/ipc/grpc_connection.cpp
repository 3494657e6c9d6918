/**
 * @file grpc_connection.cpp
 * @brief gRPC channel backed connection implementation
 */

#include "ipc/grpc_connection.h"
#include "utils/log.h"
#include <grpcpp/grpcpp.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>

namespace rpcpool {
namespace ipc {

namespace {

// Upper bound of a single blocking wait, so cancellation is noticed
constexpr std::chrono::milliseconds WAIT_SLICE{50};

ConnectivityState fromGrpc(grpc_connectivity_state state) {
    switch (state) {
        case GRPC_CHANNEL_IDLE:              return ConnectivityState::IDLE;
        case GRPC_CHANNEL_CONNECTING:        return ConnectivityState::CONNECTING;
        case GRPC_CHANNEL_READY:             return ConnectivityState::READY;
        case GRPC_CHANNEL_TRANSIENT_FAILURE: return ConnectivityState::TRANSIENT_FAILURE;
        case GRPC_CHANNEL_SHUTDOWN:          return ConnectivityState::SHUTDOWN;
    }
    return ConnectivityState::SHUTDOWN;
}

grpc_connectivity_state toGrpc(ConnectivityState state) {
    switch (state) {
        case ConnectivityState::IDLE:              return GRPC_CHANNEL_IDLE;
        case ConnectivityState::CONNECTING:        return GRPC_CHANNEL_CONNECTING;
        case ConnectivityState::READY:             return GRPC_CHANNEL_READY;
        case ConnectivityState::TRANSIENT_FAILURE: return GRPC_CHANNEL_TRANSIENT_FAILURE;
        case ConnectivityState::SHUTDOWN:          return GRPC_CHANNEL_SHUTDOWN;
    }
    return GRPC_CHANNEL_SHUTDOWN;
}

bool readFile(const std::string& path, std::string& contents) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    contents = oss.str();
    return !file.bad();
}

} // namespace

GrpcConnection::GrpcConnection(std::string target, std::shared_ptr<grpc::Channel> channel)
    : target_(std::move(target))
    , id_(nextConnectionId())
    , channel_(std::move(channel)) {
    LOGV_FMT("GrpcConnection " << id_ << " created for " << target_);
}

GrpcConnection::~GrpcConnection() {
    LOGV_FMT("GrpcConnection " << id_ << " destroyed");
}

std::shared_ptr<grpc::Channel> GrpcConnection::currentChannel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_;
}

std::shared_ptr<grpc::Channel> GrpcConnection::channel() const {
    return currentChannel();
}

ConnectivityState GrpcConnection::getState(bool try_to_connect) {
    auto channel = currentChannel();
    if (!channel) {
        return ConnectivityState::SHUTDOWN;
    }
    return fromGrpc(channel->GetState(try_to_connect));
}

bool GrpcConnection::waitForStateChange(ConnectivityState last_observed,
                                        const Deadline& deadline) {
    auto channel = currentChannel();
    if (!channel) {
        return last_observed != ConnectivityState::SHUTDOWN;
    }

    const auto last = toGrpc(last_observed);
    while (!deadline.expired()) {
        auto step = std::min(WAIT_SLICE, deadline.remaining());
        if (channel->WaitForStateChange(last, std::chrono::system_clock::now() + step)) {
            return true;
        }
    }
    return false;
}

PoolResult<bool> GrpcConnection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!channel_) {
        return PoolResult<bool>::fail(PoolError::CONNECTION_CLOSED,
                                      "connection to " + target_ + " already closed");
    }
    channel_.reset();
    LOGD_FMT("GrpcConnection " << id_ << " to " << target_ << " closed");
    return PoolResult<bool>::ok(true);
}

PoolResult<ConnectionPtr> dialGrpcConnection(const std::string& target,
                                             const ChannelOptions& options) {
    if (target.empty()) {
        return PoolResult<ConnectionPtr>::fail(PoolError::INVALID_CONFIG, "target must not be empty");
    }

    std::shared_ptr<grpc::ChannelCredentials> creds;
    if (options.use_tls) {
        grpc::SslCredentialsOptions ssl_options;
        if (!options.tls_root_certs_path.empty() &&
            !readFile(options.tls_root_certs_path, ssl_options.pem_root_certs)) {
            return PoolResult<ConnectionPtr>::fail(
                PoolError::DIAL_FAILED,
                "cannot read TLS root certificates: " + options.tls_root_certs_path);
        }
        creds = grpc::SslCredentials(ssl_options);
    } else {
        creds = grpc::InsecureChannelCredentials();
    }

    grpc::ChannelArguments args;
    for (const auto& arg : options.args) {
        if (const int* value = std::get_if<int>(&arg.value)) {
            args.SetInt(arg.key, *value);
        } else {
            args.SetString(arg.key, std::get<std::string>(arg.value));
        }
    }

    auto channel = grpc::CreateCustomChannel(target, creds, args);
    if (!channel) {
        return PoolResult<ConnectionPtr>::fail(PoolError::DIAL_FAILED,
                                               "failed to create channel to " + target);
    }

    return PoolResult<ConnectionPtr>::ok(std::make_shared<GrpcConnection>(target, std::move(channel)));
}

ConnectionDialer grpcConnectionDialer() {
    return [](const std::string& target, const ChannelOptions& options) {
        return dialGrpcConnection(target, options);
    };
}

} // namespace ipc
} // namespace rpcpool
