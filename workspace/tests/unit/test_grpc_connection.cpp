/**
 * @file test_grpc_connection.cpp
 * @brief Unit tests for gRPC channel backed connections
 *
 * No gRPC server is started. Most tests rely on local channel state;
 * transport tests count sockets on a plain loopback listener.
 */

#include <gtest/gtest.h>
#include "ipc/connection_pool.h"
#include "ipc/grpc_connection.h"
#include "pool_test_support.h"
#include <grpcpp/grpcpp.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace rpcpool::ipc;
using namespace std::chrono_literals;

namespace {

// Nothing listens here; connection attempts fail fast
const char* const UNUSED_TARGET = "127.0.0.1:1";

/**
 * @brief Loopback TCP listener that accepts and holds sockets
 *
 * It never speaks HTTP/2, so a client transport stays parked in its
 * handshake and every distinct transport shows up as one accepted socket.
 */
class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            return;
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 64) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(fd_);
            fd_ = -1;
            return;
        }
        port_ = ntohs(addr.sin_port);
        running_ = true;
        thread_ = std::thread([this]() { acceptLoop(); });
    }

    ~LoopbackListener() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        for (int client : clients_) {
            ::close(client);
        }
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    bool listening() const { return fd_ >= 0; }

    std::string target() const { return "127.0.0.1:" + std::to_string(port_); }

    size_t accepted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return clients_.size();
    }

    /** Wait until at least @p count sockets were accepted */
    bool waitForAccepted(size_t count, std::chrono::milliseconds timeout) const {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (accepted() < count) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }

private:
    void acceptLoop() {
        while (running_) {
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            int client = ::accept(fd_, nullptr, nullptr);
            if (client >= 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                clients_.push_back(client);
            }
        }
    }

    int fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<int> clients_;
};

PoolDependencies realChannelDependencies(rpcpool::testing::ManualSchedulers& schedulers) {
    PoolDependencies deps;
    deps.dialer = grpcConnectionDialer();
    deps.scheduler_factory = schedulers.factory();
    return deps;
}

} // namespace

TEST(GrpcConnectionTest, EmptyTargetIsRejected) {
    auto result = dialGrpcConnection("", ChannelOptions{});
    EXPECT_EQ(result.error, PoolError::INVALID_CONFIG);
    EXPECT_EQ(result.value, nullptr);
}

TEST(GrpcConnectionTest, DialIsLazy) {
    auto result = dialGrpcConnection(UNUSED_TARGET, buildChannelOptions(PoolConfig{}));
    ASSERT_TRUE(result.success()) << result.error_message;
    ASSERT_NE(result.value, nullptr);

    EXPECT_EQ(result.value->target(), UNUSED_TARGET);
    EXPECT_EQ(result.value->getState(), ConnectivityState::IDLE);
}

TEST(GrpcConnectionTest, ConnectionsHaveDistinctIds) {
    auto first = dialGrpcConnection(UNUSED_TARGET, ChannelOptions{});
    auto second = dialGrpcConnection(UNUSED_TARGET, ChannelOptions{});
    ASSERT_TRUE(first.success());
    ASSERT_TRUE(second.success());
    EXPECT_NE(first.value->id(), second.value->id());
}

TEST(GrpcConnectionTest, ExposesUnderlyingChannel) {
    auto result = dialGrpcConnection(UNUSED_TARGET, ChannelOptions{});
    ASSERT_TRUE(result.success());

    auto conn = std::dynamic_pointer_cast<GrpcConnection>(result.value);
    ASSERT_NE(conn, nullptr);
    EXPECT_NE(conn->channel(), nullptr);
}

TEST(GrpcConnectionTest, CloseIsReportedOnce) {
    auto result = dialGrpcConnection(UNUSED_TARGET, ChannelOptions{});
    ASSERT_TRUE(result.success());
    auto conn = result.value;

    EXPECT_TRUE(conn->close().success());
    EXPECT_EQ(conn->getState(), ConnectivityState::SHUTDOWN);

    auto again = conn->close();
    EXPECT_EQ(again.error, PoolError::CONNECTION_CLOSED);
    EXPECT_NE(again.error_message.find(UNUSED_TARGET), std::string::npos);
}

TEST(GrpcConnectionTest, WaitOnClosedConnectionReturnsImmediately) {
    auto result = dialGrpcConnection(UNUSED_TARGET, ChannelOptions{});
    ASSERT_TRUE(result.success());
    auto conn = result.value;
    conn->close();

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(conn->waitForStateChange(ConnectivityState::READY, Deadline::after(5s)));
    EXPECT_FALSE(conn->waitForStateChange(ConnectivityState::SHUTDOWN, Deadline::after(50ms)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(GrpcConnectionTest, CancelledWaitReturnsPromptly) {
    auto result = dialGrpcConnection(UNUSED_TARGET, ChannelOptions{});
    ASSERT_TRUE(result.success());

    Deadline deadline = Deadline::never();
    deadline.cancel();

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(result.value->waitForStateChange(ConnectivityState::IDLE, deadline));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
}

TEST(GrpcConnectionTest, ConnectAttemptLeavesIdle) {
    auto result = dialGrpcConnection(UNUSED_TARGET, ChannelOptions{});
    ASSERT_TRUE(result.success());
    auto conn = result.value;

    ASSERT_EQ(conn->getState(true), ConnectivityState::IDLE);
    EXPECT_TRUE(conn->waitForStateChange(ConnectivityState::IDLE, Deadline::after(5s)));
    EXPECT_NE(conn->getState(), ConnectivityState::IDLE);
}

TEST(GrpcConnectionTest, MissingRootCertificatesFailDial) {
    ChannelOptions options;
    options.use_tls = true;
    options.tls_root_certs_path = "/nonexistent/rpcpool/ca.pem";

    auto result = dialGrpcConnection(UNUSED_TARGET, options);
    EXPECT_EQ(result.error, PoolError::DIAL_FAILED);
    EXPECT_NE(result.error_message.find("/nonexistent/rpcpool/ca.pem"), std::string::npos);
}

TEST(GrpcConnectionTest, StringArgumentsAreAccepted) {
    ChannelOptions options;
    options.args.push_back({"grpc.primary_user_agent", std::string("rpcpool-test")});
    options.args.push_back({"grpc.keepalive_time_ms", 20000});

    auto result = dialGrpcConnection(UNUSED_TARGET, options);
    EXPECT_TRUE(result.success()) << result.error_message;
}

TEST(GrpcConnectionPoolTest, PoolOverRealChannels) {
    rpcpool::testing::ManualSchedulers schedulers;
    PoolDependencies deps;
    deps.dialer = grpcConnectionDialer();
    deps.scheduler_factory = schedulers.factory();

    auto created = ConnectionPool::create(rpcpool::testing::makeConfig(UNUSED_TARGET, 3), deps);
    ASSERT_TRUE(created.success()) << created.error_message;
    auto pool = created.value;

    auto stats = pool->getStats();
    EXPECT_EQ(stats.pool_size, 3u);
    EXPECT_EQ(stats.connections.size(), 3u);

    // A never-used channel counts as usable
    auto healthy = pool->getHealthy(Deadline::after(1s));
    EXPECT_TRUE(healthy.success()) << healthy.error_message;

    EXPECT_TRUE(pool->close().success());
    EXPECT_EQ(pool->getStats().shutdown_count, 3u);
}

TEST(GrpcConnectionPoolTest, EverySlotOpensItsOwnTransport) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.listening());

    rpcpool::testing::ManualSchedulers schedulers;
    auto created = ConnectionPool::create(rpcpool::testing::makeConfig(listener.target(), 5),
                                          realChannelDependencies(schedulers));
    ASSERT_TRUE(created.success()) << created.error_message;
    auto pool = created.value;

    for (const auto& conn : pool->getAll()) {
        conn->getState(true);
    }

    EXPECT_TRUE(listener.waitForAccepted(5, 5s)) << "accepted " << listener.accepted();
    EXPECT_TRUE(pool->close().success());
}

TEST(GrpcConnectionPoolTest, RepairedSlotOpensFreshTransport) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.listening());

    rpcpool::testing::ManualSchedulers schedulers;
    auto created = ConnectionPool::create(rpcpool::testing::makeConfig(listener.target(), 3),
                                          realChannelDependencies(schedulers));
    ASSERT_TRUE(created.success()) << created.error_message;
    auto pool = created.value;

    for (const auto& conn : pool->getAll()) {
        conn->getState(true);
    }
    ASSERT_TRUE(listener.waitForAccepted(3, 5s)) << "accepted " << listener.accepted();
    const size_t before = listener.accepted();

    auto broken = pool->getAll()[0];
    EXPECT_TRUE(broken->close().success());
    EXPECT_EQ(pool->repairNow(), 1u);

    auto replacement = pool->getAll()[0];
    ASSERT_NE(replacement->id(), broken->id());
    replacement->getState(true);

    EXPECT_TRUE(listener.waitForAccepted(before + 1, 5s)) << "accepted " << listener.accepted();
    EXPECT_TRUE(pool->close().success());
}

// Main function
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
