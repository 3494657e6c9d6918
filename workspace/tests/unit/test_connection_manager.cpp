/**
 * @file test_connection_manager.cpp
 * @brief Unit tests for the named connection pool registry
 */

#include <gtest/gtest.h>
#include "ipc/connection_manager.h"
#include "pool_test_support.h"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace rpcpool::ipc;
using namespace rpcpool::testing;
using namespace std::chrono_literals;

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<ConnectionManager>(makeDependencies(dialer_, schedulers_));
    }

    FakeDialer dialer_;
    ManualSchedulers schedulers_;
    std::unique_ptr<ConnectionManager> manager_;
};

TEST_F(ConnectionManagerTest, GetOrCreateBuildsPoolOnce) {
    auto first = manager_->getOrCreate("order-service", makeConfig("orders:50053", 3));
    ASSERT_TRUE(first.success()) << first.error_message;
    ASSERT_NE(first.value, nullptr);
    EXPECT_EQ(first.value->target(), "orders:50053");

    // A second config for the same name is ignored
    auto second = manager_->getOrCreate("order-service", makeConfig("elsewhere:1", 7));
    ASSERT_TRUE(second.success());
    EXPECT_EQ(second.value, first.value);
    EXPECT_EQ(second.value->size(), 3u);

    EXPECT_EQ(dialer_.calls(), 3);
    EXPECT_EQ(manager_->size(), 1u);
}

TEST_F(ConnectionManagerTest, ConcurrentGetOrCreateYieldsOnePool) {
    const int threads = 16;
    std::atomic<bool> go{false};
    std::vector<ConnectionPoolPtr> results(threads);
    std::vector<std::thread> workers;

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = manager_->getOrCreate("user-service", makeConfig("users:50051", 4));
            results[t] = result.value;
        });
    }
    go = true;
    for (auto& worker : workers) {
        worker.join();
    }

    ASSERT_NE(results[0], nullptr);
    for (const auto& pool : results) {
        EXPECT_EQ(pool, results[0]);
    }
    EXPECT_EQ(dialer_.calls(), 4);
    EXPECT_EQ(schedulers_.count(), 1u);
}

TEST_F(ConnectionManagerTest, GetOfUnknownNameIsNull) {
    EXPECT_EQ(manager_->get("missing-service"), nullptr);

    manager_->getOrCreate("user-service", makeConfig("users:50051", 1));
    EXPECT_NE(manager_->get("user-service"), nullptr);
    EXPECT_EQ(manager_->get("User-Service"), nullptr);
}

TEST_F(ConnectionManagerTest, CreationFailureNamesThePool) {
    dialer_.failTarget("payments:50054");

    auto result = manager_->getOrCreate("payment-service", makeConfig("payments:50054", 2));

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, PoolError::DIAL_FAILED);
    EXPECT_EQ(result.error_message.rfind("failed to create pool for payment-service: "
                                         "failed to create connection 0", 0), 0u)
        << result.error_message;
    EXPECT_EQ(manager_->get("payment-service"), nullptr);
    EXPECT_EQ(manager_->size(), 0u);
}

TEST_F(ConnectionManagerTest, FailedCreationCanBeRetried) {
    dialer_.failOnCall(1);
    EXPECT_FALSE(manager_->getOrCreate("user-service", makeConfig("users:50051", 2)).success());

    auto retry = manager_->getOrCreate("user-service", makeConfig("users:50051", 2));
    EXPECT_TRUE(retry.success()) << retry.error_message;
}

TEST_F(ConnectionManagerTest, CreateCommonPoolsSkipsEmptyTargets) {
    ServiceTargets targets = {
        {"user-service", "users:50051"},
        {"product-service", ""},
        {"order-service", "orders:50053"}
    };

    auto result = manager_->createCommonPools(targets, 2);
    ASSERT_TRUE(result.success()) << result.error_message;

    EXPECT_EQ(manager_->list(), (std::vector<std::string>{"order-service", "user-service"}));
    EXPECT_EQ(manager_->get("user-service")->size(), 2u);
    EXPECT_EQ(manager_->get("product-service"), nullptr);
    EXPECT_EQ(dialer_.calls(), 4);
}

TEST_F(ConnectionManagerTest, CreateCommonPoolsDefaultsSize) {
    auto result = manager_->createCommonPools({{"user-service", "users:50051"}}, 0);
    ASSERT_TRUE(result.success());
    EXPECT_EQ(manager_->get("user-service")->size(), static_cast<size_t>(DEFAULT_POOL_SIZE));
}

TEST_F(ConnectionManagerTest, CreateCommonPoolsUsesBaseConfig) {
    PoolConfig base;
    base.pool_size = 3;
    base.keepalive_time = 12s;

    auto result = manager_->createCommonPools({{"inventory-service", "inventory:50055"}}, base);
    ASSERT_TRUE(result.success());

    auto pool = manager_->get("inventory-service");
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->target(), "inventory:50055");
    EXPECT_EQ(pool->size(), 3u);
    EXPECT_EQ(*dialer_.lastOptions().findInt("grpc.keepalive_time_ms"), 12000);
}

TEST_F(ConnectionManagerTest, CreateCommonPoolsKeepsPerServiceTls) {
    PoolConfig users = makeConfig("users:50051", 2);

    PoolConfig payments = makeConfig("10.0.0.7:50054", 3);
    payments.use_tls = true;
    payments.tls_root_certs_path = "/etc/rpcpool/payments-ca.pem";
    payments.tls_server_name = "payments.internal";

    ServicePoolConfigs configs = {
        {"user-service", users},
        {"payment-service", payments},
        {"search-service", makeConfig("", 2)}
    };

    auto result = manager_->createCommonPools(configs);
    ASSERT_TRUE(result.success()) << result.error_message;

    EXPECT_EQ(manager_->list(), (std::vector<std::string>{"payment-service", "user-service"}));
    EXPECT_EQ(manager_->get("payment-service")->size(), 3u);

    auto secure = dialer_.optionsFor("10.0.0.7:50054");
    EXPECT_TRUE(secure.use_tls);
    EXPECT_EQ(secure.tls_root_certs_path, "/etc/rpcpool/payments-ca.pem");
    ASSERT_NE(secure.findString("grpc.ssl_target_name_override"), nullptr);
    EXPECT_EQ(*secure.findString("grpc.ssl_target_name_override"), "payments.internal");

    auto plain = dialer_.optionsFor("users:50051");
    EXPECT_FALSE(plain.use_tls);
    EXPECT_EQ(plain.findString("grpc.ssl_target_name_override"), nullptr);
}

TEST_F(ConnectionManagerTest, CreateCommonPoolsStopsAtFirstFailure) {
    dialer_.failTarget("bad:1");
    ServiceTargets targets = {
        {"a-service", "good:1"},
        {"b-service", "bad:1"},
        {"c-service", "good:2"}
    };

    auto result = manager_->createCommonPools(targets, 2);

    EXPECT_FALSE(result.success());
    EXPECT_NE(result.error_message.find("b-service"), std::string::npos) << result.error_message;

    // Pools created before the failure stay registered
    EXPECT_EQ(manager_->list(), std::vector<std::string>{"a-service"});
    EXPECT_EQ(manager_->get("c-service"), nullptr);
}

TEST_F(ConnectionManagerTest, StatsCoverEveryPool) {
    manager_->getOrCreate("user-service", makeConfig("users:50051", 2));
    manager_->getOrCreate("order-service", makeConfig("orders:50053", 3));

    auto stats = manager_->getAllStats();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats.at("user-service").pool_size, 2u);
    EXPECT_EQ(stats.at("user-service").target, "users:50051");
    EXPECT_EQ(stats.at("order-service").ready_count, 3u);
}

TEST_F(ConnectionManagerTest, HealthReportFlagsDegradedService) {
    manager_->getOrCreate("user-service", makeConfig("users:50051", 2));
    manager_->getOrCreate("order-service", makeConfig("orders:50053", 2));

    auto report = manager_->healthReport();
    EXPECT_EQ(report["status"], "healthy");

    for (const auto& conn : manager_->get("order-service")->getAll()) {
        std::dynamic_pointer_cast<FakeConnection>(conn)->setState(
            ConnectivityState::TRANSIENT_FAILURE);
    }

    report = manager_->healthReport();
    EXPECT_EQ(report["status"], "degraded");
    EXPECT_EQ(report["services"]["user-service"]["status"], "healthy");
    EXPECT_EQ(report["services"]["order-service"]["status"], "unhealthy");
    EXPECT_EQ(report["services"]["order-service"]["ready_connections"], 0);
    EXPECT_EQ(report["services"]["order-service"]["total_connections"], 2);
    EXPECT_DOUBLE_EQ(report["services"]["user-service"]["healthy_percentage"].get<double>(), 100.0);
}

TEST_F(ConnectionManagerTest, EmptyManagerIsHealthy) {
    auto report = manager_->healthReport();
    EXPECT_EQ(report["status"], "healthy");
    EXPECT_TRUE(report["services"].empty());
}

TEST_F(ConnectionManagerTest, RemoveClosesAndUnregisters) {
    auto pool = manager_->getOrCreate("user-service", makeConfig("users:50051", 2)).value;

    auto removed = manager_->remove("user-service");
    EXPECT_TRUE(removed.success());
    EXPECT_TRUE(pool->isClosed());
    EXPECT_EQ(manager_->get("user-service"), nullptr);

    auto again = manager_->remove("user-service");
    EXPECT_EQ(again.error, PoolError::NOT_FOUND);
    EXPECT_EQ(again.error_message, "no pool registered for user-service");
}

TEST_F(ConnectionManagerTest, CloseShutsAllPools) {
    auto users = manager_->getOrCreate("user-service", makeConfig("users:50051", 2)).value;
    auto orders = manager_->getOrCreate("order-service", makeConfig("orders:50053", 2)).value;

    EXPECT_TRUE(manager_->close().success());
    EXPECT_TRUE(users->isClosed());
    EXPECT_TRUE(orders->isClosed());
    EXPECT_EQ(manager_->size(), 0u);

    // Nothing left to close
    EXPECT_TRUE(manager_->close().success());
}

TEST_F(ConnectionManagerTest, CloseAggregatesPoolFailures) {
    auto users = manager_->getOrCreate("user-service", makeConfig("users:50051", 2)).value;
    auto orders = manager_->getOrCreate("order-service", makeConfig("orders:50053", 2)).value;
    std::dynamic_pointer_cast<FakeConnection>(users->getAll()[0])->setFailClose(true);

    auto result = manager_->close();

    EXPECT_EQ(result.error, PoolError::CLOSE_FAILED);
    EXPECT_EQ(result.error_message.rfind("errors closing pools: [failed to close pool user-service", 0),
              0u) << result.error_message;
    EXPECT_TRUE(orders->isClosed());
    EXPECT_TRUE(users->isClosed());
}

TEST(ConnectionManagerIsolation, ManagersDoNotShareState) {
    FakeDialer dialer;
    ManualSchedulers schedulers;
    ConnectionManager first(makeDependencies(dialer, schedulers));
    ConnectionManager second(makeDependencies(dialer, schedulers));

    first.getOrCreate("user-service", makeConfig("users:50051", 1));

    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(second.size(), 0u);
    EXPECT_EQ(second.get("user-service"), nullptr);
}

// Main function
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
