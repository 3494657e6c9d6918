/**
 * @file connection_manager.cpp
 * @brief Implementation of the named connection pool registry
 */

#include "ipc/connection_manager.h"
#include "utils/log.h"
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace rpcpool {
namespace ipc {

/**
 * @brief ConnectionManager implementation
 */
class ConnectionManager::Impl {
public:
    explicit Impl(PoolDependencies deps)
        : deps_(std::move(deps)) {
        LOGD_FMT("ConnectionManager::Impl constructed");
    }

    ~Impl() {
        auto result = close();
        if (!result) {
            LOGE_FMT("ConnectionManager destructor: " << result.error_message);
        }
    }

    PoolResult<ConnectionPoolPtr> getOrCreate(const std::string& name, const PoolConfig& config) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = pools_.find(name);
            if (it != pools_.end()) {
                return PoolResult<ConnectionPoolPtr>::ok(it->second);
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);

        // Another caller may have built it while we waited for the lock
        auto it = pools_.find(name);
        if (it != pools_.end()) {
            return PoolResult<ConnectionPoolPtr>::ok(it->second);
        }

        auto created = ConnectionPool::create(config, deps_);
        if (!created) {
            LOGE_FMT("Failed to create pool for " << name << ": " << created.error_message);
            return PoolResult<ConnectionPoolPtr>::fail(
                created.error, "failed to create pool for " + name + ": " + created.error_message);
        }

        pools_[name] = created.value;
        LOGI_FMT("Registered pool " << name << " -> " << config.target
                 << ", total=" << pools_.size());
        return created;
    }

    ConnectionPoolPtr get(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = pools_.find(name);
        if (it == pools_.end()) {
            return nullptr;
        }
        return it->second;
    }

    PoolResult<bool> createCommonPools(const ServicePoolConfigs& configs) {
        for (const auto& [name, config] : configs) {
            if (config.target.empty()) {
                LOGD_FMT("Service " << name << " has no target configured, skipping");
                continue;
            }

            auto result = getOrCreate(name, config);
            if (!result) {
                return PoolResult<bool>::fail(result.error, result.error_message);
            }
        }
        return PoolResult<bool>::ok(true);
    }

    std::map<std::string, PoolStats> getAllStats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::map<std::string, PoolStats> stats;
        for (const auto& [name, pool] : pools_) {
            stats[name] = pool->getStats();
        }
        return stats;
    }

    std::vector<std::string> list() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::string> names;
        names.reserve(pools_.size());
        for (const auto& entry : pools_) {
            names.push_back(entry.first);
        }
        return names;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return pools_.size();
    }

    PoolResult<bool> remove(const std::string& name) {
        ConnectionPoolPtr pool;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = pools_.find(name);
            if (it == pools_.end()) {
                return PoolResult<bool>::fail(PoolError::NOT_FOUND, "no pool registered for " + name);
            }
            pool = it->second;
            pools_.erase(it);
        }

        LOGI_FMT("Removing pool " << name);
        auto result = pool->close();
        if (!result) {
            return PoolResult<bool>::fail(result.error,
                                          "failed to close pool " + name + ": " + result.error_message);
        }
        return PoolResult<bool>::ok(true);
    }

    PoolResult<bool> close() {
        std::map<std::string, ConnectionPoolPtr> pools;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            pools.swap(pools_);
        }

        if (pools.empty()) {
            return PoolResult<bool>::ok(true);
        }

        LOGI_FMT("Closing " << pools.size() << " connection pools");
        std::vector<std::string> errors;
        for (const auto& [name, pool] : pools) {
            auto result = pool->close();
            if (!result) {
                errors.push_back("failed to close pool " + name + ": " + result.error_message);
            }
        }

        if (!errors.empty()) {
            std::ostringstream oss;
            oss << "errors closing pools: [";
            for (size_t i = 0; i < errors.size(); ++i) {
                oss << (i > 0 ? "; " : "") << errors[i];
            }
            oss << "]";
            LOGE_FMT(oss.str());
            return PoolResult<bool>::fail(PoolError::CLOSE_FAILED, oss.str());
        }
        return PoolResult<bool>::ok(true);
    }

private:
    PoolDependencies deps_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, ConnectionPoolPtr> pools_;
};

ConnectionManager::ConnectionManager()
    : ConnectionManager(PoolDependencies::defaults()) {
}

ConnectionManager::ConnectionManager(PoolDependencies deps)
    : pImpl_(std::make_unique<Impl>(std::move(deps))) {
}

ConnectionManager::~ConnectionManager() = default;

PoolResult<ConnectionPoolPtr> ConnectionManager::getOrCreate(const std::string& name,
                                                             const PoolConfig& config) {
    return pImpl_->getOrCreate(name, config);
}

ConnectionPoolPtr ConnectionManager::get(const std::string& name) const {
    return pImpl_->get(name);
}

PoolResult<bool> ConnectionManager::createCommonPools(const ServiceTargets& targets,
                                                      int default_pool_size) {
    PoolConfig base;
    base.pool_size = default_pool_size > 0 ? default_pool_size : DEFAULT_POOL_SIZE;
    return createCommonPools(targets, base);
}

PoolResult<bool> ConnectionManager::createCommonPools(const ServiceTargets& targets,
                                                      const PoolConfig& base) {
    ServicePoolConfigs configs;
    for (const auto& [name, target] : targets) {
        PoolConfig config = base;
        config.target = target;
        configs.emplace(name, std::move(config));
    }
    return pImpl_->createCommonPools(configs);
}

PoolResult<bool> ConnectionManager::createCommonPools(const ServicePoolConfigs& configs) {
    return pImpl_->createCommonPools(configs);
}

std::map<std::string, PoolStats> ConnectionManager::getAllStats() const {
    return pImpl_->getAllStats();
}

std::vector<std::string> ConnectionManager::list() const {
    return pImpl_->list();
}

size_t ConnectionManager::size() const {
    return pImpl_->size();
}

PoolResult<bool> ConnectionManager::remove(const std::string& name) {
    return pImpl_->remove(name);
}

nlohmann::json ConnectionManager::healthReport() const {
    auto all_stats = getAllStats();

    nlohmann::json services = nlohmann::json::object();
    bool all_healthy = true;
    for (const auto& [name, stats] : all_stats) {
        bool healthy = stats.isHealthy();
        all_healthy = all_healthy && healthy;
        services[name] = {
            {"status", healthy ? "healthy" : "unhealthy"},
            {"healthy_percentage", stats.healthyPercentage()},
            {"ready_connections", stats.ready_count},
            {"total_connections", stats.pool_size}
        };
    }

    return {
        {"status", all_healthy ? "healthy" : "degraded"},
        {"services", services}
    };
}

PoolResult<bool> ConnectionManager::close() {
    return pImpl_->close();
}

} // namespace ipc
} // namespace rpcpool
