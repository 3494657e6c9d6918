/**
 * @file settings.h
 * @brief Settings store and mapping of settings onto pool configuration
 */

#ifndef RPCPOOL_CONFIG_SETTINGS_H
#define RPCPOOL_CONFIG_SETTINGS_H

#include "ipc/connection_manager.h"
#include "ipc/connection_pool.h"
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace rpcpool {

/**
 * @brief Thrown for malformed configuration input
 */
class SettingsException : public std::runtime_error {
public:
    explicit SettingsException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Thread-safe key-value settings with dotted keys
 *
 * Settings are loaded from a JSON document, where nested objects become
 * dotted keys ({"pool": {"size": 8}} -> "pool.size" = "8"), and can be
 * overlaid with environment variables. Values are stored as strings and
 * converted by the typed getters.
 *
 * Thread-safety: All methods are thread-safe using read-write locks.
 */
class Settings {
public:
    /**
     * @brief Environment lookup, returns std::nullopt when unset
     */
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    Settings();
    Settings(const Settings& other);
    Settings& operator=(const Settings& other);

    /**
     * @brief Parse a JSON document and merge it into these settings
     * @throws SettingsException if the text is not a JSON object
     */
    void loadJsonString(const std::string& text);

    /**
     * @brief Load a JSON file and merge it into these settings
     *
     * A missing file is not an error: a warning is logged and nothing is
     * merged.
     *
     * @return true if the file was read
     * @throws SettingsException if the file exists but is malformed
     */
    bool loadJsonFile(const std::string& path);

    /**
     * @brief Overlay environment variables
     *
     * For every known or configured service, <SERVICE>_GRPC_ADDR (e.g.
     * ORDER_GRPC_ADDR for "order-service") sets services.<name>.target.
     * GRPC_POOL_SIZE sets pool.size.
     *
     * @param lookup Environment accessor (defaults to std::getenv)
     */
    void applyEnvironment(const EnvLookup& lookup = processEnvironment());

    void set(const std::string& key, const std::string& value);

    bool has(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @throws SettingsException if the value is present but not an integer
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @throws SettingsException if the value is present but not a boolean
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Integer value interpreted as milliseconds
     */
    std::chrono::milliseconds getMillis(const std::string& key,
                                        std::chrono::milliseconds defaultValue) const;

    /**
     * @brief All keys, sorted
     */
    std::vector<std::string> keys() const;

    /**
     * @brief Distinct names directly below "<prefix>."
     *
     * With keys "services.a.target" and "services.b.target",
     * childNames("services") yields {"a", "b"}.
     */
    std::vector<std::string> childNames(const std::string& prefix) const;

    size_t size() const;

    /**
     * @brief Accessor for the real process environment
     */
    static EnvLookup processEnvironment();

private:
    std::map<std::string, std::string> values_;
    mutable std::shared_mutex mutex_;
};

/**
 * @brief Downstream services provisioned when not listed in configuration
 */
const std::vector<std::string>& knownServices();

/**
 * @brief Environment variable holding the address of @p service
 *
 * "order-service" -> "ORDER_GRPC_ADDR"
 */
std::string serviceAddressVariable(const std::string& service);

/**
 * @brief Template pool configuration from the "pool.*" keys
 *
 * The target is left empty; it is filled per service.
 *
 * @throws SettingsException if a value is malformed
 */
ipc::PoolConfig poolConfigFromSettings(const Settings& settings);

/**
 * @brief Service name to target map from "services.<name>.target"
 *
 * Every known service is listed; services without a target map to an
 * empty string and are skipped when pools are provisioned.
 */
ipc::ServiceTargets serviceTargetsFromSettings(const Settings& settings);

/**
 * @brief Complete pool configuration per service
 *
 * Starts from poolConfigFromSettings() and applies per-service overrides
 * found under "services.<name>.": target, pool_size, use_tls,
 * tls_root_certs and tls_server_name. Configuring tls_root_certs for a
 * service enables TLS for it unless use_tls is set explicitly.
 *
 * @throws SettingsException if a value is malformed
 */
ipc::ServicePoolConfigs servicePoolConfigsFromSettings(const Settings& settings);

} // namespace rpcpool

#endif // RPCPOOL_CONFIG_SETTINGS_H
