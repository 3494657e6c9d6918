/**
 * @file settings.cpp
 * @brief JSON and environment backed settings for rpcpool
 */

#include "config/settings.h"
#include "utils/log.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <mutex>
#include <set>

namespace rpcpool {

using json = nlohmann::json;

namespace {

void flatten(const json& node, const std::string& prefix, std::map<std::string, std::string>& out) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
            flatten(it.value(), key, out);
        }
        return;
    }

    if (node.is_null()) {
        return;
    }
    if (node.is_string()) {
        out[prefix] = node.get<std::string>();
    } else {
        // Numbers, booleans and arrays keep their JSON spelling
        out[prefix] = node.dump();
    }
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

Settings::Settings() = default;

Settings::Settings(const Settings& other) {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    values_ = other.values_;
}

Settings& Settings::operator=(const Settings& other) {
    if (this != &other) {
        std::unique_lock<std::shared_mutex> lock1(mutex_, std::defer_lock);
        std::shared_lock<std::shared_mutex> lock2(other.mutex_, std::defer_lock);
        std::lock(lock1, lock2);
        values_ = other.values_;
    }
    return *this;
}

void Settings::loadJsonString(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw SettingsException(std::string("Invalid settings JSON: ") + e.what());
    }

    if (!document.is_object()) {
        throw SettingsException("Settings JSON must be an object");
    }

    std::map<std::string, std::string> flat;
    flatten(document, "", flat);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& [key, value] : flat) {
        values_[key] = std::move(value);
    }
}

bool Settings::loadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOGW_FMT("Settings file not found: " << path << ", using defaults");
        return false;
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    try {
        loadJsonString(text);
    } catch (const SettingsException& e) {
        throw SettingsException(path + ": " + e.what());
    }

    LOGI_FMT("Loaded settings from " << path);
    return true;
}

void Settings::applyEnvironment(const EnvLookup& lookup) {
    std::set<std::string> services(knownServices().begin(), knownServices().end());
    for (const auto& name : childNames("services")) {
        services.insert(name);
    }

    for (const auto& service : services) {
        auto value = lookup(serviceAddressVariable(service));
        if (value && !value->empty()) {
            LOGD_FMT("Target of " << service << " taken from " << serviceAddressVariable(service));
            set("services." + service + ".target", *value);
        }
    }

    auto pool_size = lookup("GRPC_POOL_SIZE");
    if (pool_size && !pool_size->empty()) {
        set("pool.size", *pool_size);
    }
}

void Settings::set(const std::string& key, const std::string& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    values_[key] = value;
}

bool Settings::has(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return values_.find(key) != values_.end();
}

std::string Settings::getString(const std::string& key, const std::string& defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return defaultValue;
    }
    return it->second;
}

int Settings::getInt(const std::string& key, int defaultValue) const {
    std::string raw;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return defaultValue;
        }
        raw = it->second;
    }

    try {
        size_t consumed = 0;
        int value = std::stoi(raw, &consumed);
        if (consumed != raw.size()) {
            throw SettingsException("Setting " + key + " is not an integer: " + raw);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw SettingsException("Setting " + key + " is not an integer: " + raw);
    } catch (const std::out_of_range&) {
        throw SettingsException("Setting " + key + " is out of range: " + raw);
    }
}

bool Settings::getBool(const std::string& key, bool defaultValue) const {
    std::string raw = toLower(getString(key, ""));
    if (raw.empty()) {
        return defaultValue;
    }
    if (raw == "true" || raw == "1" || raw == "yes" || raw == "on") {
        return true;
    }
    if (raw == "false" || raw == "0" || raw == "no" || raw == "off") {
        return false;
    }
    throw SettingsException("Setting " + key + " is not a boolean: " + raw);
}

std::chrono::milliseconds Settings::getMillis(const std::string& key,
                                              std::chrono::milliseconds defaultValue) const {
    if (!has(key)) {
        return defaultValue;
    }
    return std::chrono::milliseconds(getInt(key));
}

std::vector<std::string> Settings::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& entry : values_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<std::string> Settings::childNames(const std::string& prefix) const {
    const std::string head = prefix + ".";
    std::set<std::string> names;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto it = values_.lower_bound(head);
         it != values_.end() && it->first.compare(0, head.size(), head) == 0; ++it) {
        std::string rest = it->first.substr(head.size());
        names.insert(rest.substr(0, rest.find('.')));
    }
    return std::vector<std::string>(names.begin(), names.end());
}

size_t Settings::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return values_.size();
}

Settings::EnvLookup Settings::processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

const std::vector<std::string>& knownServices() {
    static const std::vector<std::string> services = {
        "user-service",
        "product-service",
        "order-service",
        "payment-service",
        "inventory-service",
        "notification-service"
    };
    return services;
}

std::string serviceAddressVariable(const std::string& service) {
    static const std::string suffix = "-service";

    std::string base = service;
    if (base.size() > suffix.size() &&
        base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0) {
        base.erase(base.size() - suffix.size());
    }

    std::string variable;
    variable.reserve(base.size() + 10);
    for (char c : base) {
        variable.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return variable + "_GRPC_ADDR";
}

ipc::PoolConfig poolConfigFromSettings(const Settings& settings) {
    ipc::PoolConfig config;
    config.pool_size = settings.getInt("pool.size", config.pool_size);
    config.keepalive_time = settings.getMillis("pool.keepalive_time_ms", config.keepalive_time);
    config.keepalive_timeout = settings.getMillis("pool.keepalive_timeout_ms", config.keepalive_timeout);
    config.max_connection_idle = settings.getMillis("pool.max_connection_idle_ms",
                                                    config.max_connection_idle);
    config.max_connection_age = settings.getMillis("pool.max_connection_age_ms",
                                                   config.max_connection_age);
    config.max_connection_age_grace = settings.getMillis("pool.max_connection_age_grace_ms",
                                                         config.max_connection_age_grace);
    config.repair_interval = settings.getMillis("pool.repair_interval_ms", config.repair_interval);
    config.max_message_size = settings.getInt("pool.max_message_size", config.max_message_size);
    config.use_tls = settings.getBool("pool.use_tls", config.use_tls);
    config.tls_root_certs_path = settings.getString("pool.tls_root_certs", config.tls_root_certs_path);
    config.tls_server_name = settings.getString("pool.tls_server_name", config.tls_server_name);

    if (config.repair_interval.count() <= 0) {
        throw SettingsException("pool.repair_interval_ms must be positive");
    }
    return config;
}

ipc::ServiceTargets serviceTargetsFromSettings(const Settings& settings) {
    ipc::ServiceTargets targets;
    for (const auto& service : knownServices()) {
        targets[service] = "";
    }
    for (const auto& service : settings.childNames("services")) {
        targets[service] = "";
    }

    for (auto& [service, target] : targets) {
        target = settings.getString("services." + service + ".target", "");
    }
    return targets;
}

ipc::ServicePoolConfigs servicePoolConfigsFromSettings(const Settings& settings) {
    const ipc::PoolConfig base = poolConfigFromSettings(settings);

    ipc::ServicePoolConfigs configs;
    for (const auto& [service, target] : serviceTargetsFromSettings(settings)) {
        const std::string prefix = "services." + service + ".";

        ipc::PoolConfig config = base;
        config.target = target;
        config.pool_size = settings.getInt(prefix + "pool_size", config.pool_size);
        config.tls_root_certs_path = settings.getString(prefix + "tls_root_certs",
                                                        config.tls_root_certs_path);
        config.tls_server_name = settings.getString(prefix + "tls_server_name",
                                                    config.tls_server_name);
        config.use_tls = settings.getBool(prefix + "use_tls",
                                          config.use_tls || settings.has(prefix + "tls_root_certs"));

        configs.emplace(service, std::move(config));
    }
    return configs;
}

} // namespace rpcpool
