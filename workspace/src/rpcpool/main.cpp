/**
 * @file main.cpp
 * @brief rpcpool_monitor - provisions downstream service pools and reports their health
 *
 * Loads pool settings (JSON file plus <SERVICE>_GRPC_ADDR environment
 * overrides), creates one connection pool per configured downstream
 * service and prints the health report as JSON, either once or on an
 * interval until interrupted.
 *
 * Usage: rpcpool_monitor [--config FILE] [--once] [--interval-ms N]
 *
 * Exit codes: 0 healthy, 1 startup failure, 2 degraded (--once only)
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "config/settings.h"
#include "ipc/connection_manager.h"
#include "utils/log.h"

namespace {

std::atomic<bool> g_running{true};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

struct Options {
    std::string config_path = "config/rpcpool.json";
    bool once = false;
    std::chrono::milliseconds interval{10000};
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--once] [--interval-ms N]" << std::endl;
}

bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--interval-ms" && i + 1 < argc) {
            try {
                options.interval = std::chrono::milliseconds(std::stol(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid interval: " << argv[i] << std::endl;
                return false;
            }
            if (options.interval.count() <= 0) {
                std::cerr << "Interval must be positive" << std::endl;
                return false;
            }
        } else {
            return false;
        }
    }
    return true;
}

/**
 * Sleep for @p interval, waking early on shutdown
 */
void waitForNextReport(std::chrono::milliseconds interval) {
    auto until = std::chrono::steady_clock::now() + interval;
    while (g_running && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    rpcpool::Settings settings;
    rpcpool::ipc::ServicePoolConfigs services;
    try {
        settings.loadJsonFile(options.config_path);
        settings.applyEnvironment();

        rpcpool::utils::setLogLevel(
            rpcpool::utils::parseLogLevel(settings.getString("logging.level", "info")));

        services = rpcpool::servicePoolConfigsFromSettings(settings);
    } catch (const rpcpool::SettingsException& e) {
        LOGF_FMT("Invalid configuration: " << e.what());
        return 1;
    }

    rpcpool::ipc::ConnectionManager manager;

    // A required downstream that cannot be pooled is fatal at startup
    auto provisioned = manager.createCommonPools(services);
    if (!provisioned) {
        LOGF_FMT("Failed to create service pools: " << provisioned.error_message);
        auto closed = manager.close();
        if (!closed) {
            LOGE_FMT(closed.error_message);
        }
        return 1;
    }

    if (manager.size() == 0) {
        LOGW("No downstream service targets configured");
    } else {
        LOGI_FMT("Monitoring " << manager.size() << " service pools");
    }

    int exit_code = 0;
    while (true) {
        auto report = manager.healthReport();
        std::cout << report.dump(2) << std::endl;

        if (options.once) {
            exit_code = report["status"] == "healthy" ? 0 : 2;
            break;
        }

        waitForNextReport(options.interval);
        if (!g_running) {
            break;
        }
    }

    LOGI("Shutting down connection pools...");
    auto closed = manager.close();
    if (!closed) {
        LOGE_FMT(closed.error_message);
    }
    return exit_code;
}
