#ifndef RPCPOOL_UTILS_LOG_H
#define RPCPOOL_UTILS_LOG_H

#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <string>
#include <ctime>
#include <cctype>
#include <atomic>
#include <mutex>

namespace rpcpool {
namespace utils {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Default log level - can be overridden at compile time
// Example: -DRPCPOOL_LOG_LEVEL_DEFAULT=::rpcpool::utils::LogLevel::INFO
#ifndef RPCPOOL_LOG_LEVEL_DEFAULT
    #define RPCPOOL_LOG_LEVEL_DEFAULT ::rpcpool::utils::LogLevel::INFO
#endif

// Process-wide threshold; pools log from their repair threads as well
inline std::atomic<LogLevel>& maxLogLevel() {
    static std::atomic<LogLevel> level{RPCPOOL_LOG_LEVEL_DEFAULT};
    return level;
}

// Serializes writes so lines from concurrent pools never interleave
inline std::mutex& logOutputMutex() {
    static std::mutex mutex;
    return mutex;
}

inline void setLogLevel(LogLevel level) {
    maxLogLevel().store(level, std::memory_order_relaxed);
}

inline LogLevel getLogLevel() {
    return maxLogLevel().load(std::memory_order_relaxed);
}

inline bool isLogEnabled(LogLevel level) {
    return level >= getLogLevel();
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return "VERBOSE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name as found in configuration files
 *
 * Accepts the names printed by logLevelToString() in any case, plus
 * "warn" and "trace". Unknown names yield @p fallback.
 */
inline LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "VERBOSE" || upper == "TRACE") return LogLevel::VERBOSE;
    if (upper == "DEBUG")                       return LogLevel::DEBUG;
    if (upper == "INFO")                        return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN")  return LogLevel::WARNING;
    if (upper == "ERROR")                       return LogLevel::ERROR;
    if (upper == "FATAL")                       return LogLevel::FATAL;
    return fallback;
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return oss.str();
}

inline const char* extractFilename(const char* path) {
    const char* filename = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            filename = p + 1;
        }
    }
    return filename;
}

inline void log(LogLevel level, const char* file, int line, const std::string& message) {
    if (!isLogEnabled(level)) {
        return;
    }

    std::ostringstream line_out;
    line_out << '[' << getCurrentTimestamp() << "] [" << logLevelToString(level) << "] ["
             << extractFilename(file) << ':' << line << "] " << message << '\n';

    std::ostream& sink = level >= LogLevel::ERROR ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lock(logOutputMutex());
    sink << line_out.str() << std::flush;
}

} // namespace utils
} // namespace rpcpool

/**
 * @brief Log Level Filtering
 *
 * 1. Compile time (in CMakeLists.txt):
 *    add_compile_definitions(RPCPOOL_LOG_LEVEL_DEFAULT=::rpcpool::utils::LogLevel::WARNING)
 *
 * 2. Runtime:
 *    rpcpool::utils::setLogLevel(rpcpool::utils::LogLevel::DEBUG);
 *
 * Log levels (from lowest to highest):
 *   VERBOSE < DEBUG < INFO < WARNING < ERROR < FATAL
 */

#define LOGV(msg) ::rpcpool::utils::log(::rpcpool::utils::LogLevel::VERBOSE, __FILE__, __LINE__, msg)
#define LOGD(msg) ::rpcpool::utils::log(::rpcpool::utils::LogLevel::DEBUG, __FILE__, __LINE__, msg)
#define LOGI(msg) ::rpcpool::utils::log(::rpcpool::utils::LogLevel::INFO, __FILE__, __LINE__, msg)
#define LOGW(msg) ::rpcpool::utils::log(::rpcpool::utils::LogLevel::WARNING, __FILE__, __LINE__, msg)
#define LOGE(msg) ::rpcpool::utils::log(::rpcpool::utils::LogLevel::ERROR, __FILE__, __LINE__, msg)
#define LOGF(msg) ::rpcpool::utils::log(::rpcpool::utils::LogLevel::FATAL, __FILE__, __LINE__, msg)

// Stream-style formatting; the stream expression is not evaluated below the threshold
#define LOGV_FMT(msg) do { if (::rpcpool::utils::isLogEnabled(::rpcpool::utils::LogLevel::VERBOSE)) { \
    std::ostringstream _oss; _oss << msg; LOGV(_oss.str()); } } while (0)
#define LOGD_FMT(msg) do { if (::rpcpool::utils::isLogEnabled(::rpcpool::utils::LogLevel::DEBUG)) { \
    std::ostringstream _oss; _oss << msg; LOGD(_oss.str()); } } while (0)
#define LOGI_FMT(msg) do { if (::rpcpool::utils::isLogEnabled(::rpcpool::utils::LogLevel::INFO)) { \
    std::ostringstream _oss; _oss << msg; LOGI(_oss.str()); } } while (0)
#define LOGW_FMT(msg) do { if (::rpcpool::utils::isLogEnabled(::rpcpool::utils::LogLevel::WARNING)) { \
    std::ostringstream _oss; _oss << msg; LOGW(_oss.str()); } } while (0)
#define LOGE_FMT(msg) do { if (::rpcpool::utils::isLogEnabled(::rpcpool::utils::LogLevel::ERROR)) { \
    std::ostringstream _oss; _oss << msg; LOGE(_oss.str()); } } while (0)
#define LOGF_FMT(msg) do { if (::rpcpool::utils::isLogEnabled(::rpcpool::utils::LogLevel::FATAL)) { \
    std::ostringstream _oss; _oss << msg; LOGF(_oss.str()); } } while (0)

#endif // RPCPOOL_UTILS_LOG_H
