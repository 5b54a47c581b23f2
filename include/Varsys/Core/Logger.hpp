/**
 * @file Logger.hpp
 * @brief Diagnostic logging for Varsys components
 * @author Varsys Engineering
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 Varsys Systems. All rights reserved.
 * 
 * Thread-safe spdlog-backed logger with severity filtering, a rotating log
 * file and an optional host callback. This is the operational log; the
 * security audit trail of license and vault decisions is AccessLog.
 */

#pragma once

#ifndef VARSYS_CORE_LOGGER_HPP
#define VARSYS_CORE_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace spdlog {
class logger;
}

namespace Varsys {
namespace Core {

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    Trace = 0,      ///< Verbose tracing
    Debug = 1,      ///< Debug information for development
    Info = 2,       ///< General informational messages
    Warning = 3,    ///< Recoverable problems (fail-open decisions, weak secrets)
    Error = 4,      ///< Failed operations
    Critical = 5,   ///< Tamper detection and other security events
    Off = 255       ///< Disable all logging
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 *        "critical", "off"; case-insensitive, "warn" accepted)
 * @return Parsed level, or nullopt for an unknown name
 */
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/**
 * @brief Log output targets
 */
enum class LogOutput : uint8_t {
    None = 0,
    Console = 1 << 0,   ///< Colored output to stderr
    File = 1 << 1,      ///< Rotating log file
    Callback = 1 << 2,  ///< User-provided callback
    All = Console | File | Callback
};

inline LogOutput operator|(LogOutput a, LogOutput b) {
    return static_cast<LogOutput>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool hasFlag(LogOutput value, LogOutput flag) {
    return (static_cast<uint8_t>(value) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Log callback function type
 * @param level Severity level of the message
 * @param message Log message
 * @param timestamp Message timestamp
 */
using LogCallback = std::function<void(LogLevel level, std::string_view message,
                                       std::chrono::system_clock::time_point timestamp)>;

/**
 * @brief Process-wide logger
 * 
 * Until Initialize() is called every message is dropped (and counted as
 * such), so library code may log unconditionally.
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& Instance();

    /**
     * @brief Initialize the logger
     * @param minLevel Minimum log level to record
     * @param outputs Output targets (console, file, callback)
     * @param logFilePath Path to log file (required if File output enabled)
     * @param maxFileSizeMB Maximum log file size in MB before rotation
     * @return true on success, false if already initialized or a sink failed
     */
    bool Initialize(LogLevel minLevel = LogLevel::Info,
                    LogOutput outputs = LogOutput::Console,
                    const std::string& logFilePath = "",
                    size_t maxFileSizeMB = 10);

    /**
     * @brief Flush and release all sinks; Initialize() may be called again
     */
    void Shutdown();

    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    /**
     * @brief Set user callback for log messages (used with LogOutput::Callback)
     */
    void SetCallback(LogCallback callback);

    bool IsInitialized() const;

    /**
     * @brief Check if a log level is enabled
     */
    bool IsLevelEnabled(LogLevel level) const;

    /**
     * @brief Log a message at the specified level
     * @param level Severity level
     * @param message Message text
     * @param file Source file name (optional)
     * @param line Source line number (optional)
     */
    void Log(LogLevel level, std::string_view message,
             const char* file = nullptr, int line = 0);

    /**
     * @brief Log a printf-style formatted message
     */
    template<typename... Args>
    void LogFormat(LogLevel level, const char* format, Args&&... args) {
        if (!IsLevelEnabled(level)) return;

        char buffer[1024];
        int result = std::snprintf(buffer, sizeof(buffer), format, args...);

        if (result > 0 && static_cast<size_t>(result) < sizeof(buffer)) {
            Log(level, std::string_view(buffer, static_cast<size_t>(result)));
        } else if (result > 0) {
            std::string largeBuffer(static_cast<size_t>(result) + 1, '\0');
            std::snprintf(largeBuffer.data(), largeBuffer.size(), format, args...);
            largeBuffer.resize(static_cast<size_t>(result));
            Log(level, largeBuffer);
        }
    }

    void Flush();

    /**
     * @brief Number of messages logged at each level
     */
    struct Statistics {
        size_t trace;
        size_t debug;
        size_t info;
        size_t warning;
        size_t error;
        size_t critical;
        size_t dropped;  ///< Messages dropped due to level filtering
    };

    Statistics GetStatistics() const;
    void ResetStatistics();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel minLevel_ = LogLevel::Info;
    LogOutput outputs_ = LogOutput::Console;
    std::string logFilePath_;
    size_t maxFileSizeBytes_ = 10 * 1024 * 1024;
    LogCallback callback_;

    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> spdlogger_;
    bool initialized_ = false;

    mutable std::mutex statsMutex_;
    Statistics stats_{};
};

} // namespace Core
} // namespace Varsys

// ============================================================================
// Convenience Macros
// ============================================================================

#ifndef VARSYS_DISABLE_LOGGING

#define VARSYS_LOG_TRACE(msg) \
    ::Varsys::Core::Logger::Instance().Log(::Varsys::Core::LogLevel::Trace, msg, __FILE__, __LINE__)

#define VARSYS_LOG_DEBUG(msg) \
    ::Varsys::Core::Logger::Instance().Log(::Varsys::Core::LogLevel::Debug, msg, __FILE__, __LINE__)

#define VARSYS_LOG_INFO(msg) \
    ::Varsys::Core::Logger::Instance().Log(::Varsys::Core::LogLevel::Info, msg, __FILE__, __LINE__)

#define VARSYS_LOG_WARNING(msg) \
    ::Varsys::Core::Logger::Instance().Log(::Varsys::Core::LogLevel::Warning, msg, __FILE__, __LINE__)

#define VARSYS_LOG_ERROR(msg) \
    ::Varsys::Core::Logger::Instance().Log(::Varsys::Core::LogLevel::Error, msg, __FILE__, __LINE__)

#define VARSYS_LOG_CRITICAL(msg) \
    ::Varsys::Core::Logger::Instance().Log(::Varsys::Core::LogLevel::Critical, msg, __FILE__, __LINE__)

#define VARSYS_LOG_DEBUG_F(fmt, ...) \
    ::Varsys::Core::Logger::Instance().LogFormat(::Varsys::Core::LogLevel::Debug, fmt, __VA_ARGS__)

#define VARSYS_LOG_INFO_F(fmt, ...) \
    ::Varsys::Core::Logger::Instance().LogFormat(::Varsys::Core::LogLevel::Info, fmt, __VA_ARGS__)

#define VARSYS_LOG_WARNING_F(fmt, ...) \
    ::Varsys::Core::Logger::Instance().LogFormat(::Varsys::Core::LogLevel::Warning, fmt, __VA_ARGS__)

#define VARSYS_LOG_ERROR_F(fmt, ...) \
    ::Varsys::Core::Logger::Instance().LogFormat(::Varsys::Core::LogLevel::Error, fmt, __VA_ARGS__)

#define VARSYS_LOG_CRITICAL_F(fmt, ...) \
    ::Varsys::Core::Logger::Instance().LogFormat(::Varsys::Core::LogLevel::Critical, fmt, __VA_ARGS__)

#else
#define VARSYS_LOG_TRACE(msg) ((void)0)
#define VARSYS_LOG_DEBUG(msg) ((void)0)
#define VARSYS_LOG_INFO(msg) ((void)0)
#define VARSYS_LOG_WARNING(msg) ((void)0)
#define VARSYS_LOG_ERROR(msg) ((void)0)
#define VARSYS_LOG_CRITICAL(msg) ((void)0)
#define VARSYS_LOG_DEBUG_F(fmt, ...) ((void)0)
#define VARSYS_LOG_INFO_F(fmt, ...) ((void)0)
#define VARSYS_LOG_WARNING_F(fmt, ...) ((void)0)
#define VARSYS_LOG_ERROR_F(fmt, ...) ((void)0)
#define VARSYS_LOG_CRITICAL_F(fmt, ...) ((void)0)
#endif // VARSYS_DISABLE_LOGGING

#endif // VARSYS_CORE_LOGGER_HPP
