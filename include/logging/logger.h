/**
 * @file logger.h
 * @brief Structured logging API for the conversion wrapper
 *
 * Provides a unified logging interface using spdlog.
 * Supports stderr output before the job paths are known, a rotating wrapper log
 * file afterwards, and configurable log levels.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace v2v_wrapper {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Very detailed debugging information
    Debug,     // Debug information
    Info,      // General information
    Warn,      // Warnings
    Error,     // Errors
    Critical,  // Critical errors
    Off        // Disable logging
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Debug;
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(50 * 1024 * 1024);  // 50 MB
    size_t maxBackups = 3;
    bool consoleOutput = false;
    bool stderrOutput = false;  // Console sink writes to stderr instead of stdout
    bool coloredOutput = false;
    std::string pattern = "%Y-%m-%d %H:%M:%S,%e:%^%L%$: %v (%s:%#)";
};

/**
 * @brief Initialize the logging system
 *
 * Replaces any previously installed logger. The wrapper calls this twice: once
 * with stderr output only and again when the wrapper log path is known.
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Early initialization with stderr output only
 *
 * Used while the job request is read and validated. Anything logged here is
 * visible to the caller that started the wrapper.
 *
 * @return true if initialization succeeded, false otherwise
 */
bool initializeEarly();

/**
 * @brief Shutdown the logging system
 *
 * Flushes all pending log messages and releases resources.
 */
void shutdown();

/**
 * @brief Set the global log level
 */
void setLevel(LogLevel level);

/**
 * @brief Get the current log level
 */
LogLevel getLevel();

/**
 * @brief Flush all pending log messages
 */
void flush();

/**
 * @brief Get the underlying spdlog logger
 *
 * For advanced use cases only.
 *
 * @return Shared pointer to spdlog logger
 */
std::shared_ptr<spdlog::logger> getLogger();

/**
 * @brief Convert LogLevel to string
 */
std::string_view levelToString(LogLevel level);

/**
 * @brief Convert string to LogLevel
 *
 * @param str Level name (case-insensitive)
 * @return Corresponding LogLevel, defaults to Debug if unknown
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace v2v_wrapper

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                   \
    do {                                                 \
        auto logger = v2v_wrapper::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_DEBUG(...)                                   \
    do {                                                 \
        auto logger = v2v_wrapper::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_INFO(...)                                    \
    do {                                                 \
        auto logger = v2v_wrapper::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_WARN(...)                                    \
    do {                                                 \
        auto logger = v2v_wrapper::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_ERROR(...)                                   \
    do {                                                 \
        auto logger = v2v_wrapper::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);    \
    } while (0)

/**
 * @brief Log a critical error message
 *
 * Reserved for conditions that leave the state file unable to report the job
 * outcome.
 */
#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = v2v_wrapper::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

/**
 * @brief Log at most once
 *
 * Useful for repeated conditions in the output loop.
 */
#define LOG_ONCE(level, ...)                                         \
    do {                                                             \
        static std::atomic<bool> loggedOnce{false};                  \
        bool expected = false;                                       \
        if (loggedOnce.compare_exchange_strong(expected, true)) {    \
            LOG_##level(__VA_ARGS__);                                \
        }                                                            \
    } while (0)
