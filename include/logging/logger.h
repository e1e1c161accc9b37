/**
 * @file logger.h
 * @brief Structured logging API for mp3sanitize
 *
 * Provides a unified logging interface using spdlog.
 * Supports console (stderr) output, rotating file output, and configurable log levels.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Forward declare spdlog logger
namespace spdlog {
class logger;
}  // namespace spdlog

namespace mp3sanitize {
namespace logging {

/**
 * @brief Log level enumeration
 */
enum class LogLevel : std::uint8_t {
    Trace,     // Per-frame decisions
    Debug,     // Per-file details
    Info,      // Per-file outcome
    Warn,      // Skipped files
    Error,     // Failed files
    Critical,  // Filesystem left in a state needing manual recovery
    Off        // Disable logging
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                  // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);  // 5 MB
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Calling it again replaces the current logger, including one created lazily by getLogger().
 *
 * @param config Logging configuration
 * @return true if initialization succeeded, false otherwise
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Shutdown the logging system
 *
 * Flushes all pending log messages and releases resources.
 */
void shutdown();

/**
 * @brief Get the underlying spdlog logger
 *
 * Initializes with defaults on first use.
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
 * @return Corresponding LogLevel, defaults to Info if unknown
 */
LogLevel stringToLevel(std::string_view str);

/**
 * @brief Check whether a string names a log level
 */
bool isValidLevelName(std::string_view str);

}  // namespace logging
}  // namespace mp3sanitize

// Include spdlog for macro usage
#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                   \
    do {                                                 \
        auto logger = mp3sanitize::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_DEBUG(...)                                   \
    do {                                                 \
        auto logger = mp3sanitize::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_INFO(...)                                    \
    do {                                                 \
        auto logger = mp3sanitize::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_WARN(...)                                    \
    do {                                                 \
        auto logger = mp3sanitize::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);     \
    } while (0)

#define LOG_ERROR(...)                                   \
    do {                                                 \
        auto logger = mp3sanitize::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__);    \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = mp3sanitize::logging::getLogger(); \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)
