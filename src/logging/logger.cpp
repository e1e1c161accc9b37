/**
 * @file logger.cpp
 * @brief Implementation of structured logging for mp3sanitize
 */

#include "logging/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace mp3sanitize {
namespace logging {

namespace {

// Global logger instance
std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::info;
    }
}

std::string toLower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower;
}

// Build sinks for `config` and make the result the process logger. Caller holds g_init_mutex.
bool installLogger(const LogConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (stderr; stdout carries usage/version text only)
        if (config.consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(toSpdlogLevel(config.level));
            if (!config.coloredOutput) {
                console_sink->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console_sink);
        }

        // Rotating file sink
        if (!config.filePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            file_sink->set_level(toSpdlogLevel(config.level));
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("mp3sanitize", sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(config.level));
        logger->set_pattern(config.pattern);

        // A cancelled or failed file must be visible even if the process dies right after
        logger->flush_on(spdlog::level::warn);

        if (g_logger) {
            g_logger->flush();
        }
        g_logger = logger;
        spdlog::set_default_logger(g_logger);
        g_initialized.store(true, std::memory_order_release);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    // Replaces any logger created lazily before the configuration was known
    if (!installLogger(config)) {
        return false;
    }
    if (!config.filePath.empty()) {
        LOG_DEBUG("Log file: {} (max {}MB x {} backups)", config.filePath,
                  config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

std::shared_ptr<spdlog::logger> getLogger() {
    // Fast path: already initialized (no lock)
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!g_initialized.load(std::memory_order_acquire) && !installLogger(LogConfig{})) {
        return nullptr;
    }
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    default:
        return "info";
    }
}

LogLevel stringToLevel(std::string_view str) {
    const std::string lower = toLower(str);

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;

    return LogLevel::Info;  // Default
}

bool isValidLevelName(std::string_view str) {
    const std::string lower = toLower(str);
    static const char* const kNames[] = {"trace", "debug", "info",     "warn",  "warning", "error",
                                         "err",   "critical", "fatal", "off",   "none"};
    return std::any_of(std::begin(kNames), std::end(kNames),
                       [&lower](const char* name) { return lower == name; });
}

}  // namespace logging
}  // namespace mp3sanitize
