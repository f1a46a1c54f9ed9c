#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace Switchboard {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel { Auth, Dispatch, Events, Groups, Network, Registry, Sandbox, Transport };

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Auth:
            return "auth";
        case LogChannel::Dispatch:
            return "dispatch";
        case LogChannel::Events:
            return "events";
        case LogChannel::Groups:
            return "groups";
        case LogChannel::Network:
            return "network";
        case LogChannel::Registry:
            return "registry";
        case LogChannel::Sandbox:
            return "sandbox";
        case LogChannel::Transport:
            return "transport";
    }
    return "unknown";
}

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Provides named loggers for the dispatch subsystems so one path (e.g. group
 * fan-out) can be traced without flooding the log with the others.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for the log pattern (e.g., "sandbox")
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    /**
     * @brief Initialize the logging system from a JSON config file.
     * <configPath>.local, when present, is merged over <configPath>.
     * @return true if a config file was applied, false if built-in defaults were used
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from an override string.
     * @param overrides Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "groups:trace,dispatch:debug"
     *   "*:off,events:trace"
     */
    static void configureFromString(const std::string& overrides);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    struct Settings {
        spdlog::level::level_enum consoleLevel = spdlog::level::info;
        spdlog::level::level_enum fileLevel = spdlog::level::debug;
        bool consoleEnabled = true;
        bool fileEnabled = true;
        std::string logPath;
        bool truncate = true;
        // Zero selects a plain file sink instead of a rotating one.
        size_t maxSizeMb = 0;
        size_t maxFiles = 3;
        int flushIntervalMs = 1000;
        std::vector<std::pair<std::string, spdlog::level::level_enum>> channelLevels;
    };

    static Settings parseSettings(const nlohmann::json& config);
    static void install(const Settings& settings, const std::string& componentName);
    static void installDefaultLogger(const Settings& settings, const std::string& componentName);

    /**
     * @brief Load JSON config from file. A <configPath>.local file is merged over
     * it as a JSON merge patch. Returns an empty object when no usable file exists.
     */
    static nlohmann::json loadConfigFile(const std::string& configPath);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// Undefine any existing LOG_* macros (e.g., from libdatachannel).
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...)                                                        \
    SPDLOG_LOGGER_TRACE(                                                               \
        ::Switchboard::LoggingChannels::get(::Switchboard::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...)                                                        \
    SPDLOG_LOGGER_DEBUG(                                                               \
        ::Switchboard::LoggingChannels::get(::Switchboard::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...)                                                         \
    SPDLOG_LOGGER_INFO(                                                                \
        ::Switchboard::LoggingChannels::get(::Switchboard::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...)                                                         \
    SPDLOG_LOGGER_WARN(                                                                \
        ::Switchboard::LoggingChannels::get(::Switchboard::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...)                                                        \
    SPDLOG_LOGGER_ERROR(                                                               \
        ::Switchboard::LoggingChannels::get(::Switchboard::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace Switchboard
