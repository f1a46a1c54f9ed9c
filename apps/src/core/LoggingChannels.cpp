#include "LoggingChannels.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>

namespace Switchboard {

namespace {

constexpr const char* kDefaultLogPath = "switchboard.log";

constexpr std::array<LogChannel, 8> kAllChannels = {
    LogChannel::Auth,     LogChannel::Dispatch, LogChannel::Events,  LogChannel::Groups,
    LogChannel::Network,  LogChannel::Registry, LogChannel::Sandbox, LogChannel::Transport,
};

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

constexpr std::array<LevelName, 9> kLevelNames = { {
    { "trace", spdlog::level::trace },
    { "debug", spdlog::level::debug },
    { "info", spdlog::level::info },
    { "warn", spdlog::level::warn },
    { "warning", spdlog::level::warn },
    { "error", spdlog::level::err },
    { "err", spdlog::level::err },
    { "critical", spdlog::level::critical },
    { "off", spdlog::level::off },
} };

std::mutex& initMutex()
{
    static std::mutex mutex;
    return mutex;
}

// Transport logs every frame at debug, so it starts quieter than the rest.
spdlog::level::level_enum defaultLevel(LogChannel channel)
{
    return channel == LogChannel::Transport ? spdlog::level::warn : spdlog::level::info;
}

std::string patternFor(const std::string& componentName, bool withChannel)
{
    std::string pattern = "[%H:%M:%S.%e] ";
    if (componentName != "default") {
        pattern += "[" + componentName + "] ";
    }
    if (withChannel) {
        pattern += "[%n] ";
    }
    return pattern + "[%^%l%$] [%s:%#] %v";
}

std::string trimmed(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::shared_ptr<spdlog::sinks::sink> makeFileSink(
    const std::string& path, bool truncate, size_t maxSizeMb, size_t maxFiles)
{
    if (maxSizeMb > 0) {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, maxSizeMb * 1024 * 1024, maxFiles);
    }
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, truncate);
}

} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    Settings settings;
    settings.consoleLevel = consoleLevel;
    settings.fileLevel = fileLevel;
    settings.logPath = kDefaultLogPath;
    install(settings, componentName);

    initialized_ = true;
    SLOG_INFO("LoggingChannels initialized with defaults");
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    const nlohmann::json config = loadConfigFile(configPath);
    install(parseSettings(config), componentName);

    initialized_ = true;
    SLOG_INFO("LoggingChannels initialized from {}", config.empty() ? "defaults" : configPath);
    return !config.empty();
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Unit tests log before anyone initialized.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    return logger ? logger : spdlog::default_logger();
}

void LoggingChannels::configureFromString(const std::string& overrides)
{
    std::stringstream stream(overrides);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trimmed(item);
        if (item.empty()) {
            continue;
        }

        const auto colon = item.find(':');
        if (colon == std::string::npos) {
            spdlog::warn("Ignoring channel override without a level: {}", item);
            continue;
        }

        const std::string channel = trimmed(item.substr(0, colon));
        const auto level = parseLevelString(trimmed(item.substr(colon + 1)));
        if (channel != "*") {
            setChannelLevel(channel, level);
            continue;
        }
        for (LogChannel each : kAllChannels) {
            if (auto logger = spdlog::get(toString(each))) {
                logger->set_level(level);
            }
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Channel '{}' set to {}", channel, spdlog::level::to_string_view(level));
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    for (const auto& entry : kLevelNames) {
        if (lower == entry.name) {
            return entry.level;
        }
    }
    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

LoggingChannels::Settings LoggingChannels::parseSettings(const nlohmann::json& config)
{
    Settings settings;
    settings.logPath = kDefaultLogPath;

    try {
        const auto defaults = config.value("defaults", nlohmann::json::object());
        settings.consoleLevel = parseLevelString(defaults.value("console_level", "info"));
        settings.fileLevel = parseLevelString(defaults.value("file_level", "debug"));
        settings.flushIntervalMs = defaults.value("flush_interval_ms", 1000);

        const auto sinks = config.value("sinks", nlohmann::json::object());
        const auto console = sinks.value("console", nlohmann::json::object());
        settings.consoleEnabled = console.value("enabled", true);
        if (console.contains("level")) {
            settings.consoleLevel = parseLevelString(console["level"].get<std::string>());
        }

        const auto file = sinks.value("file", nlohmann::json::object());
        settings.fileEnabled = file.value("enabled", true);
        settings.logPath = file.value("path", std::string(kDefaultLogPath));
        settings.truncate = file.value("truncate", true);
        settings.maxSizeMb = file.value("max_size_mb", size_t{ 0 });
        settings.maxFiles = file.value("max_files", size_t{ 3 });
        if (file.contains("level")) {
            settings.fileLevel = parseLevelString(file["level"].get<std::string>());
        }

        const auto channels = config.value("channels", nlohmann::json::object());
        for (const auto& [channel, level] : channels.items()) {
            settings.channelLevels.emplace_back(channel, parseLevelString(level.get<std::string>()));
        }
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Malformed logging config ({}), using built-in defaults", e.what());
        settings = Settings{};
        settings.logPath = kDefaultLogPath;
    }

    return settings;
}

void LoggingChannels::install(const Settings& settings, const std::string& componentName)
{
    sharedSinks_.clear();
    if (settings.consoleEnabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(settings.consoleLevel);
        sharedSinks_.push_back(console);
    }
    if (settings.fileEnabled) {
        try {
            auto file = makeFileSink(
                settings.logPath, settings.truncate, settings.maxSizeMb, settings.maxFiles);
            file->set_level(settings.fileLevel);
            sharedSinks_.push_back(file);
        }
        catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", settings.logPath, e.what());
        }
    }

    const std::string pattern = patternFor(componentName, true);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    for (LogChannel channel : kAllChannels) {
        const std::string name = toString(channel);
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sharedSinks_.begin(), sharedSinks_.end());
        logger->set_level(defaultLevel(channel));
        spdlog::register_logger(logger);
    }
    for (const auto& [channel, level] : settings.channelLevels) {
        setChannelLevel(channel, level);
    }

    installDefaultLogger(settings, componentName);
    spdlog::flush_every(std::chrono::milliseconds(settings.flushIntervalMs));
}

void LoggingChannels::installDefaultLogger(const Settings& settings, const std::string& componentName)
{
    // Own sinks, so the default pattern can leave out the channel name.
    std::vector<spdlog::sink_ptr> sinks;
    if (settings.consoleEnabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(settings.consoleLevel);
        sinks.push_back(console);
    }
    if (settings.fileEnabled) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.logPath, false);
            file->set_level(settings.fileLevel);
            sinks.push_back(file);
        }
        catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", settings.logPath, e.what());
        }
    }

    const std::string pattern = patternFor(componentName, false);
    for (auto& sink : sinks) {
        sink->set_pattern(pattern);
    }

    const std::string name = componentName.empty() ? "default" : componentName;
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    const auto readJson = [](const std::string& path) -> std::optional<nlohmann::json> {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::nullopt;
        }
        nlohmann::json config = nlohmann::json::parse(file, nullptr, false);
        if (config.is_discarded() || !config.is_object()) {
            spdlog::error("Ignoring malformed logging config {}", path);
            return std::nullopt;
        }
        return config;
    };

    const std::string localPath = configPath + ".local";
    std::error_code ec;
    std::optional<nlohmann::json> config;
    if (fs::is_regular_file(configPath, ec)) {
        config = readJson(configPath);
    }
    if (fs::is_regular_file(localPath, ec)) {
        if (auto local = readJson(localPath)) {
            spdlog::info("Applying logging overrides from {}", localPath);
            if (config) {
                config->merge_patch(local.value());
            }
            else {
                config = std::move(local);
            }
        }
    }

    if (!config) {
        spdlog::info("Logging config {} not found, using built-in defaults", configPath);
        return nlohmann::json::object();
    }
    return config.value();
}

} // namespace Switchboard
