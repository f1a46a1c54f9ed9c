#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Where a config file was found: the first search directory holding
 * either the base file or its .local companion.
 */
struct ConfigSource {
    std::filesystem::path directory;
    std::optional<std::filesystem::path> base;
    std::optional<std::filesystem::path> local;
};

/**
 * @brief Loads JSON configuration files with multi-path search and .local overlays.
 *
 * Search order (first directory holding either file wins):
 * 1. Explicit config directory (if set via setConfigDir)
 * 2. $SWITCHBOARD_CONFIG_DIR
 * 3. ./config/ (CWD - for development)
 * 4. ~/.config/switchboard/
 * 5. /etc/switchboard/
 *
 * A .local file (e.g. sandbox.json.local) is applied to the base file as a JSON
 * merge patch, so it only needs the keys it changes. A .local file without a
 * base file is used on its own.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    /**
     * @brief Like load(), but a missing file yields the given defaults.
     * A file that exists and fails to parse is still an error.
     */
    template <typename T>
    static Result<T, std::string> loadOr(const std::string& filename, const T& defaults);

    static std::optional<ConfigSource> findConfig(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

    // Base document with the .local patch applied.
    static Result<nlohmann::json, std::string> readJson(const ConfigSource& source);

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> readFile(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> convert(const nlohmann::json& json, const std::string& filename);
};

template <typename T>
Result<T, std::string> ConfigLoader::convert(const nlohmann::json& json, const std::string& filename)
{
    try {
        T config;
        // Unqualified call so ADL finds the config type's from_json.
        from_json(json, config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + filename + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto source = findConfig(filename);
    if (!source.has_value()) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }

    auto jsonResult = readJson(source.value());
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return convert<T>(jsonResult.value(), filename);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOr(const std::string& filename, const T& defaults)
{
    auto source = findConfig(filename);
    if (!source.has_value()) {
        return Result<T, std::string>::okay(defaults);
    }

    auto jsonResult = readJson(source.value());
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }
    return convert<T>(jsonResult.value(), filename);
}

} // namespace Switchboard
