#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace Switchboard {

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> regularFile(const fs::path& path)
{
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        return path;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<fs::path> ConfigLoader::getSearchPaths()
{
    std::vector<fs::path> paths;
    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(explicitConfigDir_.value());
    }

    const char* envDir = std::getenv("SWITCHBOARD_CONFIG_DIR");
    if (envDir && *envDir != '\0') {
        paths.emplace_back(envDir);
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "switchboard");
    }
    paths.emplace_back("/etc/switchboard");
    return paths;
}

std::optional<ConfigSource> ConfigLoader::findConfig(const std::string& filename)
{
    for (const auto& dir : getSearchPaths()) {
        ConfigSource source{ dir, regularFile(dir / filename), regularFile(dir / (filename + ".local")) };
        if (source.base || source.local) {
            return source;
        }
    }
    SLOG_DEBUG("ConfigLoader: {} not found in any search path", filename);
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJson(const ConfigSource& source)
{
    using JsonResult = Result<nlohmann::json, std::string>;

    nlohmann::json document = nlohmann::json::object();
    if (source.base) {
        auto base = readFile(source.base.value());
        if (base.isError()) {
            return base;
        }
        document = std::move(base.value());
    }

    if (source.local) {
        auto local = readFile(source.local.value());
        if (local.isError()) {
            return local;
        }
        if (source.base) {
            document.merge_patch(local.value());
            SLOG_INFO(
                "ConfigLoader: loading {} with overlay {}",
                source.base->string(),
                source.local->string());
        }
        else {
            document = std::move(local.value());
            SLOG_INFO("ConfigLoader: loading {}", source.local->string());
        }
    }
    else {
        SLOG_INFO("ConfigLoader: loading {}", source.base->string());
    }

    return JsonResult::okay(std::move(document));
}

Result<nlohmann::json, std::string> ConfigLoader::readFile(const fs::path& path)
{
    using JsonResult = Result<nlohmann::json, std::string>;

    std::ifstream file(path);
    if (!file.is_open()) {
        SLOG_WARN("ConfigLoader: cannot open {}", path.string());
        return JsonResult::error("Cannot open config file: " + path.string());
    }

    if (file.peek() == std::ifstream::traits_type::eof()) {
        SLOG_WARN("ConfigLoader: {} is empty", path.string());
        return JsonResult::error("Empty config file: " + path.string());
    }

    nlohmann::json document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        SLOG_ERROR("ConfigLoader: {} is not valid JSON", path.string());
        return JsonResult::error("Parse error in " + path.string());
    }
    return JsonResult::okay(std::move(document));
}

} // namespace Switchboard
