// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace asciiart
{

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/asciiart";
    auto const* const home = std::getenv("HOME");
    if (home && *home)
        return std::string(home) + "/.config/asciiart";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::debug("No config file at {}, using defaults", path);
        return AppConfig {};
    }
    return loadConfigFromFile(path);
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content, path);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));

    auto config = AppConfig {};

    auto width = json::getOptionalUint(root, "width");
    if (!width)
        return std::unexpected(width.error());
    config.width = *width;

    config.mode = json::getStringOr(root, "mode", config.mode);
    config.verbose = json::getBoolOr(root, "verbose", config.verbose);

    auto const levelText = json::getStringOr(root, "logLevel", log::levelName(config.logLevel));
    auto const level = log::parseLevel(levelText);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown logLevel \"{}\" in {}", levelText, path));
    config.logLevel = *level;

    log::debug("Loaded config from {}", path);
    return config;
}

} // namespace asciiart
