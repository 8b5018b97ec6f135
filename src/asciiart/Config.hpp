// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace asciiart
{

/// @brief Settings for one conversion run.
///
/// Built from the optional config file, then overridden by command-line flags.
struct AppConfig
{
    /// @brief Image file to convert.
    std::string imagePath;

    /// @brief Requested output width in characters. Unset means auto-detect.
    std::optional<std::uint32_t> width;

    /// @brief Conversion mode name ("standard" or "edge"); validated when the run starts.
    std::string mode = "standard";

    /// @brief Enables debug logging regardless of logLevel.
    bool verbose = false;

    /// @brief Log verbosity when not verbose.
    log::Level logLevel = log::Level::Info;
};

/// @brief Loads the configuration from the default config path.
///
/// A missing file is not an error and yields the defaults.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @param path The path to the config file; it must exist.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Returns the default config directory path.
/// $XDG_CONFIG_HOME/asciiart, else ~/.config/asciiart, else ".".
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace asciiart
