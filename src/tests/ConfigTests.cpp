// SPDX-License-Identifier: Apache-2.0
#include <asciiart/Config.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace asciiart;

namespace
{
/// @brief Writes a config file to the temp directory and returns its path.
auto writeTempConfig(std::string const& name, std::string const& content) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << content;
    return path;
}
} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("asciiart/config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.imagePath.empty());
    CHECK(!config.width.has_value());
    CHECK(config.mode == "standard");
    CHECK(config.verbose == false);
    CHECK(config.logLevel == log::Level::Info);
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = writeTempConfig("asciiart_test_config.json", R"({
        "width": 100,
        "mode": "edge",
        "verbose": true,
        "logLevel": "warning",
        "unrelated": [1, 2, 3]
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;
    CHECK(config.width == 100u);
    CHECK(config.mode == "edge");
    CHECK(config.verbose == true);
    CHECK(config.logLevel == log::Level::Warning);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects an unknown logLevel", "[config]")
{
    auto const tempPath = writeTempConfig("asciiart_test_config_level.json", R"({ "logLevel": "loud" })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for missing keys", "[config]")
{
    auto const tempPath = writeTempConfig("asciiart_test_config_empty.json", "{}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(!result->width.has_value());
    CHECK(result->mode == "standard");
    CHECK(result->verbose == false);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps an unknown mode for the run to reject", "[config]")
{
    auto const tempPath = writeTempConfig("asciiart_test_config_mode.json", R"({ "mode": "sketch" })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->mode == "sketch");

    auto const mode = parseRenderMode(result->mode);
    REQUIRE(!mode.has_value());
    CHECK(mode.error().code == ErrorCode::UnknownMode);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects a negative width", "[config]")
{
    auto const tempPath = writeTempConfig("asciiart_test_config_width.json", R"({ "width": -5 })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(result.error().message.find("width") != std::string::npos);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects a non-object document", "[config]")
{
    auto const tempPath = writeTempConfig("asciiart_test_config_array.json", "[80]");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/tmp/asciiart_nonexistent_config_12345.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("asciiart_test_invalid.json", "{ invalid json }");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("parseRenderMode accepts the two mode names", "[config]")
{
    CHECK(parseRenderMode("standard") == RenderMode::Standard);
    CHECK(parseRenderMode("edge") == RenderMode::Edge);

    auto const invalid = parseRenderMode("invalid");
    REQUIRE(!invalid.has_value());
    CHECK(invalid.error().message == "Unknown mode 'invalid'. Use 'standard' or 'edge'.");
}

TEST_CASE("log::parseLevel recognizes level names", "[config][log]")
{
    CHECK(log::parseLevel("debug") == log::Level::Debug);
    CHECK(log::parseLevel("warn") == log::Level::Warning);
    CHECK(log::parseLevel("warning") == log::Level::Warning);
    CHECK(!log::parseLevel("loud").has_value());
    CHECK(log::levelName(log::Level::Error) == "error");
}

TEST_CASE("log::formatLine: stderr prefixes", "[config][log]")
{
    CHECK(log::formatLine(log::Level::Error, "Could not find image file \"x.png\".")
          == "Could not find image file \"x.png\".");
    CHECK(log::formatLine(log::Level::Warning, "Unable to detect terminal size; defaulting to 80 characters.")
          == "Warning: Unable to detect terminal size; defaulting to 80 characters.");
    CHECK(log::formatLine(log::Level::Info, "plain") == "plain");
    CHECK(log::formatLine(log::Level::Debug, "Decoded") == "[debug] Decoded");
}
