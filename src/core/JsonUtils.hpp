// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Error.hpp"

namespace asciiart::json
{

/// @brief Parses a JSON document, returning a Result.
/// @param input The JSON text to parse.
/// @param origin Where the text came from, used in the error message.
/// @return The parsed JSON value or a ConfigError.
[[nodiscard]] inline auto parse(std::string_view input, std::string_view origin) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ConfigError, std::format("Invalid JSON in \"{}\": {}", origin, e.what()));
    }
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional boolean field from a JSON object.
[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue)
    -> bool
{
    auto keyStr = std::string(key);
    if (obj.contains(keyStr) && obj[keyStr].is_boolean())
        return obj[keyStr].get<bool>();
    return defaultValue;
}

/// @brief Extracts an optional unsigned 32-bit field from a JSON object.
///
/// Missing keys yield std::nullopt. Present keys that are not non-negative
/// integers in range yield a ConfigError naming the key.
[[nodiscard]] inline auto getOptionalUint(const nlohmann::json& obj, std::string_view key)
    -> Result<std::optional<std::uint32_t>>
{
    auto keyStr = std::string(key);
    if (!obj.contains(keyStr) || obj[keyStr].is_null())
        return std::optional<std::uint32_t> {};

    auto const& value = obj[keyStr];
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0
        || value.get<std::int64_t>() > static_cast<std::int64_t>(UINT32_MAX))
        return makeError(ErrorCode::ConfigError, std::format("Config field \"{}\" must be a non-negative integer", key));
    return std::optional<std::uint32_t> { value.get<std::uint32_t>() };
}

} // namespace asciiart::json
