// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <format>
#include <string_view>

namespace asciiart
{

/// @brief An 8-bit RGB color without alpha.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    constexpr auto operator==(RgbColor const&) const -> bool = default;
};

/// @brief How pixels are turned into characters.
enum class RenderMode : std::uint8_t
{
    Standard, ///< Brightness mapped onto the density ramp.
    Edge,     ///< Canny edges drawn as '#', everything else blank.
};

/// @brief Converts a RenderMode to the name used on the command line.
[[nodiscard]] constexpr auto renderModeToString(RenderMode mode) -> std::string_view
{
    switch (mode)
    {
        case RenderMode::Standard: return "standard";
        case RenderMode::Edge: return "edge";
    }
    return "unknown";
}

/// @brief Parses a mode name given on the command line or in the config file.
/// @return The mode, or an UnknownMode error naming the offending value.
[[nodiscard]] inline auto parseRenderMode(std::string_view name) -> Result<RenderMode>
{
    if (name == "standard")
        return RenderMode::Standard;
    if (name == "edge")
        return RenderMode::Edge;
    return makeError(ErrorCode::UnknownMode, std::format("Unknown mode '{}'. Use 'standard' or 'edge'.", name));
}

} // namespace asciiart
