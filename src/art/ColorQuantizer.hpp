// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <array>
#include <string_view>

namespace asciiart::art
{

/// @brief One entry of the 16-color ANSI palette.
struct AnsiColor
{
    RgbColor rgb;            ///< Reference color used for matching.
    std::string_view name;   ///< Human-readable name.
    std::string_view escape; ///< Foreground SGR sequence selecting this color.
};

/// @brief The 16 basic ANSI foreground colors, in scan (and tie-break) order.
constexpr auto AnsiPalette = std::array<AnsiColor, 16> { {
    { { 0, 0, 0 }, "black", "\033[30m" },
    { { 128, 0, 0 }, "red", "\033[31m" },
    { { 0, 128, 0 }, "green", "\033[32m" },
    { { 128, 128, 0 }, "yellow", "\033[33m" },
    { { 0, 0, 128 }, "blue", "\033[34m" },
    { { 128, 0, 128 }, "magenta", "\033[35m" },
    { { 0, 128, 128 }, "cyan", "\033[36m" },
    { { 192, 192, 192 }, "white", "\033[37m" },
    { { 128, 128, 128 }, "bright black", "\033[90m" },
    { { 255, 0, 0 }, "bright red", "\033[91m" },
    { { 0, 255, 0 }, "bright green", "\033[92m" },
    { { 255, 255, 0 }, "bright yellow", "\033[93m" },
    { { 0, 0, 255 }, "bright blue", "\033[94m" },
    { { 255, 0, 255 }, "bright magenta", "\033[95m" },
    { { 0, 255, 255 }, "bright cyan", "\033[96m" },
    { { 255, 255, 255 }, "bright white", "\033[97m" },
} };

/// @brief SGR sequence resetting all attributes.
constexpr auto AnsiReset = std::string_view { "\033[0m" };

/// @brief Finds the palette entry closest to a color.
///
/// Linear scan by Euclidean RGB distance. Only a strictly smaller distance
/// replaces the current best, so on ties the earlier palette entry wins.
[[nodiscard]] auto nearestAnsiColor(RgbColor color) noexcept -> AnsiColor const&;

/// @brief Returns the escape sequence of the palette entry closest to (r, g, b).
[[nodiscard]] auto quantize(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept -> std::string_view;

} // namespace asciiart::art
