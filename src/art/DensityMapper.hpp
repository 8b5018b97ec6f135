// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstdint>

namespace asciiart::art
{

/// @brief Characters ordered by visual density, from blank to fullest.
constexpr auto DensityRamp = std::array<char, 10> { ' ', '.', ':', '-', '=', '+', '*', '#', '%', '@' };

/// @brief Maps a brightness sample onto the density ramp.
///
/// The byte range is spread evenly over the ramp: brightness / 255 * 9,
/// rounded half away from zero. 0 maps to ' ', 255 to '@', 127 to '='.
/// Non-decreasing in brightness.
[[nodiscard]] auto mapBrightness(std::uint8_t brightness) noexcept -> char;

} // namespace asciiart::art
