// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

namespace asciiart::art
{

/// @brief Character drawn for an edge pixel.
constexpr auto EdgeChar = '#';

/// @brief Character drawn for everything else.
constexpr auto BlankChar = ' ';

/// @brief Maps an edge-map sample: exactly 255 is an edge, any other value is blank.
[[nodiscard]] constexpr auto mapEdge(std::uint8_t value) noexcept -> char
{
    return value == 255 ? EdgeChar : BlankChar;
}

} // namespace asciiart::art
