// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace asciiart::art
{

/// @brief Rows of display characters, top row first. All rows have the same length.
using CharGrid = std::vector<std::string>;

/// @brief Message shared by every conversion path that rejects an empty input.
constexpr auto EmptyGridMessage = "Image dimensions must be greater than zero.";

/// @brief Builds a character grid by mapping every sample of a width x height source.
///
/// This is the single validation gate for the brightness and edge paths.
///
/// @param width Number of columns; must be positive.
/// @param height Number of rows; must be positive.
/// @param sampleAt Callable (x, y) -> sample, visited in row-major order.
/// @param map Callable sample -> char.
/// @return `height` rows of `width` characters, or InvalidDimensions.
template <typename SampleAt, typename Mapper>
[[nodiscard]] auto buildGrid(std::uint32_t width, std::uint32_t height, SampleAt&& sampleAt, Mapper&& map)
    -> Result<CharGrid>
{
    if (width == 0 || height == 0)
        return makeError(ErrorCode::InvalidDimensions, EmptyGridMessage);

    auto grid = CharGrid {};
    grid.reserve(height);
    for (auto y = std::uint32_t { 0 }; y < height; ++y)
    {
        auto& row = grid.emplace_back();
        row.reserve(width);
        for (auto x = std::uint32_t { 0 }; x < width; ++x)
            row.push_back(map(sampleAt(x, y)));
    }
    return grid;
}

} // namespace asciiart::art
