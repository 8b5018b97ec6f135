// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <art/CharGrid.hpp>
#include <image/Image.hpp>

namespace asciiart::art
{

/// @brief Converts a luma image to a grid using the density ramp.
/// @return A grid matching the image dimensions, or InvalidDimensions for an empty image.
[[nodiscard]] auto convertBrightness(image::GrayImage const& gray) -> Result<CharGrid>;

/// @brief Converts a binary edge map (0 or 255 per sample) to a grid of '#' and ' '.
[[nodiscard]] auto convertEdgeMap(image::GrayImage const& edges) -> Result<CharGrid>;

/// @brief Runs Canny edge detection on a luma image and converts the result.
///
/// Empty images are rejected before detection runs.
[[nodiscard]] auto detectAndConvert(image::GrayImage const& gray) -> Result<CharGrid>;

} // namespace asciiart::art
