// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <image/Image.hpp>

namespace asciiart::image
{

/// @brief Thresholds for Canny hysteresis, in gradient-magnitude units.
struct CannyThresholds
{
    double low = 50.0;
    double high = 100.0;
};

/// @brief Gaussian smoothing applied before computing gradients.
constexpr auto CannyBlurSigma = 1.4;

/// @brief Runs the Canny edge detector.
///
/// Gaussian blur, then OpenCV's Canny with a 3x3 Sobel aperture and L2
/// gradient magnitude.
///
/// @param gray The input luma image; must not be empty.
/// @param thresholds Weak/strong edge thresholds; `low` must not exceed `high`.
/// @return An image of the same size whose samples are exactly 0 or 255.
[[nodiscard]] auto detectEdges(GrayImage const& gray, CannyThresholds thresholds = {}) -> Result<GrayImage>;

} // namespace asciiart::image
