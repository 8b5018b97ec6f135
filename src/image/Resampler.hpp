// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <image/Image.hpp>

#include <cstdint>

namespace asciiart::image
{

/// @brief Terminal cells are about twice as tall as they are wide; the target
/// height is divided by this so the art keeps the picture's proportions.
constexpr auto CellAspectCompression = 2.0;

/// @brief The two co-sized buffers the character mappers and the renderer consume.
struct ProcessedImage
{
    GrayImage gray; ///< Luma of the resized image.
    RgbImage color; ///< The resized image with alpha dropped.
};

/// @brief Largest width or height preprocessImage() will produce.
constexpr auto MaxTargetDimension = std::uint64_t { 32767 };

/// @brief Resizes an image to exactly the given dimensions with OpenCV's Lanczos filter.
///
/// Both target dimensions must be non-zero and at most MaxTargetDimension; the
/// source must not be empty.
[[nodiscard]] auto resizeExact(RgbaImage const& source, std::uint32_t width, std::uint32_t height) -> RgbaImage;

/// @brief Converts to 8-bit luma using Rec. 709 weights; alpha is ignored.
[[nodiscard]] auto toGrayscale(RgbaImage const& source) -> GrayImage;

/// @brief Drops the alpha channel.
[[nodiscard]] auto toRgb(RgbaImage const& source) -> RgbImage;

/// @brief Computes the character-grid height for a given width.
///
/// round(targetWidth * height / width / 2), never less than 1. The result is
/// 64-bit so that extreme aspect ratios cannot overflow.
/// @pre targetWidth, sourceWidth and sourceHeight are all non-zero.
[[nodiscard]] auto targetHeightFor(std::uint32_t targetWidth, std::uint32_t sourceWidth, std::uint32_t sourceHeight)
    -> std::uint64_t;

/// @brief Resizes an image to the output width and derives the gray and color buffers.
/// @param source The decoded image.
/// @param targetWidth Output width in characters.
/// @return Co-sized buffers, or InvalidDimensions for a zero target width, an empty
///         source, or a target larger than MaxTargetDimension in either direction.
[[nodiscard]] auto preprocessImage(RgbaImage const& source, std::uint32_t targetWidth) -> Result<ProcessedImage>;

} // namespace asciiart::image
