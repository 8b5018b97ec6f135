// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <image/Image.hpp>

#include <string_view>

namespace asciiart::image
{

/// @brief Container formats recognized by their leading magic bytes.
enum class ImageFormat : std::uint8_t
{
    Unknown,
    Png,
    Jpeg,
};

/// @brief Identifies the container format from the first bytes of a file.
/// @param header At least the first 8 bytes of the file, if that many exist.
[[nodiscard]] auto detectFormat(std::span<const std::uint8_t> header) -> ImageFormat;

/// @brief Reads and decodes a PNG or JPEG file into an 8-bit RGBA buffer.
///
/// Grayscale, palette and 16-bit PNGs are normalized to RGBA; JPEGs get an
/// opaque alpha channel.
///
/// @param path The image file to read.
/// @return The decoded image, or FileNotFound, UnsupportedFormat, DecodeFailed or IoError.
[[nodiscard]] auto loadImage(std::string_view path) -> Result<RgbaImage>;

} // namespace asciiart::image
