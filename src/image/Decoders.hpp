// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <image/Image.hpp>

#include <cstdio>
#include <string_view>

// Format backends used by loadImage(). The file is positioned at its start.
namespace asciiart::image::detail
{

[[nodiscard]] auto decodePng(std::FILE* file, std::string_view path) -> Result<RgbaImage>;

[[nodiscard]] auto decodeJpeg(std::FILE* file, std::string_view path) -> Result<RgbaImage>;

} // namespace asciiart::image::detail
