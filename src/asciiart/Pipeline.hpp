// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <art/CharGrid.hpp>
#include <image/Resampler.hpp>

#include <cstdint>
#include <string_view>

namespace asciiart
{

/// @brief What the conversion stage hands to the renderer.
struct PipelineOutput
{
    image::ProcessedImage processed; ///< Co-sized gray and color buffers.
    art::CharGrid grid;              ///< Characters, same dimensions as the buffers.
};

/// @brief Decodes, resizes and converts an image to characters.
///
/// The first failing step aborts the run; nothing is rendered.
/// @param imagePath The PNG or JPEG file to convert.
/// @param width Output width in characters.
/// @param mode Brightness ramp or Canny edges.
[[nodiscard]] auto runPipeline(std::string_view imagePath, std::uint32_t width, RenderMode mode)
    -> Result<PipelineOutput>;

} // namespace asciiart
