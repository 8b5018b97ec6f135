// SPDX-License-Identifier: Apache-2.0
#include "Pipeline.hpp"

#include <core/Log.hpp>

#include <art/Converter.hpp>
#include <image/ImageLoader.hpp>

#include <format>
#include <utility>

namespace asciiart
{

auto runPipeline(std::string_view imagePath, std::uint32_t width, RenderMode mode) -> Result<PipelineOutput>
{
    auto decoded = image::loadImage(imagePath);
    if (!decoded)
        return std::unexpected(decoded.error());

    auto processed = image::preprocessImage(*decoded, width);
    if (!processed)
        return std::unexpected(processed.error());

    log::debug("Converting in {} mode", renderModeToString(mode));

    auto grid = Result<art::CharGrid> {};
    switch (mode)
    {
        case RenderMode::Standard: grid = art::convertBrightness(processed->gray); break;
        case RenderMode::Edge:
            grid = art::detectAndConvert(processed->gray);
            if (!grid)
                return makeError(grid.error().code, std::format("Edge detection failed: {}", grid.error().message));
            break;
    }
    if (!grid)
        return std::unexpected(grid.error());

    return PipelineOutput { .processed = std::move(*processed), .grid = std::move(*grid) };
}

} // namespace asciiart
