// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <art/Converter.hpp>
#include <art/DensityMapper.hpp>
#include <art/EdgeMapper.hpp>
#include <image/EdgeDetector.hpp>

namespace asciiart::art
{

namespace
{
    auto grayAt(image::GrayImage const& gray)
    {
        return [&gray](std::uint32_t x, std::uint32_t y) { return gray.pixel(x, y)[0]; };
    }
} // namespace

auto convertBrightness(image::GrayImage const& gray) -> Result<CharGrid>
{
    return buildGrid(gray.width, gray.height, grayAt(gray), mapBrightness);
}

auto convertEdgeMap(image::GrayImage const& edges) -> Result<CharGrid>
{
    return buildGrid(edges.width, edges.height, grayAt(edges), mapEdge);
}

auto detectAndConvert(image::GrayImage const& gray) -> Result<CharGrid>
{
    if (gray.empty())
        return makeError(ErrorCode::InvalidDimensions, EmptyGridMessage);

    auto const edges = image::detectEdges(gray);
    if (!edges)
        return std::unexpected(edges.error());

    log::debug("Canny edge map computed for {}x{}", edges->width, edges->height);
    return convertEdgeMap(*edges);
}

} // namespace asciiart::art
