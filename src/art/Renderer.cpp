// SPDX-License-Identifier: Apache-2.0
#include <art/ColorQuantizer.hpp>
#include <art/Renderer.hpp>

#include <format>

namespace asciiart::art
{

auto renderColored(CharGrid const& grid, image::RgbImage const& colors, tui::TerminalOutput& out, bool flushPerRow)
    -> VoidResult
{
    auto const height = grid.size();
    auto const width = grid.empty() ? std::size_t { 0 } : grid.front().size();
    if (height > colors.height || width > colors.width)
        return makeError(ErrorCode::InvalidDimensions,
                         std::format("Color source {}x{} is smaller than the character grid {}x{}",
                                     colors.width,
                                     colors.height,
                                     width,
                                     height));

    for (auto y = std::size_t { 0 }; y < height; ++y)
    {
        auto const& row = grid[y];
        if (row.size() != width)
            return makeError(ErrorCode::InvalidDimensions,
                             std::format("Row {} has {} characters, expected {}", y, row.size(), width));

        for (auto x = std::size_t { 0 }; x < width; ++x)
        {
            auto const p = colors.pixel(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y));
            out.writeRaw(quantize(p[0], p[1], p[2]));
            out.writeChar(row[x]);
        }
        out.writeReset();
        out.newLine();

        if (flushPerRow)
            if (auto result = out.flush(); !result)
                return result;
    }

    // Final reset in case the terminal is left mid-sequence by an abrupt exit.
    out.writeReset();
    if (flushPerRow)
        return out.flush();
    return {};
}

} // namespace asciiart::art
