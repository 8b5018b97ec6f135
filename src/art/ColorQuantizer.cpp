// SPDX-License-Identifier: Apache-2.0
#include <art/ColorQuantizer.hpp>

#include <cmath>
#include <limits>

namespace asciiart::art
{

namespace
{
    auto distance(RgbColor a, RgbColor b) noexcept -> float
    {
        auto const dr = static_cast<float>(a.r) - static_cast<float>(b.r);
        auto const dg = static_cast<float>(a.g) - static_cast<float>(b.g);
        auto const db = static_cast<float>(a.b) - static_cast<float>(b.b);
        return std::sqrt(dr * dr + dg * dg + db * db);
    }
} // namespace

auto nearestAnsiColor(RgbColor color) noexcept -> AnsiColor const&
{
    auto const* best = &AnsiPalette.front();
    auto bestDistance = std::numeric_limits<float>::max();
    for (auto const& entry: AnsiPalette)
    {
        auto const d = distance(color, entry.rgb);
        if (d < bestDistance)
        {
            bestDistance = d;
            best = &entry;
        }
    }
    return *best;
}

auto quantize(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept -> std::string_view
{
    return nearestAnsiColor(RgbColor { r, g, b }).escape;
}

} // namespace asciiart::art
