// SPDX-License-Identifier: Apache-2.0
#include <art/DensityMapper.hpp>

#include <algorithm>
#include <cmath>

namespace asciiart::art
{

auto mapBrightness(std::uint8_t brightness) noexcept -> char
{
    constexpr auto LastIndex = static_cast<long>(DensityRamp.size() - 1);
    auto const scaled = static_cast<float>(brightness) / 255.0f * static_cast<float>(LastIndex);
    auto const index = std::clamp(std::lround(scaled), 0L, LastIndex);
    return DensityRamp[static_cast<std::size_t>(index)];
}

} // namespace asciiart::art
