// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace asciiart::image
{

/// @brief Interleaved 8-bit image buffer, row-major, top row first.
/// @tparam Channels Samples per pixel (1 = gray, 3 = RGB, 4 = RGBA).
template <std::size_t Channels>
struct ImageBuffer
{
    static constexpr auto ChannelCount = Channels;

    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> samples; ///< width * height * Channels bytes.

    /// @brief Creates a zero-filled image.
    [[nodiscard]] static auto blank(std::uint32_t width, std::uint32_t height) -> ImageBuffer
    {
        return ImageBuffer { .width = width,
                             .height = height,
                             .samples = std::vector<std::uint8_t>(std::size_t { width } * height * Channels) };
    }

    /// @brief Creates an image where every pixel has the given value.
    [[nodiscard]] static auto filled(std::uint32_t width,
                                     std::uint32_t height,
                                     std::array<std::uint8_t, Channels> const& pixel) -> ImageBuffer
    {
        auto image = blank(width, height);
        for (auto i = std::size_t { 0 }; i < image.samples.size(); i += Channels)
            for (auto c = std::size_t { 0 }; c < Channels; ++c)
                image.samples[i + c] = pixel[c];
        return image;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return width == 0 || height == 0; }

    [[nodiscard]] auto offset(std::uint32_t x, std::uint32_t y) const noexcept -> std::size_t
    {
        return (std::size_t { y } * width + x) * Channels;
    }

    [[nodiscard]] auto pixel(std::uint32_t x, std::uint32_t y) const noexcept -> std::span<const std::uint8_t, Channels>
    {
        return std::span<const std::uint8_t, Channels>(samples.data() + offset(x, y), Channels);
    }

    [[nodiscard]] auto pixel(std::uint32_t x, std::uint32_t y) noexcept -> std::span<std::uint8_t, Channels>
    {
        return std::span<std::uint8_t, Channels>(samples.data() + offset(x, y), Channels);
    }
};

using GrayImage = ImageBuffer<1>;
using RgbImage = ImageBuffer<3>;
using RgbaImage = ImageBuffer<4>;

} // namespace asciiart::image
