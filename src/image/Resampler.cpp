// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <image/MatView.hpp>
#include <image/Resampler.hpp>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <new>

namespace asciiart::image
{

namespace
{
    // Rec. 709 luma weights for an RGBA pixel; alpha does not contribute.
    auto const Rec709Rgba = cv::Matx14f { 0.2126f, 0.7152f, 0.0722f, 0.0f };
} // namespace

auto resizeExact(RgbaImage const& source, std::uint32_t width, std::uint32_t height) -> RgbaImage
{
    auto result = RgbaImage::blank(width, height);
    auto target = detail::matView(result);
    cv::resize(detail::matView(source), target, target.size(), 0, 0, cv::INTER_LANCZOS4);
    return result;
}

auto toGrayscale(RgbaImage const& source) -> GrayImage
{
    auto gray = GrayImage::blank(source.width, source.height);
    auto target = detail::matView(gray);
    cv::transform(detail::matView(source), target, Rec709Rgba);
    return gray;
}

auto toRgb(RgbaImage const& source) -> RgbImage
{
    auto rgb = RgbImage::blank(source.width, source.height);
    auto target = detail::matView(rgb);
    cv::cvtColor(detail::matView(source), target, cv::COLOR_RGBA2RGB);
    return rgb;
}

auto targetHeightFor(std::uint32_t targetWidth, std::uint32_t sourceWidth, std::uint32_t sourceHeight)
    -> std::uint64_t
{
    auto const aspectRatio = static_cast<double>(sourceHeight) / static_cast<double>(sourceWidth);
    auto const height = std::round(aspectRatio * static_cast<double>(targetWidth) / CellAspectCompression);
    return static_cast<std::uint64_t>(std::max(1.0, height));
}

auto preprocessImage(RgbaImage const& source, std::uint32_t targetWidth) -> Result<ProcessedImage>
{
    if (targetWidth == 0)
        return makeError(ErrorCode::InvalidDimensions, "Target width must be greater than zero.");
    if (source.empty())
        return makeError(ErrorCode::InvalidDimensions, "Input image has invalid dimensions.");

    auto const targetHeight = targetHeightFor(targetWidth, source.width, source.height);
    if (targetWidth > MaxTargetDimension || targetHeight > MaxTargetDimension)
        return makeError(ErrorCode::InvalidDimensions,
                         std::format("Target size {}x{} exceeds the supported maximum of {} pixels per side.",
                                     targetWidth,
                                     targetHeight,
                                     MaxTargetDimension));

    auto const height = static_cast<std::uint32_t>(targetHeight);
    log::debug("Resizing {}x{} to {}x{}", source.width, source.height, targetWidth, height);

    try
    {
        auto const resized = resizeExact(source, targetWidth, height);
        return ProcessedImage { .gray = toGrayscale(resized), .color = toRgb(resized) };
    }
    catch (std::bad_alloc const&)
    {
        return makeError(ErrorCode::InvalidDimensions,
                         std::format("Not enough memory to resize to {}x{}.", targetWidth, height));
    }
    catch (cv::Exception const& e)
    {
        return makeError(ErrorCode::Unknown, std::format("Resize failed: {}", e.what()));
    }
}

} // namespace asciiart::image
