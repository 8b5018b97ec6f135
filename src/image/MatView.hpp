// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <image/Image.hpp>

#include <opencv2/core.hpp>

namespace asciiart::image::detail
{

/// @brief Returns a cv::Mat header over an image buffer's samples without copying.
///
/// The buffer must outlive the header and must not be resized while it is in use.
template <std::size_t Channels>
auto matView(ImageBuffer<Channels>& image) -> cv::Mat
{
    return cv::Mat(static_cast<int>(image.height),
                   static_cast<int>(image.width),
                   CV_8UC(static_cast<int>(Channels)),
                   image.samples.data());
}

/// @brief Read-only variant; OpenCV has no const Mat header, so callers must not write through it.
template <std::size_t Channels>
auto matView(ImageBuffer<Channels> const& image) -> cv::Mat
{
    return cv::Mat(static_cast<int>(image.height),
                   static_cast<int>(image.width),
                   CV_8UC(static_cast<int>(Channels)),
                   const_cast<std::uint8_t*>(image.samples.data()));
}

} // namespace asciiart::image::detail
