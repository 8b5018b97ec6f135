// SPDX-License-Identifier: Apache-2.0
#include <image/EdgeDetector.hpp>
#include <image/MatView.hpp>

#include <opencv2/imgproc.hpp>

#include <format>

namespace asciiart::image
{

auto detectEdges(GrayImage const& gray, CannyThresholds thresholds) -> Result<GrayImage>
{
    if (gray.empty())
        return makeError(ErrorCode::InvalidDimensions, "Input image has invalid dimensions.");

    try
    {
        auto blurred = cv::Mat {};
        cv::GaussianBlur(detail::matView(gray), blurred, cv::Size(0, 0), CannyBlurSigma);

        auto edges = GrayImage::blank(gray.width, gray.height);
        auto target = detail::matView(edges);
        cv::Canny(blurred, target, thresholds.low, thresholds.high, 3, true);
        return edges;
    }
    catch (cv::Exception const& e)
    {
        return makeError(ErrorCode::Unknown, std::format("Canny failed: {}", e.what()));
    }
}

} // namespace asciiart::image
