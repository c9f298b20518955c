#pragma once

/**
 * @file SyntheticImages.hpp
 * @brief Synthetic test images drawn with OpenCV primitives
 */

#include <skintone/analysis/AnalysisTypes.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace skintone {
namespace synthetic {

/// RGBA scalar, alpha opaque
inline cv::Scalar rgb(int r, int g, int b) {
    return cv::Scalar(r, g, b, 255);
}

/// Typical warm skin color
inline cv::Scalar warmSkin() {
    return rgb(180, 140, 110);
}

/// Blank RGBA canvas
inline cv::Mat canvas(int width, int height, const cv::Scalar& color = rgb(0, 0, 0)) {
    return cv::Mat(height, width, CV_8UC4, color);
}

/// Filled rectangle on a canvas
inline void fillRect(cv::Mat& image, const cv::Rect& rect, const cv::Scalar& color) {
    cv::rectangle(image, rect, color, cv::FILLED);
}

/**
 * @brief Alternate two colors in 4-pixel wide vertical stripes inside a rect
 */
inline void stripeRect(cv::Mat& image, const cv::Rect& rect, const cv::Scalar& a, const cv::Scalar& b) {
    for (int x = rect.x; x < rect.x + rect.width; x += 4) {
        const int w = std::min(4, rect.x + rect.width - x);
        fillRect(image, cv::Rect(x, rect.y, w, rect.height), ((x / 4) % 2 == 0) ? a : b);
    }
}

/// Wrap an RGBA canvas
inline analysis::PixelBuffer toBuffer(const cv::Mat& rgba) {
    return analysis::PixelBuffer::fromMat(rgba, false);
}

} // namespace synthetic
} // namespace skintone
