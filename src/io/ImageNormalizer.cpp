#include "skintone/io/ImageNormalizer.hpp"
#include "skintone/core/Logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace skintone {
namespace io {

namespace {

// Rec. 709 luminance weights used by the saturate() filter
constexpr float LUMA_R = 0.213f;
constexpr float LUMA_G = 0.715f;
constexpr float LUMA_B = 0.072f;

} // namespace

ImageNormalizer::ImageNormalizer(const analysis::NormalizationConfig& config)
    : config_(config) {
}

cv::Size ImageNormalizer::targetSize(int width, int height) const {
    const int max_size = config_.max_dimension;
    if (max_size <= 0) {
        return cv::Size(width, height);
    }

    if (width > height) {
        if (width > max_size) {
            height = static_cast<int>(static_cast<double>(height) * max_size / width);
            width = max_size;
        }
    } else if (height > max_size) {
        width = static_cast<int>(static_cast<double>(width) * max_size / height);
        height = max_size;
    }
    return cv::Size(std::max(1, width), std::max(1, height));
}

cv::Matx<float, 4, 5> ImageNormalizer::colorMatrix() const {
    const float c = config_.contrast;
    const float b = config_.brightness;
    const float s = config_.saturation;

    const cv::Matx33f saturate(
        LUMA_R + (1.0f - LUMA_R) * s, LUMA_G - LUMA_G * s,          LUMA_B - LUMA_B * s,
        LUMA_R - LUMA_R * s,          LUMA_G + (1.0f - LUMA_G) * s, LUMA_B - LUMA_B * s,
        LUMA_R - LUMA_R * s,          LUMA_G - LUMA_G * s,          LUMA_B + (1.0f - LUMA_B) * s);

    // contrast: v * c + 127.5 * (1 - c), then brightness: v * b
    const float gain = c * b;
    const float offset = 127.5f * (1.0f - c) * b;

    cv::Matx<float, 4, 5> m = cv::Matx<float, 4, 5>::zeros();
    for (int i = 0; i < 3; ++i) {
        float row_offset = 0.0f;
        for (int j = 0; j < 3; ++j) {
            m(i, j) = saturate(i, j) * gain;
            row_offset += saturate(i, j) * offset;
        }
        m(i, 4) = row_offset;
    }
    m(3, 3) = 1.0f;
    return m;
}

analysis::PixelBuffer ImageNormalizer::normalize(const analysis::PixelBuffer& image) const {
    if (image.empty() || !config_.enabled) {
        return image;
    }

    cv::Mat working = image.mat();
    const cv::Size target = targetSize(image.width(), image.height());
    if (target.width != image.width() || target.height != image.height()) {
        cv::Mat resized;
        cv::resize(working, resized, target, 0, 0, cv::INTER_AREA);
        working = resized;
        LOG_DEBUG("Normalizer: resized " + std::to_string(image.width()) + "x" + std::to_string(image.height()) +
                  " to " + std::to_string(target.width) + "x" + std::to_string(target.height));
    }

    cv::Mat adjusted;
    cv::transform(working, adjusted, cv::Mat(colorMatrix()));

    return analysis::PixelBuffer::fromMat(adjusted, false);
}

} // namespace io
} // namespace skintone
