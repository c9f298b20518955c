#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"

namespace skintone {
namespace io {

/**
 * @brief Brings uploaded photos to a consistent size and color balance
 *
 * 1. Downscale so the longer side is at most max_dimension (aspect kept,
 *    shorter side floor-rounded). Smaller images are left as is.
 * 2. contrast around mid-gray, then brightness, then saturation, with the
 *    CSS filter-effects matrices. Alpha is untouched.
 */
class ImageNormalizer {
public:
    explicit ImageNormalizer(const analysis::NormalizationConfig& config = analysis::NormalizationConfig());

    /**
     * @brief Normalize an image; returns a copy when disabled
     */
    analysis::PixelBuffer normalize(const analysis::PixelBuffer& image) const;

    /// Target size for an input of the given size
    cv::Size targetSize(int width, int height) const;

    /**
     * @brief Combined 4x5 color matrix (RGBA rows, offset column)
     */
    cv::Matx<float, 4, 5> colorMatrix() const;

private:
    analysis::NormalizationConfig config_;
};

} // namespace io
} // namespace skintone
