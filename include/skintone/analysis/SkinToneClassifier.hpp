#pragma once

#include "skintone/analysis/AnalysisConfig.hpp"
#include <cstdint>

namespace skintone {
namespace analysis {

/**
 * @brief Heuristic per-pixel skin predicate
 *
 * Broad RGB rule set covering light to dark skin: lower and upper channel
 * bounds, red not meaningfully below blue or green, a bounded red-green gap,
 * and a minimum channel spread that rejects gray pixels. Total over
 * [0,255]^3; (0,0,0) and (255,255,255) are never skin.
 *
 * Stateless apart from its thresholds; safe to share between threads.
 */
class SkinToneClassifier {
public:
    SkinToneClassifier() = default;
    explicit SkinToneClassifier(const SkinThresholds& thresholds) : thresholds_(thresholds) {}

    bool isSkin(int r, int g, int b) const;

    bool isSkin(const cv::Vec4b& rgba) const {
        return isSkin(rgba[0], rgba[1], rgba[2]);
    }

    bool isSkin(const RGBColor& color) const {
        return isSkin(color.r, color.g, color.b);
    }

    const SkinThresholds& thresholds() const { return thresholds_; }

private:
    SkinThresholds thresholds_;
};

} // namespace analysis
} // namespace skintone
