#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"
#include "skintone/analysis/SkinToneClassifier.hpp"

namespace skintone {
namespace analysis {

/**
 * @brief Locates a face as the bounding box of skin-colored pixels
 *
 * Cheap geometric heuristic, not a trained detector:
 * - scans the candidate region on a stride grid and classifies each sample
 * - requires a minimum share of skin samples
 * - takes the inclusive bounding box of all skin samples
 * - rejects boxes with a non face-like aspect ratio (inclusive band),
 *   boxes below the minimum size and sparse boxes
 * - pads the accepted box and clamps it to the image
 *
 * Rejection is reported through FaceLocation::decision, never thrown.
 */
class FaceRegionLocator {
public:
    FaceRegionLocator(const LocatorConfig& config, const SkinToneClassifier& classifier);

    /**
     * @brief Locate the face region in an image
     * @param image Input RGBA image
     * @return Location with decision, padded region and skin statistics
     */
    FaceLocation locate(const PixelBuffer& image) const;

    /**
     * @brief Pixel rectangle scanned for the given image size
     */
    FaceRegion candidateRect(int width, int height) const;

    const LocatorConfig& config() const { return config_; }

private:
    FaceRegion padRegion(const FaceRegion& bounds, int width, int height) const;

    LocatorConfig config_;
    SkinToneClassifier classifier_;
};

} // namespace analysis
} // namespace skintone
