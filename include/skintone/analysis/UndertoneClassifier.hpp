#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"
#include "skintone/analysis/SkinToneClassifier.hpp"
#include <vector>

namespace skintone {
namespace analysis {

/**
 * @brief Classifies skin undertone from skin-colored samples
 *
 * The central color is a blend of the brightness median (robust against
 * glare and shadow pixels) and the plain mean. Rules on the blended color:
 * - warm:    R - B >= warm_red_blue_margin and R - G >= warm_red_green_margin
 * - cool:    R - B <  cool_red_blue_margin, or B >= G
 * - neutral: everything in between
 *
 * Fewer than min_samples skin samples yields neutral with
 * sufficient_samples == false.
 */
class UndertoneClassifier {
public:
    UndertoneClassifier(const UndertoneConfig& config, const SkinToneClassifier& classifier);

    /**
     * @brief Gather skin samples from an image region and a signature
     * @param image Source image
     * @param region Region whose pixels are sampled, clipped to the image
     * @param signature Cells are appended as virtual samples when enabled
     */
    std::vector<RGBColor> collectSamples(const PixelBuffer& image,
                                         const FaceRegion& region,
                                         const FaceSignature& signature) const;

    /**
     * @brief Classify a set of already collected samples
     */
    UndertoneEstimate classify(std::vector<RGBColor> samples) const;

    /**
     * @brief Collect and classify in one step
     */
    UndertoneEstimate estimate(const PixelBuffer& image,
                               const FaceRegion& region,
                               const FaceSignature& signature) const {
        return classify(collectSamples(image, region, signature));
    }

    /**
     * @brief Apply the warm/cool/neutral rules to one color
     */
    Undertone classifyColor(const RGBColor& color) const;

private:
    UndertoneConfig config_;
    SkinToneClassifier classifier_;
};

} // namespace analysis
} // namespace skintone
