#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"

namespace skintone {
namespace analysis {

/**
 * @brief Downsamples a region into an N x N grid of mean colors
 *
 * Cell boundaries are x0 + i * width / N (integer division), so every cell
 * holds at least one pixel once the region is N x N or larger. Smaller or
 * out-of-image regions yield an empty signature.
 */
class FaceSignatureExtractor {
public:
    explicit FaceSignatureExtractor(const SignatureConfig& config = SignatureConfig());

    /**
     * @brief Extract the signature of a region
     * @param image Source image
     * @param region Region to summarize, clipped to the image
     * @return 3 * N * N values (R, G, B per cell, row-major), or empty
     */
    FaceSignature extract(const PixelBuffer& image, const FaceRegion& region) const;

    /**
     * @brief Extract the signature of the whole image
     */
    FaceSignature extract(const PixelBuffer& image) const {
        return extract(image, image.bounds());
    }

    /// Number of values in a complete signature
    size_t signatureLength() const;

    int gridSize() const { return config_.grid_size; }

    /**
     * @brief View a signature's cells as colors
     */
    static std::vector<RGBColor> cellColors(const FaceSignature& signature);

private:
    SignatureConfig config_;
};

} // namespace analysis
} // namespace skintone
