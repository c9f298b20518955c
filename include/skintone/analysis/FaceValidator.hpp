#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"
#include "skintone/analysis/SkinToneClassifier.hpp"
#include <string>

namespace skintone {
namespace analysis {

/// First failed check of the face validation advisory
enum class ValidationIssue {
    NONE,
    EMPTY_IMAGE,
    IMAGE_ASPECT_RATIO,
    INSUFFICIENT_SKIN,
    COLOR_VARIATION,
    SKIN_DISTRIBUTION
};

/**
 * @brief Outcome of the face validation advisory
 */
struct FaceValidation {
    bool is_valid = false;
    ValidationIssue issue = ValidationIssue::EMPTY_IMAGE;
    std::string message;                ///< User-facing explanation

    // Measurements, filled as far as the checks got
    float image_aspect = 0.0f;
    float skin_ratio = 0.0f;
    float color_variation = 0.0f;
    float center_skin_ratio = 0.0f;
    float edge_skin_ratio = 0.0f;
};

/**
 * @brief Heuristic "does this look like a portrait" check run before upload
 *
 * Checks, in order, on a copy scaled so its longer side is
 * analysis_max_dimension:
 * 1. image aspect ratio within [min_image_aspect, max_image_aspect]
 * 2. skin share of all pixels >= min_skin_ratio
 * 3. color variation within [min_color_variation, max_color_variation]
 * 4. central disc skinnier than the border
 *
 * Advisory only; the analysis pipeline never consults it.
 */
class FaceValidator {
public:
    FaceValidator(const ValidationConfig& config, const SkinToneClassifier& classifier);

    FaceValidation validate(const PixelBuffer& image) const;

    /**
     * @brief Mean absolute RGB step between every 4th pixel
     *
     * Sum of |dR| + |dG| + |dB| between consecutive samples, divided by
     * pixel_count / 16.
     */
    static float colorVariation(const cv::Mat& rgba);

    static std::string issueToString(ValidationIssue issue);
    static std::string issueMessage(ValidationIssue issue);

private:
    cv::Mat analysisCopy(const PixelBuffer& image) const;
    float skinRatio(const cv::Mat& rgba) const;
    void skinDistribution(const cv::Mat& rgba, float& center_ratio, float& edge_ratio) const;

    ValidationConfig config_;
    SkinToneClassifier classifier_;
};

} // namespace analysis
} // namespace skintone
