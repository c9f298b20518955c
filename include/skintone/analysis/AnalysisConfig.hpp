#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include <string>

namespace skintone {
namespace core {
class Configuration;
}

namespace analysis {

/**
 * @brief Per-pixel skin classifier thresholds
 *
 * A pixel is skin when every channel lies strictly between its lower and
 * upper bound and all tolerance rules hold.
 */
struct SkinThresholds {
    int min_red = 60;
    int min_green = 40;
    int min_blue = 20;
    int max_channel = 250;            ///< Upper bound for every channel (exclusive)
    int red_blue_tolerance = 10;      ///< r > b - tolerance
    int max_red_green_gap = 50;       ///< |r - g| < gap
    int red_green_tolerance = 10;     ///< r > g - tolerance
    int min_channel_spread = 10;      ///< max pairwise channel difference must exceed this; 0 disables
};

/**
 * @brief Face region locator configuration
 */
struct LocatorConfig {
    cv::Rect2f candidate_region{0.0f, 0.0f, 1.0f, 1.0f}; ///< Scanned area, normalized to image size
    int scan_stride = 1;                ///< Sample every Nth pixel in x and y
    float min_skin_ratio = 0.01f;       ///< Minimum skin share of scanned pixels
    float min_aspect_ratio = 0.5f;      ///< Inclusive lower bound of width/height
    float max_aspect_ratio = 2.0f;      ///< Inclusive upper bound of width/height
    float min_box_density = 0.2f;       ///< Minimum skin share inside the bounding box
    int min_region_size = 10;           ///< Minimum bounding box side in pixels
    float pad_fraction = 0.5f;          ///< Padding per side as a fraction of max(width, height)
};

/**
 * @brief Signature grid configuration
 */
struct SignatureConfig {
    int grid_size = 5;                  ///< N for the N x N cell grid
};

/**
 * @brief Undertone classifier configuration
 *
 * Bands are ordered on the red-blue margin: below cool_red_blue_margin is
 * cool, at or above warm_red_blue_margin (with enough red over green) is warm.
 */
struct UndertoneConfig {
    size_t min_samples = 50;
    float median_weight = 0.7f;         ///< Mean receives 1 - median_weight
    int warm_red_blue_margin = 30;
    int warm_red_green_margin = 15;
    int cool_red_blue_margin = 15;
    bool include_signature_samples = true;
};

/**
 * @brief Consistency cache configuration
 */
struct CacheConfig {
    size_t capacity = 5;
    float similarity_threshold = 80.0f; ///< Lookup accepts similarity strictly above this
    float similarity_scale = 0.4f;      ///< Score = max(0, 100 - meanAbsDiff * scale)
};

/**
 * @brief Palette mapper configuration
 */
struct PaletteConfig {
    uint32_t hash_modulus = 1000000;
    bool hash_central_cells_only = false;   ///< Hash only the central half of the cells
    SeasonalPalette fallback_palette = SeasonalPalette::SUMMER;
};

/**
 * @brief Advisory face validation thresholds
 */
struct ValidationConfig {
    int analysis_max_dimension = 300;
    float min_image_aspect = 0.5f;
    float max_image_aspect = 1.8f;
    float min_skin_ratio = 0.15f;
    float min_color_variation = 10.0f;
    float max_color_variation = 100.0f;
    float min_center_skin_ratio = 0.3f;
    float center_to_edge_factor = 1.5f;
};

/**
 * @brief Input normalization applied by the image collaborator
 */
struct NormalizationConfig {
    bool enabled = true;
    int max_dimension = 600;
    float contrast = 1.1f;
    float brightness = 1.05f;
    float saturation = 0.95f;
};

/**
 * @brief Every tunable threshold of the analysis pipeline
 */
struct AnalysisConfig {
    SkinThresholds skin;
    LocatorConfig locator;
    SignatureConfig signature;
    UndertoneConfig undertone;
    CacheConfig cache;
    PaletteConfig palette;
    ValidationConfig validation;
    NormalizationConfig normalization;

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief Build an AnalysisConfig from a configuration document
 *
 * Absent keys keep their defaults.
 * @throws core::ConfigurationException if a value has the wrong type or the
 *         resulting configuration does not validate
 */
AnalysisConfig loadAnalysisConfig(const core::Configuration& config);

} // namespace analysis
} // namespace skintone
