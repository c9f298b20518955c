#include "skintone/analysis/AnalysisConfig.hpp"
#include "skintone/core/Configuration.hpp"
#include "skintone/core/exception.h"
#include <sstream>
#include <iomanip>

namespace skintone {
namespace analysis {

bool AnalysisConfig::validate() const {
    // Skin thresholds
    if (skin.min_red < 0 || skin.min_green < 0 || skin.min_blue < 0) return false;
    if (skin.max_channel > 256) return false;
    if (skin.min_red >= skin.max_channel || skin.min_green >= skin.max_channel ||
        skin.min_blue >= skin.max_channel) return false;
    if (skin.max_red_green_gap <= 0 || skin.min_channel_spread < 0) return false;

    // Locator
    const cv::Rect2f& roi = locator.candidate_region;
    if (roi.x < 0.0f || roi.y < 0.0f || roi.width <= 0.0f || roi.height <= 0.0f) return false;
    if (roi.x + roi.width > 1.0f + 1e-6f || roi.y + roi.height > 1.0f + 1e-6f) return false;
    if (locator.scan_stride < 1) return false;
    if (locator.min_skin_ratio < 0.0f || locator.min_skin_ratio > 1.0f) return false;
    if (locator.min_aspect_ratio <= 0.0f || locator.max_aspect_ratio < locator.min_aspect_ratio) return false;
    if (locator.min_box_density < 0.0f || locator.min_box_density > 1.0f) return false;
    if (locator.min_region_size < 1 || locator.pad_fraction < 0.0f) return false;

    // Signature must be extractable from any accepted region
    if (signature.grid_size < 1 || signature.grid_size > locator.min_region_size) return false;

    // Undertone bands must be ordered
    if (undertone.median_weight < 0.0f || undertone.median_weight > 1.0f) return false;
    if (undertone.cool_red_blue_margin > undertone.warm_red_blue_margin) return false;

    // Cache
    if (cache.capacity == 0) return false;
    if (cache.similarity_threshold < 0.0f || cache.similarity_threshold > 100.0f) return false;
    if (cache.similarity_scale <= 0.0f) return false;

    // Palette
    if (palette.hash_modulus < 100) return false;

    // Validation
    if (validation.analysis_max_dimension < 1) return false;
    if (validation.min_image_aspect <= 0.0f || validation.max_image_aspect < validation.min_image_aspect) return false;
    if (validation.min_color_variation > validation.max_color_variation) return false;

    // Normalization
    if (normalization.max_dimension < 1) return false;
    if (normalization.contrast < 0.0f || normalization.brightness < 0.0f || normalization.saturation < 0.0f) return false;

    return true;
}

std::string AnalysisConfig::toString() const {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << "AnalysisConfig{";
    ss << "skin=[r>" << skin.min_red << ", g>" << skin.min_green << ", b>" << skin.min_blue
       << ", max<" << skin.max_channel << ", rb_tol=" << skin.red_blue_tolerance
       << ", rg_gap<" << skin.max_red_green_gap << ", rg_tol=" << skin.red_green_tolerance
       << ", spread>" << skin.min_channel_spread << "]";
    ss << ", locator=[stride=" << locator.scan_stride
       << ", min_skin_ratio=" << locator.min_skin_ratio
       << ", aspect=" << locator.min_aspect_ratio << ".." << locator.max_aspect_ratio
       << ", min_density=" << locator.min_box_density
       << ", min_size=" << locator.min_region_size
       << ", pad=" << locator.pad_fraction << "]";
    ss << ", grid=" << signature.grid_size;
    ss << ", undertone=[min_samples=" << undertone.min_samples
       << ", median_weight=" << undertone.median_weight
       << ", warm_rb>=" << undertone.warm_red_blue_margin
       << ", warm_rg>=" << undertone.warm_red_green_margin
       << ", cool_rb<" << undertone.cool_red_blue_margin << "]";
    ss << ", cache=[capacity=" << cache.capacity
       << ", threshold=" << cache.similarity_threshold
       << ", scale=" << cache.similarity_scale << "]";
    ss << ", palette=[modulus=" << palette.hash_modulus
       << ", central_only=" << (palette.hash_central_cells_only ? "true" : "false")
       << ", fallback=" << paletteToString(palette.fallback_palette) << "]";
    ss << "}";
    return ss.str();
}

AnalysisConfig loadAnalysisConfig(const core::Configuration& config) {
    AnalysisConfig out;

    SkinThresholds& skin = out.skin;
    skin.min_red = config.get<int>("skin.min_red", skin.min_red);
    skin.min_green = config.get<int>("skin.min_green", skin.min_green);
    skin.min_blue = config.get<int>("skin.min_blue", skin.min_blue);
    skin.max_channel = config.get<int>("skin.max_channel", skin.max_channel);
    skin.red_blue_tolerance = config.get<int>("skin.red_blue_tolerance", skin.red_blue_tolerance);
    skin.max_red_green_gap = config.get<int>("skin.max_red_green_gap", skin.max_red_green_gap);
    skin.red_green_tolerance = config.get<int>("skin.red_green_tolerance", skin.red_green_tolerance);
    skin.min_channel_spread = config.get<int>("skin.min_channel_spread", skin.min_channel_spread);

    LocatorConfig& locator = out.locator;
    locator.candidate_region.x = config.get<float>("locator.candidate_region.x", locator.candidate_region.x);
    locator.candidate_region.y = config.get<float>("locator.candidate_region.y", locator.candidate_region.y);
    locator.candidate_region.width = config.get<float>("locator.candidate_region.width", locator.candidate_region.width);
    locator.candidate_region.height = config.get<float>("locator.candidate_region.height", locator.candidate_region.height);
    locator.scan_stride = config.get<int>("locator.scan_stride", locator.scan_stride);
    locator.min_skin_ratio = config.get<float>("locator.min_skin_ratio", locator.min_skin_ratio);
    locator.min_aspect_ratio = config.get<float>("locator.min_aspect_ratio", locator.min_aspect_ratio);
    locator.max_aspect_ratio = config.get<float>("locator.max_aspect_ratio", locator.max_aspect_ratio);
    locator.min_box_density = config.get<float>("locator.min_box_density", locator.min_box_density);
    locator.min_region_size = config.get<int>("locator.min_region_size", locator.min_region_size);
    locator.pad_fraction = config.get<float>("locator.pad_fraction", locator.pad_fraction);

    out.signature.grid_size = config.get<int>("signature.grid_size", out.signature.grid_size);

    UndertoneConfig& undertone = out.undertone;
    undertone.min_samples = config.get<size_t>("undertone.min_samples", undertone.min_samples);
    undertone.median_weight = config.get<float>("undertone.median_weight", undertone.median_weight);
    undertone.warm_red_blue_margin = config.get<int>("undertone.warm_red_blue_margin", undertone.warm_red_blue_margin);
    undertone.warm_red_green_margin = config.get<int>("undertone.warm_red_green_margin", undertone.warm_red_green_margin);
    undertone.cool_red_blue_margin = config.get<int>("undertone.cool_red_blue_margin", undertone.cool_red_blue_margin);
    undertone.include_signature_samples =
        config.get<bool>("undertone.include_signature_samples", undertone.include_signature_samples);

    CacheConfig& cache = out.cache;
    cache.capacity = config.get<size_t>("cache.capacity", cache.capacity);
    cache.similarity_threshold = config.get<float>("cache.similarity_threshold", cache.similarity_threshold);
    cache.similarity_scale = config.get<float>("cache.similarity_scale", cache.similarity_scale);

    PaletteConfig& palette = out.palette;
    palette.hash_modulus = config.get<uint32_t>("palette.hash_modulus", palette.hash_modulus);
    palette.hash_central_cells_only =
        config.get<bool>("palette.hash_central_cells_only", palette.hash_central_cells_only);
    if (config.has("palette.fallback_palette")) {
        const std::string name = config.get<std::string>("palette.fallback_palette", "summer");
        auto parsed = paletteFromString(name);
        if (!parsed) {
            SKINTONE_THROW(core::ConfigurationException, "Unknown fallback palette '" + name + "'");
        }
        palette.fallback_palette = *parsed;
    }

    ValidationConfig& validation = out.validation;
    validation.analysis_max_dimension =
        config.get<int>("validation.analysis_max_dimension", validation.analysis_max_dimension);
    validation.min_image_aspect = config.get<float>("validation.min_image_aspect", validation.min_image_aspect);
    validation.max_image_aspect = config.get<float>("validation.max_image_aspect", validation.max_image_aspect);
    validation.min_skin_ratio = config.get<float>("validation.min_skin_ratio", validation.min_skin_ratio);
    validation.min_color_variation = config.get<float>("validation.min_color_variation", validation.min_color_variation);
    validation.max_color_variation = config.get<float>("validation.max_color_variation", validation.max_color_variation);
    validation.min_center_skin_ratio =
        config.get<float>("validation.min_center_skin_ratio", validation.min_center_skin_ratio);
    validation.center_to_edge_factor =
        config.get<float>("validation.center_to_edge_factor", validation.center_to_edge_factor);

    NormalizationConfig& normalization = out.normalization;
    normalization.enabled = config.get<bool>("normalization.enabled", normalization.enabled);
    normalization.max_dimension = config.get<int>("normalization.max_dimension", normalization.max_dimension);
    normalization.contrast = config.get<float>("normalization.contrast", normalization.contrast);
    normalization.brightness = config.get<float>("normalization.brightness", normalization.brightness);
    normalization.saturation = config.get<float>("normalization.saturation", normalization.saturation);

    if (!out.validate()) {
        SKINTONE_THROW(core::ConfigurationException, "Invalid analysis configuration: " + out.toString());
    }
    return out;
}

} // namespace analysis
} // namespace skintone
