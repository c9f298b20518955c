#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skintone {
namespace analysis {

/**
 * @brief Analysis API types shared by every pipeline stage
 */

/// Skin undertone classes. Closed set.
enum class Undertone {
    WARM,
    COOL,
    NEUTRAL
};

/// Seasonal color palettes. Closed set.
enum class SeasonalPalette {
    SPRING,
    SUMMER,
    AUTUMN,
    WINTER
};

/// All palettes in declaration order
constexpr std::array<SeasonalPalette, 4> ALL_PALETTES = {
    SeasonalPalette::SPRING, SeasonalPalette::SUMMER,
    SeasonalPalette::AUTUMN, SeasonalPalette::WINTER
};

/// Face region in source-image pixel coordinates
using FaceRegion = cv::Rect;

/**
 * @brief Grid-cell color fingerprint of a face region
 *
 * Three values (R, G, B) per cell, cells in row-major order.
 * Signatures built with the same grid size are position-wise comparable.
 */
using FaceSignature = std::vector<int>;

/**
 * @brief Immutable RGBA pixel buffer handed over by the image collaborator
 *
 * Pixels are stored row-major as R,G,B,A bytes in an owned CV_8UC4 matrix.
 * The buffer is deep-copied on construction and only exposed read-only.
 */
class PixelBuffer {
public:
    /**
     * @brief Empty buffer (0x0)
     */
    PixelBuffer() = default;

    /**
     * @brief Construct from raw RGBA bytes
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param rgba Row-major RGBA samples, exactly width*height*4 bytes
     * @throws core::ImageException on non-positive size or byte count mismatch
     */
    PixelBuffer(int width, int height, const std::vector<uint8_t>& rgba);

    /**
     * @brief Construct from an OpenCV image
     *
     * Accepted layouts: CV_8UC4 (channel_order_bgr selects BGRA vs RGBA),
     * CV_8UC3 (BGR or RGB) and CV_8UC1 (gray).
     * @throws core::ImageException for empty images or other depths/channel counts
     */
    static PixelBuffer fromMat(const cv::Mat& image, bool channel_order_bgr = true);

    /**
     * @brief Uniformly colored buffer
     */
    static PixelBuffer filled(int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);

    int width() const { return rgba_.cols; }
    int height() const { return rgba_.rows; }
    bool empty() const { return rgba_.empty(); }
    size_t pixelCount() const { return rgba_.total(); }

    /// Full image bounds as a region
    FaceRegion bounds() const { return FaceRegion(0, 0, width(), height()); }

    /// RGBA sample at (x, y); caller guarantees bounds
    const cv::Vec4b& at(int x, int y) const { return rgba_.at<cv::Vec4b>(y, x); }

    /// Read-only RGBA matrix
    const cv::Mat& mat() const { return rgba_; }

private:
    explicit PixelBuffer(cv::Mat rgba) : rgba_(std::move(rgba)) {}

    cv::Mat rgba_;
};

/**
 * @brief 8-bit RGB color triple
 */
struct RGBColor {
    int r = 0;
    int g = 0;
    int b = 0;

    RGBColor() = default;
    RGBColor(int r_, int g_, int b_) : r(r_), g(g_), b(b_) {}

    int brightness() const { return r + g + b; }

    bool operator==(const RGBColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

/**
 * @brief Named color recommendation, static reference data
 */
struct ColorEntry {
    std::string name;
    std::string hex;          ///< "#RRGGBB"
    std::string description;

    bool operator==(const ColorEntry& other) const {
        return name == other.name && hex == other.hex && description == other.description;
    }
};

/**
 * @brief Final analysis record rendered by the UI
 *
 * Fully determined by (undertone, palette): every other field is a lookup.
 */
struct AnalysisResult {
    Undertone undertone = Undertone::NEUTRAL;
    std::string skin_tone;                  ///< Human-readable label, e.g. "Warm / Golden"
    SeasonalPalette palette = SeasonalPalette::SUMMER;
    std::vector<ColorEntry> best_colors;
    std::vector<ColorEntry> neutral_colors;
    std::vector<ColorEntry> avoid_colors;
    std::string undertone_description;
    std::string palette_description;

    bool operator==(const AnalysisResult& other) const;
    bool operator!=(const AnalysisResult& other) const { return !(*this == other); }
};

/// Why the region locator did or did not accept a candidate
enum class RegionDecision {
    ACCEPTED,
    EMPTY_IMAGE,
    INSUFFICIENT_SKIN,
    ASPECT_RATIO_OUT_OF_RANGE,
    REGION_TOO_SMALL,
    LOW_DENSITY
};

/**
 * @brief Output of the face region locator
 */
struct FaceLocation {
    RegionDecision decision = RegionDecision::EMPTY_IMAGE;
    std::optional<FaceRegion> region;      ///< Padded, clamped region when accepted
    FaceRegion skin_bounds;                ///< Raw bounding box of skin samples
    size_t scanned_pixels = 0;
    size_t skin_pixels = 0;
    float skin_ratio = 0.0f;               ///< skin_pixels / scanned_pixels
    float aspect_ratio = 0.0f;             ///< skin_bounds width / height
    float box_density = 0.0f;              ///< skin samples / sampled positions in skin_bounds

    bool faceDetected() const { return decision == RegionDecision::ACCEPTED && region.has_value(); }
};

/**
 * @brief Face detection report exposed to the collaborator
 */
struct FaceDetectionReport {
    bool face_detected = false;
    std::optional<FaceRegion> region;
    std::optional<FaceSignature> signature;
};

/**
 * @brief Undertone classifier output with its evidence
 */
struct UndertoneEstimate {
    Undertone undertone = Undertone::NEUTRAL;
    bool sufficient_samples = false;
    size_t sample_count = 0;
    RGBColor median;
    RGBColor mean;
    RGBColor blended;                      ///< Color the rules were applied to
};

// String conversions
std::string undertoneToString(Undertone undertone);
std::string paletteToString(SeasonalPalette palette);
std::string regionDecisionToString(RegionDecision decision);

/// Parse "spring"/"summer"/"autumn"/"winter"; nullopt for anything else
std::optional<SeasonalPalette> paletteFromString(const std::string& name);

} // namespace analysis
} // namespace skintone
