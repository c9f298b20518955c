#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace skintone {
namespace analysis {

/**
 * @brief Maps (undertone, signature) to a seasonal palette and its colors
 *
 * Palette selection is a pure function of the undertone and a stable hash
 * of the signature:
 * - warm:    spring or autumn
 * - cool:    summer or winter
 * - neutral: any season, by quartile of hash % 100
 *
 * Color lists and descriptions are static reference data.
 */
class PaletteMapper {
public:
    explicit PaletteMapper(const PaletteConfig& config = PaletteConfig(), int grid_size = 5);

    /**
     * @brief Stable signature hash in [0, hash_modulus)
     *
     * h = h * 31 + v over the hashed values with 32-bit unsigned wraparound.
     */
    uint32_t hash(const FaceSignature& signature) const;

    /**
     * @brief Pick the palette for an undertone and hash value
     */
    static SeasonalPalette selectPalette(Undertone undertone, uint32_t hash);

    /**
     * @brief Assemble the complete result record
     */
    AnalysisResult buildResult(Undertone undertone, SeasonalPalette palette) const;

    /**
     * @brief Hash, select and assemble in one step
     */
    AnalysisResult map(Undertone undertone, const FaceSignature& signature) const;

    /**
     * @brief Result returned when analysis cannot proceed
     *
     * Neutral undertone with the configured fallback palette (summer).
     */
    AnalysisResult fallbackResult() const;

    static const std::vector<ColorEntry>& bestColors(SeasonalPalette palette);
    static const std::vector<ColorEntry>& neutralColors(SeasonalPalette palette);
    static const std::vector<ColorEntry>& avoidColors(SeasonalPalette palette);

    static std::string skinToneLabel(Undertone undertone);
    static std::string undertoneDescription(Undertone undertone);
    static std::string paletteDescription(SeasonalPalette palette);

private:
    bool isHashedCell(size_t cell) const;

    PaletteConfig config_;
    int grid_size_;
};

} // namespace analysis
} // namespace skintone
