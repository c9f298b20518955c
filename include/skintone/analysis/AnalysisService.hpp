#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"
#include "skintone/analysis/ConsistencyCache.hpp"
#include "skintone/analysis/FaceRegionLocator.hpp"
#include "skintone/analysis/FaceSignatureExtractor.hpp"
#include "skintone/analysis/FaceValidator.hpp"
#include "skintone/analysis/PaletteMapper.hpp"
#include "skintone/analysis/SkinToneClassifier.hpp"
#include "skintone/analysis/UndertoneClassifier.hpp"
#include <memory>

namespace skintone {
namespace analysis {

/**
 * @brief Entry point of the skin analysis pipeline
 *
 * Pipeline: locate face region -> extract signature -> consistency cache
 * -> undertone classification -> palette mapping -> record in cache.
 *
 * analyze() never throws for heuristic failures. Images without a
 * detectable face are sampled as a whole; images without enough skin
 * samples produce the fallback result (neutral, summer). Fallback results
 * are not recorded in the cache.
 *
 * Thread-safety: analyze() and detectFace() are const and may run
 * concurrently; the shared cache is internally synchronized.
 */
class AnalysisService {
public:
    /**
     * @brief Construct with a configuration and an optional shared cache
     * @param config Pipeline thresholds
     * @param cache Cache to share between services; a private one is created if null
     * @throws core::ConfigurationException if config does not validate
     */
    explicit AnalysisService(const AnalysisConfig& config = AnalysisConfig(),
                             std::shared_ptr<ConsistencyCache> cache = nullptr);

    /**
     * @brief Analyze an image and return its palette recommendation
     */
    AnalysisResult analyze(const PixelBuffer& image) const;

    /**
     * @brief Report face region and signature without classifying
     */
    FaceDetectionReport detectFace(const PixelBuffer& image) const;

    /**
     * @brief Run the advisory portrait check
     */
    FaceValidation validateFace(const PixelBuffer& image) const;

    const AnalysisConfig& config() const { return config_; }
    std::shared_ptr<ConsistencyCache> cache() const { return cache_; }

private:
    AnalysisResult fallback(const std::string& reason) const;

    AnalysisConfig config_;
    std::shared_ptr<ConsistencyCache> cache_;

    SkinToneClassifier classifier_;
    FaceRegionLocator locator_;
    FaceSignatureExtractor extractor_;
    UndertoneClassifier undertone_;
    PaletteMapper mapper_;
    FaceValidator validator_;
};

} // namespace analysis
} // namespace skintone
