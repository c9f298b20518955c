#include "skintone/analysis/AnalysisService.hpp"
#include "skintone/core/exception.h"
#include "skintone/core/Logger.hpp"

namespace skintone {
namespace analysis {

namespace {

const AnalysisConfig& validated(const AnalysisConfig& config) {
    if (!config.validate()) {
        SKINTONE_THROW(core::ConfigurationException, "Invalid analysis configuration: " + config.toString());
    }
    return config;
}

} // namespace

AnalysisService::AnalysisService(const AnalysisConfig& config, std::shared_ptr<ConsistencyCache> cache)
    : config_(validated(config))
    , cache_(cache ? std::move(cache) : std::make_shared<ConsistencyCache>(config.cache))
    , classifier_(config.skin)
    , locator_(config.locator, classifier_)
    , extractor_(config.signature)
    , undertone_(config.undertone, classifier_)
    , mapper_(config.palette, config.signature.grid_size)
    , validator_(config.validation, classifier_) {
    LOG_DEBUG("AnalysisService initialized (cache capacity " + std::to_string(cache_->capacity()) + ")");
}

AnalysisResult AnalysisService::analyze(const PixelBuffer& image) const {
    if (image.empty()) {
        return fallback("empty image");
    }

    const FaceLocation location = locator_.locate(image);
    const FaceRegion region = location.faceDetected() ? *location.region : image.bounds();
    if (!location.faceDetected()) {
        SKINTONE_LOG_INFO("AnalysisService")
            << "no face region (" << regionDecisionToString(location.decision) << "), sampling whole image";
    }

    const FaceSignature signature = extractor_.extract(image, region);
    if (signature.empty()) {
        return fallback("region too small for a signature");
    }

    if (auto cached = cache_->lookup(signature)) {
        SKINTONE_LOG_INFO("AnalysisService")
            << "consistent with a recent analysis: " << undertoneToString(cached->undertone) << " / "
            << paletteToString(cached->palette);
        return *cached;
    }

    const UndertoneEstimate estimate = undertone_.estimate(image, region, signature);
    if (!estimate.sufficient_samples) {
        return fallback("only " + std::to_string(estimate.sample_count) + " skin samples");
    }

    AnalysisResult result = mapper_.map(estimate.undertone, signature);
    cache_->record(signature, result);

    SKINTONE_LOG_INFO("AnalysisService")
        << "result: " << result.skin_tone << ", " << paletteToString(result.palette) << " palette";
    return result;
}

FaceDetectionReport AnalysisService::detectFace(const PixelBuffer& image) const {
    FaceDetectionReport report;

    const FaceLocation location = locator_.locate(image);
    if (!location.faceDetected()) {
        return report;
    }

    report.face_detected = true;
    report.region = location.region;

    FaceSignature signature = extractor_.extract(image, *location.region);
    if (!signature.empty()) {
        report.signature = std::move(signature);
    }
    return report;
}

FaceValidation AnalysisService::validateFace(const PixelBuffer& image) const {
    return validator_.validate(image);
}

AnalysisResult AnalysisService::fallback(const std::string& reason) const {
    LOG_WARNING("Analysis fell back to default palette: " + reason);
    return mapper_.fallbackResult();
}

} // namespace analysis
} // namespace skintone
