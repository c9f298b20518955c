#include "skintone/analysis/UndertoneClassifier.hpp"
#include "skintone/analysis/FaceSignatureExtractor.hpp"
#include "skintone/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace skintone {
namespace analysis {

UndertoneClassifier::UndertoneClassifier(const UndertoneConfig& config, const SkinToneClassifier& classifier)
    : config_(config)
    , classifier_(classifier) {
}

std::vector<RGBColor> UndertoneClassifier::collectSamples(const PixelBuffer& image,
                                                          const FaceRegion& region,
                                                          const FaceSignature& signature) const {
    std::vector<RGBColor> samples;

    if (!image.empty()) {
        const FaceRegion clipped = region & image.bounds();
        samples.reserve(static_cast<size_t>(clipped.area()) / 2);
        for (int y = clipped.y; y < clipped.y + clipped.height; ++y) {
            for (int x = clipped.x; x < clipped.x + clipped.width; ++x) {
                const cv::Vec4b& px = image.at(x, y);
                if (classifier_.isSkin(px)) {
                    samples.emplace_back(px[0], px[1], px[2]);
                }
            }
        }
    }

    if (config_.include_signature_samples) {
        for (const RGBColor& cell : FaceSignatureExtractor::cellColors(signature)) {
            if (classifier_.isSkin(cell)) {
                samples.push_back(cell);
            }
        }
    }

    return samples;
}

UndertoneEstimate UndertoneClassifier::classify(std::vector<RGBColor> samples) const {
    UndertoneEstimate estimate;
    estimate.sample_count = samples.size();

    if (samples.size() < config_.min_samples || samples.empty()) {
        estimate.undertone = Undertone::NEUTRAL;
        estimate.sufficient_samples = false;
        LOG_DEBUG("Undertone: " + std::to_string(samples.size()) + " skin samples, below minimum of " +
                  std::to_string(config_.min_samples));
        return estimate;
    }

    // Total order (brightness, then channels) keeps the median deterministic
    std::sort(samples.begin(), samples.end(), [](const RGBColor& a, const RGBColor& b) {
        return std::make_tuple(a.brightness(), a.r, a.g, a.b) <
               std::make_tuple(b.brightness(), b.r, b.g, b.b);
    });
    estimate.median = samples[samples.size() / 2];

    double sum_r = 0.0, sum_g = 0.0, sum_b = 0.0;
    for (const RGBColor& s : samples) {
        sum_r += s.r;
        sum_g += s.g;
        sum_b += s.b;
    }
    const double n = static_cast<double>(samples.size());
    const double mean_r = sum_r / n;
    const double mean_g = sum_g / n;
    const double mean_b = sum_b / n;
    estimate.mean = RGBColor(static_cast<int>(std::lround(mean_r)),
                             static_cast<int>(std::lround(mean_g)),
                             static_cast<int>(std::lround(mean_b)));

    const double w = config_.median_weight;
    estimate.blended = RGBColor(static_cast<int>(std::lround(estimate.median.r * w + mean_r * (1.0 - w))),
                                static_cast<int>(std::lround(estimate.median.g * w + mean_g * (1.0 - w))),
                                static_cast<int>(std::lround(estimate.median.b * w + mean_b * (1.0 - w))));

    estimate.undertone = classifyColor(estimate.blended);
    estimate.sufficient_samples = true;

    SKINTONE_LOG_DEBUG("UndertoneClassifier")
        << samples.size() << " samples, median (" << estimate.median.r << "," << estimate.median.g << ","
        << estimate.median.b << "), blended (" << estimate.blended.r << "," << estimate.blended.g << ","
        << estimate.blended.b << ") -> " << undertoneToString(estimate.undertone);

    return estimate;
}

Undertone UndertoneClassifier::classifyColor(const RGBColor& color) const {
    const int red_blue = color.r - color.b;
    const int red_green = color.r - color.g;

    if (red_blue >= config_.warm_red_blue_margin && red_green >= config_.warm_red_green_margin) {
        return Undertone::WARM;
    }
    if (red_blue < config_.cool_red_blue_margin || color.b >= color.g) {
        return Undertone::COOL;
    }
    return Undertone::NEUTRAL;
}

} // namespace analysis
} // namespace skintone
