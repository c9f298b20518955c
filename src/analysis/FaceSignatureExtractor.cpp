#include "skintone/analysis/FaceSignatureExtractor.hpp"
#include "skintone/core/Logger.hpp"
#include <cmath>

namespace skintone {
namespace analysis {

FaceSignatureExtractor::FaceSignatureExtractor(const SignatureConfig& config)
    : config_(config) {
}

size_t FaceSignatureExtractor::signatureLength() const {
    const size_t n = static_cast<size_t>(config_.grid_size);
    return n * n * 3;
}

FaceSignature FaceSignatureExtractor::extract(const PixelBuffer& image, const FaceRegion& region) const {
    FaceSignature signature;
    if (image.empty() || config_.grid_size < 1) {
        return signature;
    }

    const FaceRegion clipped = region & image.bounds();
    const int n = config_.grid_size;
    if (clipped.width < n || clipped.height < n) {
        LOG_DEBUG("Signature skipped: region " + std::to_string(clipped.width) + "x" +
                  std::to_string(clipped.height) + " smaller than grid");
        return signature;
    }

    signature.reserve(signatureLength());
    const cv::Mat& rgba = image.mat();

    for (int row = 0; row < n; ++row) {
        const int y0 = clipped.y + row * clipped.height / n;
        const int y1 = clipped.y + (row + 1) * clipped.height / n;
        for (int col = 0; col < n; ++col) {
            const int x0 = clipped.x + col * clipped.width / n;
            const int x1 = clipped.x + (col + 1) * clipped.width / n;
            if (x1 <= x0 || y1 <= y0) {
                continue;
            }
            const cv::Scalar mean = cv::mean(rgba(cv::Rect(x0, y0, x1 - x0, y1 - y0)));
            signature.push_back(static_cast<int>(std::lround(mean[0])));
            signature.push_back(static_cast<int>(std::lround(mean[1])));
            signature.push_back(static_cast<int>(std::lround(mean[2])));
        }
    }

    return signature;
}

std::vector<RGBColor> FaceSignatureExtractor::cellColors(const FaceSignature& signature) {
    std::vector<RGBColor> colors;
    colors.reserve(signature.size() / 3);
    for (size_t i = 0; i + 2 < signature.size(); i += 3) {
        colors.emplace_back(signature[i], signature[i + 1], signature[i + 2]);
    }
    return colors;
}

} // namespace analysis
} // namespace skintone
