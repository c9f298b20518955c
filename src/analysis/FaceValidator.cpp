#include "skintone/analysis/FaceValidator.hpp"
#include "skintone/core/Logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace skintone {
namespace analysis {

FaceValidator::FaceValidator(const ValidationConfig& config, const SkinToneClassifier& classifier)
    : config_(config)
    , classifier_(classifier) {
}

FaceValidation FaceValidator::validate(const PixelBuffer& image) const {
    FaceValidation result;

    auto fail = [&result](ValidationIssue issue) {
        result.is_valid = false;
        result.issue = issue;
        result.message = issueMessage(issue);
        SKINTONE_LOG_DEBUG("FaceValidator") << "rejected: " << issueToString(issue);
        return result;
    };

    if (image.empty()) {
        return fail(ValidationIssue::EMPTY_IMAGE);
    }

    result.image_aspect = static_cast<float>(image.width()) / static_cast<float>(image.height());
    if (result.image_aspect > config_.max_image_aspect || result.image_aspect < config_.min_image_aspect) {
        return fail(ValidationIssue::IMAGE_ASPECT_RATIO);
    }

    const cv::Mat rgba = analysisCopy(image);

    result.skin_ratio = skinRatio(rgba);
    if (result.skin_ratio < config_.min_skin_ratio) {
        return fail(ValidationIssue::INSUFFICIENT_SKIN);
    }

    result.color_variation = colorVariation(rgba);
    if (result.color_variation < config_.min_color_variation ||
        result.color_variation > config_.max_color_variation) {
        return fail(ValidationIssue::COLOR_VARIATION);
    }

    skinDistribution(rgba, result.center_skin_ratio, result.edge_skin_ratio);
    if (!(result.center_skin_ratio > config_.min_center_skin_ratio &&
          result.center_skin_ratio > result.edge_skin_ratio * config_.center_to_edge_factor)) {
        return fail(ValidationIssue::SKIN_DISTRIBUTION);
    }

    result.is_valid = true;
    result.issue = ValidationIssue::NONE;
    result.message = issueMessage(ValidationIssue::NONE);
    return result;
}

cv::Mat FaceValidator::analysisCopy(const PixelBuffer& image) const {
    const int max_dim = std::max(1, config_.analysis_max_dimension);
    const double aspect = static_cast<double>(image.width()) / static_cast<double>(image.height());

    int width = max_dim;
    int height = max_dim;
    if (aspect >= 1.0) {
        height = std::max(1, static_cast<int>(max_dim / aspect));
    } else {
        width = std::max(1, static_cast<int>(max_dim * aspect));
    }

    if (width == image.width() && height == image.height()) {
        return image.mat();
    }

    cv::Mat scaled;
    const int interpolation = (width < image.width()) ? cv::INTER_AREA : cv::INTER_LINEAR;
    cv::resize(image.mat(), scaled, cv::Size(width, height), 0, 0, interpolation);
    return scaled;
}

float FaceValidator::skinRatio(const cv::Mat& rgba) const {
    size_t skin = 0;
    for (int y = 0; y < rgba.rows; ++y) {
        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
        for (int x = 0; x < rgba.cols; ++x) {
            if (classifier_.isSkin(row[x])) {
                ++skin;
            }
        }
    }
    return static_cast<float>(skin) / static_cast<float>(rgba.total());
}

float FaceValidator::colorVariation(const cv::Mat& rgba) {
    const size_t total = rgba.total();
    if (total < 2) {
        return 0.0f;
    }

    const cv::Mat flat = rgba.isContinuous() ? rgba.reshape(4, 1) : rgba.clone().reshape(4, 1);
    const cv::Vec4b* px = flat.ptr<cv::Vec4b>(0);

    double variation = 0.0;
    cv::Vec4b prev = px[0];
    for (size_t i = 1; i < total; i += 4) {
        const cv::Vec4b& cur = px[i];
        variation += std::abs(cur[0] - prev[0]) + std::abs(cur[1] - prev[1]) + std::abs(cur[2] - prev[2]);
        prev = cur;
    }

    return static_cast<float>(variation / (static_cast<double>(total) / 16.0));
}

void FaceValidator::skinDistribution(const cv::Mat& rgba, float& center_ratio, float& edge_ratio) const {
    const int cx = rgba.cols / 2;
    const int cy = rgba.rows / 2;
    const double radius = std::min(rgba.cols, rgba.rows) / 3.0;

    size_t center_skin = 0, center_total = 0;
    size_t edge_skin = 0, edge_total = 0;

    for (int y = 0; y < rgba.rows; ++y) {
        const cv::Vec4b* row = rgba.ptr<cv::Vec4b>(y);
        for (int x = 0; x < rgba.cols; ++x) {
            const double distance = std::hypot(x - cx, y - cy);
            const bool skin = classifier_.isSkin(row[x]);
            if (distance < radius) {
                ++center_total;
                center_skin += skin ? 1 : 0;
            } else {
                ++edge_total;
                edge_skin += skin ? 1 : 0;
            }
        }
    }

    center_ratio = center_total > 0 ? static_cast<float>(center_skin) / center_total : 0.0f;
    edge_ratio = edge_total > 0 ? static_cast<float>(edge_skin) / edge_total : 0.0f;
}

std::string FaceValidator::issueToString(ValidationIssue issue) {
    switch (issue) {
        case ValidationIssue::NONE: return "NONE";
        case ValidationIssue::EMPTY_IMAGE: return "EMPTY_IMAGE";
        case ValidationIssue::IMAGE_ASPECT_RATIO: return "IMAGE_ASPECT_RATIO";
        case ValidationIssue::INSUFFICIENT_SKIN: return "INSUFFICIENT_SKIN";
        case ValidationIssue::COLOR_VARIATION: return "COLOR_VARIATION";
        case ValidationIssue::SKIN_DISTRIBUTION: return "SKIN_DISTRIBUTION";
    }
    return "UNKNOWN";
}

std::string FaceValidator::issueMessage(ValidationIssue issue) {
    switch (issue) {
        case ValidationIssue::NONE:
            return "Face detected";
        case ValidationIssue::EMPTY_IMAGE:
            return "Couldn't analyze image. Please try another photo.";
        case ValidationIssue::IMAGE_ASPECT_RATIO:
            return "This image doesn't seem to contain a properly framed face. "
                   "Please upload a photo that clearly shows your face.";
        case ValidationIssue::INSUFFICIENT_SKIN:
            return "We couldn't detect a human face in this image. "
                   "Please upload a clear photo of your face.";
        case ValidationIssue::COLOR_VARIATION:
            return "This doesn't appear to be a photo with a clearly visible face. "
                   "Please upload a clear portrait photo.";
        case ValidationIssue::SKIN_DISTRIBUTION:
            return "We couldn't detect a human face in this image. "
                   "Please upload a photo that clearly shows your face.";
    }
    return "";
}

} // namespace analysis
} // namespace skintone
