#include "skintone/analysis/FaceRegionLocator.hpp"
#include "skintone/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace skintone {
namespace analysis {

FaceRegionLocator::FaceRegionLocator(const LocatorConfig& config, const SkinToneClassifier& classifier)
    : config_(config)
    , classifier_(classifier) {
}

FaceRegion FaceRegionLocator::candidateRect(int width, int height) const {
    const cv::Rect2f& roi = config_.candidate_region;
    const int x0 = std::max(0, static_cast<int>(std::floor(roi.x * width)));
    const int y0 = std::max(0, static_cast<int>(std::floor(roi.y * height)));
    const int x1 = std::min(width, static_cast<int>(std::ceil((roi.x + roi.width) * width)));
    const int y1 = std::min(height, static_cast<int>(std::ceil((roi.y + roi.height) * height)));
    if (x1 <= x0 || y1 <= y0) {
        return FaceRegion();
    }
    return FaceRegion(x0, y0, x1 - x0, y1 - y0);
}

FaceLocation FaceRegionLocator::locate(const PixelBuffer& image) const {
    FaceLocation location;

    if (image.empty()) {
        location.decision = RegionDecision::EMPTY_IMAGE;
        return location;
    }

    const FaceRegion scan = candidateRect(image.width(), image.height());
    if (scan.area() <= 0) {
        location.decision = RegionDecision::EMPTY_IMAGE;
        return location;
    }

    const int stride = std::max(1, config_.scan_stride);
    int min_x = std::numeric_limits<int>::max();
    int min_y = std::numeric_limits<int>::max();
    int max_x = -1;
    int max_y = -1;

    for (int y = scan.y; y < scan.y + scan.height; y += stride) {
        for (int x = scan.x; x < scan.x + scan.width; x += stride) {
            ++location.scanned_pixels;
            if (!classifier_.isSkin(image.at(x, y))) {
                continue;
            }
            ++location.skin_pixels;
            min_x = std::min(min_x, x);
            min_y = std::min(min_y, y);
            max_x = std::max(max_x, x);
            max_y = std::max(max_y, y);
        }
    }

    location.skin_ratio = location.scanned_pixels > 0
        ? static_cast<float>(location.skin_pixels) / static_cast<float>(location.scanned_pixels)
        : 0.0f;

    if (location.skin_pixels == 0 || location.skin_ratio < config_.min_skin_ratio) {
        location.decision = RegionDecision::INSUFFICIENT_SKIN;
        LOG_DEBUG("Face locator: skin ratio " + std::to_string(location.skin_ratio) + " below minimum");
        return location;
    }

    location.skin_bounds = FaceRegion(min_x, min_y, max_x - min_x + 1, max_y - min_y + 1);
    location.aspect_ratio = static_cast<float>(location.skin_bounds.width) /
                            static_cast<float>(location.skin_bounds.height);

    const size_t cols = static_cast<size_t>((max_x - min_x) / stride + 1);
    const size_t rows = static_cast<size_t>((max_y - min_y) / stride + 1);
    location.box_density = static_cast<float>(location.skin_pixels) / static_cast<float>(cols * rows);

    if (location.aspect_ratio < config_.min_aspect_ratio || location.aspect_ratio > config_.max_aspect_ratio) {
        location.decision = RegionDecision::ASPECT_RATIO_OUT_OF_RANGE;
        LOG_DEBUG("Face locator: aspect ratio " + std::to_string(location.aspect_ratio) + " rejected");
        return location;
    }

    if (location.skin_bounds.width < config_.min_region_size ||
        location.skin_bounds.height < config_.min_region_size) {
        location.decision = RegionDecision::REGION_TOO_SMALL;
        return location;
    }

    if (location.box_density < config_.min_box_density) {
        location.decision = RegionDecision::LOW_DENSITY;
        LOG_DEBUG("Face locator: box density " + std::to_string(location.box_density) + " rejected");
        return location;
    }

    location.region = padRegion(location.skin_bounds, image.width(), image.height());
    location.decision = RegionDecision::ACCEPTED;

    SKINTONE_LOG_DEBUG("FaceRegionLocator")
        << "skin bounds " << location.skin_bounds.x << "," << location.skin_bounds.y << " "
        << location.skin_bounds.width << "x" << location.skin_bounds.height
        << ", padded " << location.region->width << "x" << location.region->height
        << ", ratio " << location.skin_ratio << ", density " << location.box_density;

    return location;
}

FaceRegion FaceRegionLocator::padRegion(const FaceRegion& bounds, int width, int height) const {
    const int pad = static_cast<int>(std::lround(
        config_.pad_fraction * static_cast<float>(std::max(bounds.width, bounds.height))));
    FaceRegion padded(bounds.x - pad, bounds.y - pad, bounds.width + 2 * pad, bounds.height + 2 * pad);
    return padded & FaceRegion(0, 0, width, height);
}

} // namespace analysis
} // namespace skintone
