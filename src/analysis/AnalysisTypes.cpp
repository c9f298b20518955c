#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/core/exception.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cctype>

namespace skintone {
namespace analysis {

PixelBuffer::PixelBuffer(int width, int height, const std::vector<uint8_t>& rgba) {
    if (width <= 0 || height <= 0) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_INVALID_PARAMETER,
                            "Pixel buffer dimensions must be positive, got " +
                            std::to_string(width) + "x" + std::to_string(height));
    }
    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    if (rgba.size() != expected) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_INVALID_PARAMETER,
                            "Pixel buffer holds " + std::to_string(rgba.size()) +
                            " bytes, expected " + std::to_string(expected));
    }

    // Wrap then clone so the buffer owns its storage
    cv::Mat view(height, width, CV_8UC4, const_cast<uint8_t*>(rgba.data()));
    rgba_ = view.clone();
}

PixelBuffer PixelBuffer::fromMat(const cv::Mat& image, bool channel_order_bgr) {
    if (image.empty()) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_IMAGE_UNREADABLE,
                            "Image is empty");
    }
    if (image.depth() != CV_8U) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_IMAGE_FORMAT,
                            "Only 8-bit images are supported");
    }

    cv::Mat rgba;
    switch (image.channels()) {
        case 4:
            if (channel_order_bgr) {
                cv::cvtColor(image, rgba, cv::COLOR_BGRA2RGBA);
            } else {
                rgba = image.clone();
            }
            break;
        case 3:
            cv::cvtColor(image, rgba, channel_order_bgr ? cv::COLOR_BGR2RGBA : cv::COLOR_RGB2RGBA);
            break;
        case 1:
            cv::cvtColor(image, rgba, cv::COLOR_GRAY2RGBA);
            break;
        default:
            SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_IMAGE_FORMAT,
                                "Unsupported channel count: " + std::to_string(image.channels()));
    }
    return PixelBuffer(std::move(rgba));
}

PixelBuffer PixelBuffer::filled(int width, int height, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    if (width <= 0 || height <= 0) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_INVALID_PARAMETER,
                            "Pixel buffer dimensions must be positive");
    }
    return PixelBuffer(cv::Mat(height, width, CV_8UC4, cv::Scalar(r, g, b, a)));
}

bool AnalysisResult::operator==(const AnalysisResult& other) const {
    return undertone == other.undertone &&
           skin_tone == other.skin_tone &&
           palette == other.palette &&
           best_colors == other.best_colors &&
           neutral_colors == other.neutral_colors &&
           avoid_colors == other.avoid_colors &&
           undertone_description == other.undertone_description &&
           palette_description == other.palette_description;
}

std::string undertoneToString(Undertone undertone) {
    switch (undertone) {
        case Undertone::WARM:    return "warm";
        case Undertone::COOL:    return "cool";
        case Undertone::NEUTRAL: return "neutral";
    }
    return "neutral";
}

std::string paletteToString(SeasonalPalette palette) {
    switch (palette) {
        case SeasonalPalette::SPRING: return "spring";
        case SeasonalPalette::SUMMER: return "summer";
        case SeasonalPalette::AUTUMN: return "autumn";
        case SeasonalPalette::WINTER: return "winter";
    }
    return "summer";
}

std::string regionDecisionToString(RegionDecision decision) {
    switch (decision) {
        case RegionDecision::ACCEPTED:
            return "Face region accepted";
        case RegionDecision::EMPTY_IMAGE:
            return "Image is empty";
        case RegionDecision::INSUFFICIENT_SKIN:
            return "Too few skin-colored pixels";
        case RegionDecision::ASPECT_RATIO_OUT_OF_RANGE:
            return "Skin region aspect ratio is not face-like";
        case RegionDecision::REGION_TOO_SMALL:
            return "Skin region too small";
        case RegionDecision::LOW_DENSITY:
            return "Skin pixels too sparse within region";
    }
    return "Unknown region decision";
}

std::optional<SeasonalPalette> paletteFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (SeasonalPalette palette : ALL_PALETTES) {
        if (paletteToString(palette) == lower) {
            return palette;
        }
    }
    return std::nullopt;
}

} // namespace analysis
} // namespace skintone
