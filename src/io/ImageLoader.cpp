#include "skintone/io/ImageLoader.hpp"
#include "skintone/core/exception.h"
#include "skintone/core/Logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <fstream>

namespace skintone {
namespace io {

namespace {

// 16-bit PNG/TIFF
cv::Mat to8Bit(const cv::Mat& decoded) {
    if (decoded.depth() == CV_8U) {
        return decoded;
    }
    cv::Mat scaled;
    decoded.convertTo(scaled, CV_8U, decoded.depth() == CV_16U ? 1.0 / 257.0 : 1.0);
    return scaled;
}

} // namespace

analysis::PixelBuffer ImageLoader::load(const std::string& path) {
    std::ifstream probe(path, std::ios::binary);
    if (!probe.good()) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                            "Image file not found: " + path);
    }
    probe.close();

    cv::Mat decoded = cv::imread(path, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_IMAGE_UNREADABLE,
                            "Could not decode image: " + path);
    }

    LOG_INFO("Loaded image " + path + " (" + std::to_string(decoded.cols) + "x" +
             std::to_string(decoded.rows) + ", " + std::to_string(decoded.channels()) + " channels)");
    return analysis::PixelBuffer::fromMat(to8Bit(decoded), true);
}

analysis::PixelBuffer ImageLoader::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_IMAGE_UNREADABLE,
                            "Empty image data");
    }

    cv::Mat decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_IMAGE_UNREADABLE,
                            "Could not decode image data (" + std::to_string(bytes.size()) + " bytes)");
    }
    return analysis::PixelBuffer::fromMat(to8Bit(decoded), true);
}

void ImageLoader::save(const analysis::PixelBuffer& image, const std::string& path) {
    if (image.empty()) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_INVALID_PARAMETER,
                            "Cannot save empty image");
    }

    cv::Mat bgra;
    cv::cvtColor(image.mat(), bgra, cv::COLOR_RGBA2BGRA);

    bool written = false;
    try {
        written = cv::imwrite(path, bgra);
    } catch (const cv::Exception& e) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_FILE_IO,
                            "Failed to write " + path + ": " + e.what());
    }
    if (!written) {
        SKINTONE_THROW_CODE(core::ImageException, core::ResultCode::ERROR_FILE_IO,
                            "Failed to write " + path);
    }
}

} // namespace io
} // namespace skintone
