#pragma once

#include "skintone/analysis/AnalysisTypes.hpp"
#include <string>
#include <vector>

namespace skintone {
namespace io {

/**
 * @brief Decodes image files into RGBA pixel buffers
 *
 * Any format supported by OpenCV imgcodecs is accepted (JPEG, PNG, ...).
 * Alpha is kept when present, otherwise set to 255.
 */
class ImageLoader {
public:
    /**
     * @brief Decode an image file
     * @throws core::ImageException ERROR_FILE_NOT_FOUND if the file does not exist,
     *         ERROR_IMAGE_UNREADABLE if it cannot be decoded
     */
    static analysis::PixelBuffer load(const std::string& path);

    /**
     * @brief Decode an in-memory encoded image
     * @throws core::ImageException ERROR_IMAGE_UNREADABLE if the bytes cannot be decoded
     */
    static analysis::PixelBuffer decode(const std::vector<uint8_t>& bytes);

    /**
     * @brief Write a buffer to disk, format chosen by extension
     * @throws core::ImageException ERROR_FILE_IO on failure
     */
    static void save(const analysis::PixelBuffer& image, const std::string& path);
};

} // namespace io
} // namespace skintone
