#pragma once

#include <cstdint>
#include <string>

/**
 * @file types.hpp
 * @brief Common type definitions for the skintone analysis library
 */

namespace skintone {
namespace core {

/**
 * @brief Result codes shared by all skintone components
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_GENERIC = -1,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_FILE_NOT_FOUND = -10,
    ERROR_FILE_IO = -11,
    ERROR_IMAGE_UNREADABLE = -20,
    ERROR_IMAGE_FORMAT = -21,
    ERROR_CONFIG_INVALID = -30
};

/**
 * @brief Library version information
 */
struct Version {
    uint8_t major;
    uint8_t minor;
    uint8_t patch;

    std::string toString() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

/// Current library version
constexpr Version API_VERSION{1, 0, 0};

} // namespace core
} // namespace skintone
