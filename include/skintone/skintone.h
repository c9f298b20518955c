#pragma once

/**
 * @file skintone.h
 * @brief Main header for the skintone analysis library
 *
 * Include this single header to access the complete analysis API.
 */

// Core types and utilities
#include "skintone/core/types.hpp"
#include "skintone/core/Logger.hpp"
#include "skintone/core/Configuration.hpp"
#include "skintone/core/exception.h"

// Analysis pipeline
#include "skintone/analysis/AnalysisTypes.hpp"
#include "skintone/analysis/AnalysisConfig.hpp"
#include "skintone/analysis/AnalysisService.hpp"

// Image input
#include "skintone/io/ImageLoader.hpp"
#include "skintone/io/ImageNormalizer.hpp"

namespace skintone {

/**
 * @brief Get library version
 */
inline core::Version getVersion() {
    return core::API_VERSION;
}

inline std::string getVersionString() {
    return core::API_VERSION.toString();
}

/**
 * @brief Configure global logging
 *
 * Optional. Without it the logger writes INFO and above to the console.
 *
 * @param log_level Minimum log level
 * @param log_directory Directory for a timestamped log file; empty for console only
 * @return ResultCode::ERROR_FILE_IO if the log file could not be opened
 */
inline core::ResultCode initialize(core::LogLevel log_level = core::LogLevel::INFO,
                                   const std::string& log_directory = "") {
    auto& logger = core::Logger::getInstance();
    logger.setLevel(log_level);
    logger.setConsoleOutput(true);

    if (!log_directory.empty() && !logger.initializeWithTimestamp(log_directory, log_level)) {
        return core::ResultCode::ERROR_FILE_IO;
    }

    SKINTONE_LOG_INFO("API") << "skintone initialized - Version " << getVersionString();
    return core::ResultCode::SUCCESS;
}

/**
 * @brief Flush logs before exit
 */
inline void shutdown() {
    core::Logger::getInstance().flush();
}

} // namespace skintone
