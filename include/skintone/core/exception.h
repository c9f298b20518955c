#pragma once

#include "skintone/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for the skintone library
 */

namespace skintone {
namespace core {

/**
 * @brief Base exception class for all skintone exceptions
 *
 * Carries the result code, the raw message and the context
 * (usually file:line) in addition to the formatted what() string.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Input image could not be decoded or is malformed
 */
class ImageException : public Exception {
public:
    ImageException(ResultCode code,
                   const std::string& message,
                   const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Configuration file unreadable or values out of range
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIG_INVALID, message, context) {}
};

/**
 * @brief Convert result code to string representation
 * @param code Result code to convert
 * @return String representation of result code
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macros for throwing exceptions with automatic context
 */
#define SKINTONE_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define SKINTONE_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace skintone
