#include "skintone/core/exception.h"
#include <sstream>

namespace skintone {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_IMAGE_UNREADABLE:
            return "ERROR_IMAGE_UNREADABLE";
        case ResultCode::ERROR_IMAGE_FORMAT:
            return "ERROR_IMAGE_FORMAT";
        case ResultCode::ERROR_CONFIG_INVALID:
            return "ERROR_CONFIG_INVALID";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace skintone
