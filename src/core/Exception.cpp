#include "wojak/core/Exception.hpp"
#include <sstream>

namespace wojak {
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
        case ResultCode::ERROR_NOT_INITIALIZED:
            return "ERROR_NOT_INITIALIZED";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_CONFIG_INVALID:
            return "ERROR_CONFIG_INVALID";
        case ResultCode::ERROR_DECODE_FAILED:
            return "ERROR_DECODE_FAILED";
        case ResultCode::ERROR_ENCODE_FAILED:
            return "ERROR_ENCODE_FAILED";
        case ResultCode::ERROR_IMAGE_TOO_SMALL:
            return "ERROR_IMAGE_TOO_SMALL";
        case ResultCode::ERROR_TEMPLATE_NOT_FOUND:
            return "ERROR_TEMPLATE_NOT_FOUND";
        case ResultCode::ERROR_DETECTOR_UNAVAILABLE:
            return "ERROR_DETECTOR_UNAVAILABLE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace wojak
