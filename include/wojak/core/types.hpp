/**
 * @file types.hpp
 * @brief Common type definitions for the Wojak generator
 *
 * Fundamental enums shared by every module of the library.
 */

#ifndef WOJAK_CORE_TYPES_HPP
#define WOJAK_CORE_TYPES_HPP

#include <cstdint>
#include <string>

namespace wojak {
namespace core {

/**
 * @brief Result codes carried by exceptions and initialization routines
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,

    // Generic errors
    ERROR_GENERIC = -1,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_NOT_INITIALIZED = -3,

    // File errors
    ERROR_FILE_NOT_FOUND = -10,
    ERROR_FILE_IO = -11,
    ERROR_CONFIG_INVALID = -12,

    // Request errors
    ERROR_DECODE_FAILED = -20,
    ERROR_ENCODE_FAILED = -21,
    ERROR_IMAGE_TOO_SMALL = -22,
    ERROR_TEMPLATE_NOT_FOUND = -23,

    // Detector errors
    ERROR_DETECTOR_UNAVAILABLE = -30
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

} // namespace core
} // namespace wojak

#endif // WOJAK_CORE_TYPES_HPP
