#pragma once

#include "wojak/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file Exception.hpp
 * @brief Exception hierarchy for terminal request errors
 *
 * Only conditions that make a request meaningless are thrown. Recoverable
 * conditions (no face, degenerate landmarks) are reported through the
 * validation report instead.
 */

namespace wojak {
namespace core {

/**
 * @brief Base exception class for all Wojak generator exceptions
 *
 * Carries a result code, the raw message and optional context
 * (usually the throw site as file:line).
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
 * @brief Source bytes are not a valid or supported raster image
 */
class DecodeException : public Exception {
public:
    DecodeException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_DECODE_FAILED, message, context) {}
};

/**
 * @brief Image below the minimum usable resolution
 */
class ImageTooSmallException : public Exception {
public:
    ImageTooSmallException(int width, int height, int min_side,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_IMAGE_TOO_SMALL,
                    "Image is " + std::to_string(width) + "x" + std::to_string(height) +
                    "; both sides must be at least " + std::to_string(min_side) +
                    " px. Upload a larger photo with the face clearly visible.",
                    context)
        , width_(width), height_(height), min_side_(min_side) {}

    int getWidth() const noexcept { return width_; }
    int getHeight() const noexcept { return height_; }
    int getMinSide() const noexcept { return min_side_; }

private:
    int width_;
    int height_;
    int min_side_;
};

/**
 * @brief Unknown template identifier
 */
class TemplateNotFoundException : public Exception {
public:
    TemplateNotFoundException(const std::string& template_id,
                              const std::string& context = "")
        : Exception(ResultCode::ERROR_TEMPLATE_NOT_FOUND,
                    "Template '" + template_id + "' not found", context)
        , template_id_(template_id) {}

    const std::string& getTemplateId() const noexcept { return template_id_; }

private:
    std::string template_id_;
};

/**
 * @brief File I/O related exceptions
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define WOJAK_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace wojak
