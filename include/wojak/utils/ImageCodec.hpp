#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace wojak {
namespace utils {

/**
 * @brief Byte-level raster image decode/encode helpers
 *
 * All decoded images are 8-bit 3-channel BGR regardless of the source
 * encoding (grayscale and alpha inputs are converted).
 */
class ImageCodec {
public:
    /**
     * @brief Decode an encoded image
     * @throws core::DecodeException if the bytes are empty or not a supported image
     */
    static cv::Mat decode(const std::vector<uint8_t>& bytes);

    /**
     * @brief Encode an image
     * @param extension Target format as a file extension (".png", ".jpg", ...)
     * @throws core::Exception with ERROR_ENCODE_FAILED on failure
     */
    static std::vector<uint8_t> encode(const cv::Mat& image, const std::string& extension = ".png");

    /**
     * @brief Load an image file as BGR, empty Mat if missing or unreadable
     */
    static cv::Mat load(const std::string& path);

    /**
     * @brief Shrink image to fit a size x size box, preserving aspect ratio
     *
     * Images already inside the box are returned unchanged (copied).
     */
    static cv::Mat thumbnail(const cv::Mat& image, int size = 150);

    /**
     * @brief Check the file extension against the accepted raster formats
     */
    static bool isSupportedExtension(const std::string& path);

    static const std::vector<std::string>& supportedExtensions();
};

} // namespace utils
} // namespace wojak
