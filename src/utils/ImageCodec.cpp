#include "wojak/utils/ImageCodec.hpp"
#include "wojak/utils/FileUtils.hpp"
#include "wojak/core/Exception.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace wojak {
namespace utils {

cv::Mat ImageCodec::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        WOJAK_THROW(core::DecodeException, "Empty image data");
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        WOJAK_THROW(core::DecodeException, std::string("Image decoder error: ") + e.what());
    }
    if (decoded.empty()) {
        WOJAK_THROW(core::DecodeException,
                    "Data is not a supported image (" + std::to_string(bytes.size()) + " bytes)");
    }

    if (decoded.depth() != CV_8U) {
        cv::Mat converted;
        decoded.convertTo(converted, CV_8U);
        decoded = converted;
    }
    return decoded;
}

std::vector<uint8_t> ImageCodec::encode(const cv::Mat& image, const std::string& extension) {
    if (image.empty()) {
        WOJAK_THROW(core::Exception, core::ResultCode::ERROR_ENCODE_FAILED, "Cannot encode empty image");
    }
    std::vector<uint8_t> bytes;
    bool ok = false;
    try {
        ok = cv::imencode(extension, image, bytes);
    } catch (const cv::Exception& e) {
        WOJAK_THROW(core::Exception, core::ResultCode::ERROR_ENCODE_FAILED,
                    "Encoding to " + extension + " failed: " + e.what());
    }
    if (!ok) {
        WOJAK_THROW(core::Exception, core::ResultCode::ERROR_ENCODE_FAILED,
                    "Encoding to " + extension + " failed");
    }
    return bytes;
}

cv::Mat ImageCodec::load(const std::string& path) {
    if (!FileUtils::fileExists(path)) {
        return cv::Mat();
    }
    try {
        return cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception&) {
        return cv::Mat();
    }
}

cv::Mat ImageCodec::thumbnail(const cv::Mat& image, int size) {
    if (image.empty() || size <= 0) {
        return cv::Mat();
    }
    if (image.cols <= size && image.rows <= size) {
        return image.clone();
    }

    double scale = std::min(static_cast<double>(size) / image.cols,
                            static_cast<double>(size) / image.rows);
    cv::Size target(std::max(1, static_cast<int>(std::lround(image.cols * scale))),
                    std::max(1, static_cast<int>(std::lround(image.rows * scale))));
    cv::Mat resized;
    cv::resize(image, resized, target, 0, 0, cv::INTER_AREA);
    return resized;
}

const std::vector<std::string>& ImageCodec::supportedExtensions() {
    static const std::vector<std::string> extensions = {
        ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".tiff", ".webp"
    };
    return extensions;
}

bool ImageCodec::isSupportedExtension(const std::string& path) {
    const std::string ext = FileUtils::getFileExtension(path);
    const auto& allowed = supportedExtensions();
    return std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
}

} // namespace utils
} // namespace wojak
