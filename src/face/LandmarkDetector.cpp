#include "wojak/face/LandmarkDetector.hpp"
#include "wojak/core/Exception.hpp"
#include "wojak/core/Logger.hpp"
#include <opencv2/core/utility.hpp>
#include <opencv2/face.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <initializer_list>
#include <mutex>
#include <sstream>

namespace wojak {
namespace face {

namespace {

constexpr size_t kIbugPointCount = 68;

// Fallback locations for the stock OpenCV cascade
const std::vector<std::string> kCascadeSearchPaths = {
    "/usr/share/opencv4/haarcascades/haarcascade_frontalface_alt.xml",
    "/usr/local/share/opencv4/haarcascades/haarcascade_frontalface_alt.xml",
    "/usr/share/opencv/haarcascades/haarcascade_frontalface_alt.xml"
};

cv::Point2f meanOf(const std::vector<LandmarkPoint2D>& pts, std::initializer_list<int> idx,
                   float& confidence) {
    cv::Point2f sum(0.0f, 0.0f);
    float conf = 0.0f;
    for (int i : idx) {
        sum += pts[i].point();
        conf += pts[i].confidence;
    }
    float n = static_cast<float>(idx.size());
    confidence = conf / n;
    return cv::Point2f(sum.x / n, sum.y / n);
}

NamedLandmark averaged(const char* name, const std::vector<LandmarkPoint2D>& pts,
                       std::initializer_list<int> idx) {
    float conf = 0.0f;
    cv::Point2f p = meanOf(pts, idx, conf);
    return NamedLandmark{name, LandmarkPoint2D(p.x, p.y, conf)};
}

NamedLandmark single(const char* name, const std::vector<LandmarkPoint2D>& pts, int i) {
    return NamedLandmark{name, pts[i]};
}

} // namespace

bool DetectorConfig::validate() const {
    return min_image_side > 0 &&
           scale_factor > 1.0 &&
           min_neighbors >= 0 &&
           min_face_size > 0;
}

std::string DetectorConfig::toString() const {
    std::ostringstream oss;
    oss << "DetectorConfig {\n";
    oss << "  cascade_path: " << (cascade_path.empty() ? "<search>" : cascade_path) << "\n";
    oss << "  lbf_model_path: " << lbf_model_path << "\n";
    oss << "  min_image_side: " << min_image_side << "\n";
    oss << "  scale_factor: " << scale_factor << "\n";
    oss << "  min_neighbors: " << min_neighbors << "\n";
    oss << "  min_face_size: " << min_face_size << "\n";
    oss << "}";
    return oss.str();
}

// ---------------------------------------------------------------------------
// FacemarkBackend
// ---------------------------------------------------------------------------

/**
 * @brief Private implementation class for FacemarkBackend
 */
class FacemarkBackend::Impl {
public:
    DetectorConfig config_;

    mutable cv::CascadeClassifier face_cascade_;
    cv::Ptr<cv::face::Facemark> face_mark_;

    bool initialized_ = false;
    std::string last_error_;

    // Cascade and facemark keep internal buffers
    mutable std::mutex mutex_;

    explicit Impl(const DetectorConfig& config) : config_(config) {}

    bool loadCascade() {
        if (!config_.cascade_path.empty()) {
            if (face_cascade_.load(config_.cascade_path)) {
                return true;
            }
            last_error_ = "Failed to load face detection cascade: " + config_.cascade_path;
            return false;
        }

        std::string found = cv::samples::findFile("haarcascade_frontalface_alt.xml", false, true);
        if (!found.empty() && face_cascade_.load(found)) {
            return true;
        }
        for (const auto& path : kCascadeSearchPaths) {
            if (face_cascade_.load(path)) {
                return true;
            }
        }
        last_error_ = "Failed to load face detection cascade (no cascade_path configured)";
        return false;
    }

    bool loadLandmarkModel() {
        if (config_.lbf_model_path.empty()) {
            last_error_ = "No 68-point landmark model configured (detector.lbf_model_path)";
            return false;
        }
        face_mark_ = cv::face::FacemarkLBF::create();
        face_mark_->loadModel(config_.lbf_model_path);
        if (face_mark_->empty()) {
            last_error_ = "Failed to load 68-point landmark model: " + config_.lbf_model_path;
            face_mark_.release();
            return false;
        }
        return true;
    }

    /**
     * @brief Per-point confidence from local gradient magnitude
     *
     * Points near the face box border get a fixed low confidence.
     */
    static float estimateLandmarkConfidence(const cv::Point2f& point,
                                            const cv::Mat& grad_mag,
                                            const cv::Rect& face_rect) {
        cv::Point2f roi_point(point.x - face_rect.x, point.y - face_rect.y);

        if (roi_point.x < 5 || roi_point.x >= grad_mag.cols - 5 ||
            roi_point.y < 5 || roi_point.y >= grad_mag.rows - 5) {
            return 0.3f;
        }

        int x = static_cast<int>(roi_point.x);
        int y = static_cast<int>(roi_point.y);

        float sum = 0.0f;
        int sample_count = 0;
        for (int dy = -2; dy <= 2; dy++) {
            for (int dx = -2; dx <= 2; dx++) {
                int px = x + dx, py = y + dy;
                if (px >= 0 && px < grad_mag.cols && py >= 0 && py < grad_mag.rows) {
                    sum += grad_mag.at<float>(py, px);
                    sample_count++;
                }
            }
        }

        if (sample_count > 0) {
            // Typical gradient magnitude range 0-100
            return std::min(1.0f, (sum / sample_count) / 50.0f);
        }
        return 0.5f;
    }

    std::vector<FaceCandidate> detect(const cv::Mat& image) const {
        std::vector<FaceCandidate> candidates;

        cv::Mat gray;
        if (image.channels() == 3) {
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        } else if (image.channels() == 4) {
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = image;
        }
        cv::Mat equalized;
        cv::equalizeHist(gray, equalized);

        std::vector<cv::Rect> faces;
        std::vector<std::vector<cv::Point2f>> landmarks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            face_cascade_.detectMultiScale(equalized, faces, config_.scale_factor,
                                           config_.min_neighbors, 0,
                                           cv::Size(config_.min_face_size, config_.min_face_size));
            if (faces.empty()) {
                return candidates;
            }
            if (!face_mark_->fit(gray, faces, landmarks)) {
                WOJAK_LOG_WARNING("FacemarkBackend") << "Landmark fit failed for "
                                                     << faces.size() << " face(s)";
                return candidates;
            }
        }

        const cv::Rect bounds(0, 0, gray.cols, gray.rows);
        for (size_t i = 0; i < faces.size() && i < landmarks.size(); ++i) {
            cv::Rect face_rect = faces[i] & bounds;
            if (face_rect.area() == 0) {
                continue;
            }

            cv::Mat grad_x, grad_y, grad_mag;
            cv::Sobel(gray(face_rect), grad_x, CV_32F, 1, 0, 3);
            cv::Sobel(gray(face_rect), grad_y, CV_32F, 0, 1, 3);
            cv::magnitude(grad_x, grad_y, grad_mag);

            FaceCandidate candidate;
            candidate.points68.reserve(landmarks[i].size());
            float conf_sum = 0.0f;
            for (const auto& p : landmarks[i]) {
                float conf = estimateLandmarkConfidence(p, grad_mag, face_rect);
                candidate.points68.emplace_back(p.x, p.y, conf);
                conf_sum += conf;
            }
            float face_conf = landmarks[i].empty() ? 0.0f
                                                   : conf_sum / static_cast<float>(landmarks[i].size());
            candidate.face = FaceBoundingBox(cv::Rect2f(faces[i]), face_conf);
            candidates.push_back(std::move(candidate));
        }

        return candidates;
    }
};

FacemarkBackend::FacemarkBackend(const DetectorConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {}

FacemarkBackend::~FacemarkBackend() = default;

bool FacemarkBackend::initialize() {
    pImpl->initialized_ = false;
    pImpl->last_error_.clear();

    if (!pImpl->config_.validate()) {
        pImpl->last_error_ = "Invalid detector configuration";
        return false;
    }

    try {
        if (!pImpl->loadCascade() || !pImpl->loadLandmarkModel()) {
            LOG_ERROR("Detector initialization failed: " + pImpl->last_error_);
            return false;
        }
    } catch (const cv::Exception& e) {
        pImpl->last_error_ = std::string("OpenCV error during model initialization: ") + e.what();
        LOG_ERROR(pImpl->last_error_);
        return false;
    }

    pImpl->initialized_ = true;
    LOG_INFO("Facemark backend initialized (model " + pImpl->config_.lbf_model_path + ")");
    return true;
}

bool FacemarkBackend::isInitialized() const {
    return pImpl->initialized_;
}

std::string FacemarkBackend::getLastError() const {
    return pImpl->last_error_;
}

std::vector<FaceCandidate> FacemarkBackend::detectFaces(const cv::Mat& image) const {
    if (!pImpl->initialized_) {
        WOJAK_THROW(core::Exception, core::ResultCode::ERROR_DETECTOR_UNAVAILABLE,
                    "Facemark backend used before initialize()");
    }
    return pImpl->detect(image);
}

// ---------------------------------------------------------------------------
// LandmarkDetector
// ---------------------------------------------------------------------------

LandmarkDetector::LandmarkDetector(std::shared_ptr<const LandmarkBackend> backend,
                                   int min_image_side)
    : backend_(std::move(backend))
    , min_image_side_(min_image_side) {
    if (!backend_) {
        WOJAK_THROW(core::Exception, core::ResultCode::ERROR_INVALID_PARAMETER,
                    "LandmarkDetector requires a backend");
    }
}

DetectionResult LandmarkDetector::detect(const cv::Mat& image) const {
    if (image.cols < min_image_side_ || image.rows < min_image_side_) {
        WOJAK_THROW(core::ImageTooSmallException, image.cols, image.rows, min_image_side_);
    }

    auto start_time = std::chrono::steady_clock::now();
    std::vector<FaceCandidate> candidates = backend_->detectFaces(image);

    DetectionResult result;
    result.faces_detected = static_cast<int>(candidates.size());

    int chosen = selectDominantFace(candidates);
    if (chosen >= 0) {
        result.landmarks = fromIbug68(candidates[chosen].points68);
        result.face = candidates[chosen].face;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    WOJAK_LOG_DEBUG("LandmarkDetector") << backend_->name() << ": " << result.faces_detected
                                        << " face(s), landmarks " << (result.found() ? "found" : "absent")
                                        << " in " << elapsed.count() << " ms";
    return result;
}

int LandmarkDetector::selectDominantFace(const std::vector<FaceCandidate>& candidates) {
    int best = -1;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        if (c.points68.size() != kIbugPointCount) {
            continue;
        }
        bool finite = std::all_of(c.points68.begin(), c.points68.end(),
                                  [](const LandmarkPoint2D& p) {
                                      return std::isfinite(p.x) && std::isfinite(p.y);
                                  });
        if (!finite) {
            continue;
        }
        if (best < 0) {
            best = static_cast<int>(i);
            continue;
        }

        const auto& b = candidates[best].face.bbox;
        const auto& r = c.face.bbox;
        if (r.area() > b.area() ||
            (r.area() == b.area() && (r.y < b.y || (r.y == b.y && r.x < b.x)))) {
            best = static_cast<int>(i);
        }
    }
    return best;
}

std::optional<LandmarkSet> LandmarkDetector::fromIbug68(const std::vector<LandmarkPoint2D>& p) {
    if (p.size() != kIbugPointCount) {
        return std::nullopt;
    }

    using namespace landmark_names;
    // iBUG 36-41 is the eye on the viewer's left, 42-47 the one on the right
    std::vector<NamedLandmark> named = {
        averaged(LEFT_EYE_CENTER, p, {36, 37, 38, 39, 40, 41}),
        single(LEFT_EYE_OUTER, p, 36),
        single(LEFT_EYE_INNER, p, 39),
        averaged(LEFT_EYE_TOP, p, {37, 38}),
        averaged(LEFT_EYE_BOTTOM, p, {40, 41}),
        averaged(RIGHT_EYE_CENTER, p, {42, 43, 44, 45, 46, 47}),
        single(RIGHT_EYE_INNER, p, 42),
        single(RIGHT_EYE_OUTER, p, 45),
        averaged(RIGHT_EYE_TOP, p, {43, 44}),
        averaged(RIGHT_EYE_BOTTOM, p, {46, 47}),
        single(NOSE_BRIDGE, p, 27),
        single(NOSE_TIP, p, 30),
        single(NOSE_LEFT, p, 31),
        single(NOSE_RIGHT, p, 35),
        single(MOUTH_LEFT, p, 48),
        single(MOUTH_RIGHT, p, 54),
        single(MOUTH_TOP, p, 51),
        single(MOUTH_BOTTOM, p, 57),
        single(CHIN, p, 8)
    };

    // Jaw line left to right, then brows right to left
    std::vector<cv::Point2f> outline;
    outline.reserve(27);
    for (int i = 0; i <= 16; ++i) {
        outline.push_back(p[i].point());
    }
    for (int i = 26; i >= 17; --i) {
        outline.push_back(p[i].point());
    }

    return LandmarkSet::create(std::move(named), std::move(outline));
}

} // namespace face
} // namespace wojak
