/**
 * @file TestFaces.hpp
 * @brief Synthetic faces and a scripted landmark backend for unit tests
 */

#pragma once

#include <wojak/face/LandmarkDetector.hpp>
#include <wojak/utils/ImageCodec.hpp>
#include <opencv2/imgproc.hpp>
#include <atomic>
#include <cmath>
#include <vector>

namespace wojak {
namespace test_support {

/**
 * @brief 68 iBUG points of an upright frontal face
 *
 * The face is centered on (cx, cy) with half-width w. Eyes sit at
 * cy - 0.2w, the mouth corners at cy + 0.56w and the nose tip at 52% of the
 * way between, so the pose heuristics read as frontal.
 */
inline std::vector<face::LandmarkPoint2D> frontalFace68(float cx, float cy, float w,
                                                        float confidence = 0.9f) {
    const float pi = 3.14159265f;
    std::vector<face::LandmarkPoint2D> p(68);
    auto set = [&](int i, float x, float y) { p[i] = face::LandmarkPoint2D(cx + x * w, cy + y * w, confidence); };

    // Jaw 0-16, chin at 8
    for (int i = 0; i <= 16; ++i) {
        float theta = pi - i * pi / 16.0f;
        set(i, std::cos(theta), 0.1f + 1.1f * std::sin(theta));
    }
    // Brows
    for (int i = 0; i < 5; ++i) {
        set(17 + i, -0.75f + 0.15f * i, -0.45f);
        set(22 + i, 0.15f + 0.15f * i, -0.45f);
    }
    // Nose bridge 27-30, base 31-35
    set(27, 0.0f, -0.2f);
    set(28, 0.0f, -0.07f);
    set(29, 0.0f, 0.06f);
    set(30, 0.0f, 0.195f);
    for (int i = 0; i < 5; ++i) {
        set(31 + i, -0.2f + 0.1f * i, 0.28f);
    }
    // Eyes
    set(36, -0.55f, -0.2f);
    set(37, -0.45f, -0.26f);
    set(38, -0.35f, -0.26f);
    set(39, -0.25f, -0.2f);
    set(40, -0.35f, -0.14f);
    set(41, -0.45f, -0.14f);
    set(42, 0.25f, -0.2f);
    set(43, 0.35f, -0.26f);
    set(44, 0.45f, -0.26f);
    set(45, 0.55f, -0.2f);
    set(46, 0.45f, -0.14f);
    set(47, 0.35f, -0.14f);
    // Outer lip 48-59 starting at the left corner, through the top
    for (int k = 0; k < 12; ++k) {
        float theta = pi + k * 2.0f * pi / 12.0f;
        set(48 + k, 0.35f * std::cos(theta), 0.56f + 0.09f * std::sin(theta));
    }
    // Inner lip 60-67
    for (int k = 0; k < 8; ++k) {
        float theta = pi + k * 2.0f * pi / 8.0f;
        set(60 + k, 0.25f * std::cos(theta), 0.56f + 0.04f * std::sin(theta));
    }
    return p;
}

inline face::FaceCandidate frontalCandidate(float cx, float cy, float w, float confidence = 0.9f) {
    face::FaceCandidate candidate;
    candidate.face = face::FaceBoundingBox(cv::Rect2f(cx - w, cy - 0.6f * w, 2.0f * w, 1.9f * w), 1.0f);
    candidate.points68 = frontalFace68(cx, cy, w, confidence);
    return candidate;
}

/**
 * @brief Backend returning a fixed candidate list for every image
 */
class MockLandmarkBackend : public face::LandmarkBackend {
public:
    explicit MockLandmarkBackend(std::vector<face::FaceCandidate> faces = {})
        : faces_(std::move(faces)) {}

    std::vector<face::FaceCandidate> detectFaces(const cv::Mat& image) const override {
        (void)image;
        ++calls_;
        return faces_;
    }

    std::string name() const override { return "mock"; }

    int calls() const { return calls_.load(); }

private:
    std::vector<face::FaceCandidate> faces_;
    mutable std::atomic<int> calls_{0};
};

/// Drawn portrait matching frontalFace68(cx, cy, w)
inline cv::Mat drawPortrait(const cv::Size& size, float cx, float cy, float w) {
    cv::Mat image(size, CV_8UC3, cv::Scalar(90, 120, 60));
    cv::ellipse(image, cv::Point(cvRound(cx), cvRound(cy + 0.3f * w)),
                cv::Size(cvRound(w), cvRound(w * 1.0f)), 0, 0, 360, cv::Scalar(150, 180, 225), -1);
    cv::circle(image, cv::Point(cvRound(cx - 0.4f * w), cvRound(cy - 0.2f * w)), cvRound(0.08f * w),
               cv::Scalar(60, 40, 30), -1);
    cv::circle(image, cv::Point(cvRound(cx + 0.4f * w), cvRound(cy - 0.2f * w)), cvRound(0.08f * w),
               cv::Scalar(60, 40, 30), -1);
    cv::ellipse(image, cv::Point(cvRound(cx), cvRound(cy + 0.56f * w)),
                cv::Size(cvRound(0.35f * w), cvRound(0.09f * w)), 0, 0, 360, cv::Scalar(80, 80, 190), -1);
    cv::line(image, cv::Point(cvRound(cx), cvRound(cy - 0.2f * w)),
             cv::Point(cvRound(cx), cvRound(cy + 0.2f * w)), cv::Scalar(110, 140, 190), 3);
    return image;
}

inline std::vector<uint8_t> encodePng(const cv::Mat& image) {
    return utils::ImageCodec::encode(image, ".png");
}

/// Landscape scene without a face
inline cv::Mat drawLandscape(const cv::Size& size) {
    cv::Mat image(size, CV_8UC3, cv::Scalar(235, 200, 150));
    cv::rectangle(image, cv::Point(0, size.height * 2 / 3), cv::Point(size.width, size.height),
                  cv::Scalar(40, 140, 60), -1);
    cv::circle(image, cv::Point(size.width * 3 / 4, size.height / 4), size.height / 10,
               cv::Scalar(60, 220, 250), -1);
    return image;
}

} // namespace test_support
} // namespace wojak
