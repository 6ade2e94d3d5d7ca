#include "wojak/face/FaceValidator.hpp"
#include "wojak/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace wojak {
namespace face {

namespace {

constexpr float kRadToDeg = 57.29577951308232f;

std::string formatFixed(float value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

float asinDegrees(float value) {
    return std::asin(std::clamp(value, -1.0f, 1.0f)) * kRadToDeg;
}

} // namespace

bool ValidatorConfig::validate() const {
    return medium_resolution_min_side > 0 &&
           high_resolution_min_side >= medium_resolution_min_side &&
           medium_confidence >= 0.0f && high_confidence >= medium_confidence &&
           high_confidence <= 1.0f &&
           min_point_confidence >= 0.0f && min_point_confidence <= 1.0f &&
           max_yaw_deg > 0.0f && max_pitch_deg > 0.0f && max_roll_deg > 0.0f &&
           frontal_nose_ratio > 0.0f && frontal_nose_ratio < 1.0f &&
           min_eye_distance_px >= 0.0f;
}

std::string ValidatorConfig::toString() const {
    std::ostringstream oss;
    oss << "ValidatorConfig {\n";
    oss << "  resolution tiers: high>=" << high_resolution_min_side
        << " medium>=" << medium_resolution_min_side << "\n";
    oss << "  confidence tiers: high>=" << high_confidence
        << " medium>=" << medium_confidence << "\n";
    oss << "  min_point_confidence: " << min_point_confidence << "\n";
    oss << "  pose limits: yaw " << max_yaw_deg << " pitch " << max_pitch_deg
        << " roll " << max_roll_deg << "\n";
    oss << "  frontal_nose_ratio: " << frontal_nose_ratio << "\n";
    oss << "  min_eye_distance_px: " << min_eye_distance_px << "\n";
    oss << "}";
    return oss.str();
}

FaceValidator::FaceValidator(const ValidatorConfig& config) : config_(config) {
    if (!config_.validate()) {
        LOG_WARNING("Invalid validator configuration, using defaults");
        config_ = ValidatorConfig();
    }
}

ImageQuality FaceValidator::resolutionTier(const cv::Size& size) const {
    int min_side = std::min(size.width, size.height);
    if (min_side >= config_.high_resolution_min_side) {
        return ImageQuality::HIGH;
    }
    if (min_side >= config_.medium_resolution_min_side) {
        return ImageQuality::MEDIUM;
    }
    return ImageQuality::LOW;
}

ImageQuality FaceValidator::confidenceTier(float mean_confidence) const {
    if (mean_confidence >= config_.high_confidence) {
        return ImageQuality::HIGH;
    }
    if (mean_confidence >= config_.medium_confidence) {
        return ImageQuality::MEDIUM;
    }
    return ImageQuality::LOW;
}

PoseEstimate FaceValidator::estimatePose(const LandmarkSet& landmarks) const {
    using namespace landmark_names;
    PoseEstimate pose;

    cv::Point2f left = landmarks.position(LEFT_EYE_CENTER);
    cv::Point2f right = landmarks.position(RIGHT_EYE_CENTER);
    cv::Point2f eye_vec = right - left;
    float eye_dist = std::sqrt(eye_vec.dot(eye_vec));
    if (eye_dist < 1e-3f) {
        return pose;
    }

    pose.roll_deg = std::atan2(eye_vec.y, eye_vec.x) * kRadToDeg;

    // Face frame: u along the eye line, n pointing from eyes toward mouth
    cv::Point2f u(eye_vec.x / eye_dist, eye_vec.y / eye_dist);
    cv::Point2f n(-u.y, u.x);

    cv::Point2f eye_mid = (left + right) * 0.5f;
    cv::Point2f nose = landmarks.position(NOSE_TIP);
    cv::Point2f mouth_mid = (landmarks.position(MOUTH_LEFT) + landmarks.position(MOUTH_RIGHT)) * 0.5f;

    // Nose tip drifts toward one eye as the head turns
    float lateral = (nose - eye_mid).dot(u);
    pose.yaw_deg = asinDegrees(lateral / (0.5f * eye_dist));

    // Nose tip moves toward the mouth line as the head tilts down
    float eye_to_mouth = (mouth_mid - eye_mid).dot(n);
    if (eye_to_mouth <= 1e-3f) {
        // Mouth at or above the eye line: upside down or extreme tilt
        pose.pitch_deg = 90.0f;
        return pose;
    }
    float ratio = (nose - eye_mid).dot(n) / eye_to_mouth;
    pose.pitch_deg = asinDegrees(2.0f * (ratio - config_.frontal_nose_ratio));

    return pose;
}

RegionAnchors defaultAnchorMap() {
    RegionAnchors anchors;
    for (RegionName region : blendOrder()) {
        anchors[region] = defaultRegionAnchors(region);
    }
    return anchors;
}

ValidationReport FaceValidator::validate(const std::optional<LandmarkSet>& landmarks,
                                         const cv::Mat& image,
                                         int faces_detected) const {
    return validate(landmarks, image, faces_detected, defaultAnchorMap());
}

ValidationReport FaceValidator::validate(const std::optional<LandmarkSet>& landmarks,
                                         const cv::Mat& image,
                                         int faces_detected,
                                         const RegionAnchors& region_anchors) const {
    ValidationReport report;
    report.face_detected = landmarks.has_value();
    report.faces_detected = faces_detected >= 0 ? faces_detected : (landmarks ? 1 : 0);
    report.resolution_quality = resolutionTier(image.size());

    if (!landmarks) {
        report.issues.push_back("No face detected in image");
    }

    if (report.resolution_quality == ImageQuality::LOW) {
        report.issues.push_back("Image resolution too low (shorter side " +
                                std::to_string(std::min(image.cols, image.rows)) +
                                " px, minimum " + std::to_string(config_.medium_resolution_min_side) +
                                " px)");
    }

    if (!landmarks) {
        report.landmark_quality = ImageQuality::LOW;
        report.image_quality = std::min(report.resolution_quality, report.landmark_quality);
        report.valid = false;
        return report;
    }

    if (report.faces_detected > 1) {
        report.issues.push_back("Multiple faces detected (" + std::to_string(report.faces_detected) +
                                "); using the largest");
    }

    report.mean_landmark_confidence = landmarks->meanConfidence();
    report.landmark_quality = confidenceTier(report.mean_landmark_confidence);
    report.image_quality = std::min(report.resolution_quality, report.landmark_quality);
    if (report.landmark_quality == ImageQuality::LOW) {
        report.issues.push_back("Facial landmarks detected with low confidence");
    }

    // Pose
    bool pose_ok = true;
    PoseEstimate pose = estimatePose(*landmarks);
    report.yaw_deg = pose.yaw_deg;
    report.pitch_deg = pose.pitch_deg;
    report.roll_deg = pose.roll_deg;

    if (std::fabs(pose.yaw_deg) > config_.max_yaw_deg) {
        pose_ok = false;
        report.issues.push_back("Face turned too far sideways (yaw " + formatFixed(pose.yaw_deg) +
                                " deg, limit " + formatFixed(config_.max_yaw_deg) +
                                "); profile views are not supported");
    }
    if (std::fabs(pose.pitch_deg) > config_.max_pitch_deg) {
        pose_ok = false;
        report.issues.push_back("Head tilted too far up or down (pitch " + formatFixed(pose.pitch_deg) +
                                " deg, limit " + formatFixed(config_.max_pitch_deg) + ")");
    }
    if (std::fabs(pose.roll_deg) > config_.max_roll_deg) {
        pose_ok = false;
        report.issues.push_back("Head tilted sideways (roll " + formatFixed(pose.roll_deg) +
                                " deg, limit " + formatFixed(config_.max_roll_deg) + ")");
    }

    // Face size
    report.inter_eye_distance_px = landmarks->interEyeDistance();
    bool eyes_ok = report.inter_eye_distance_px >= config_.min_eye_distance_px;
    if (!eyes_ok) {
        report.issues.push_back("Face too small in image (eye distance " +
                                formatFixed(report.inter_eye_distance_px) + " px, minimum " +
                                formatFixed(config_.min_eye_distance_px) + " px)");
    }

    // Per-point reliability
    for (const auto& named : landmarks->points()) {
        const auto& p = named.point;
        bool inside = p.x >= 0.0f && p.y >= 0.0f &&
                      p.x < static_cast<float>(image.cols) && p.y < static_cast<float>(image.rows);
        if (!inside || p.confidence < config_.min_point_confidence) {
            report.unreliable_landmarks.insert(named.name);
        }
    }
    for (const auto& entry : region_anchors) {
        const auto& anchors = entry.second;
        bool affected = std::any_of(anchors.begin(), anchors.end(), [&](const std::string& name) {
            return report.unreliable_landmarks.count(name) != 0;
        });
        if (affected) {
            report.issues.push_back("Unreliable landmarks for region '" + regionNameToString(entry.first) +
                                    "'; it will keep the template pixels");
        }
    }

    report.valid = report.resolution_quality != ImageQuality::LOW && pose_ok && eyes_ok;

    WOJAK_LOG_DEBUG("FaceValidator") << "valid=" << report.valid
                                     << " quality=" << imageQualityToString(report.image_quality)
                                     << " yaw=" << pose.yaw_deg << " pitch=" << pose.pitch_deg
                                     << " roll=" << pose.roll_deg
                                     << " unreliable=" << report.unreliable_landmarks.size();
    return report;
}

} // namespace face
} // namespace wojak
