#pragma once

#include "wojak/face/FaceTypes.hpp"
#include <opencv2/core.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wojak {
namespace face {

/**
 * @brief Thresholds for the face quality heuristics
 */
struct ValidatorConfig {
    // Resolution tiers on the shorter image side
    int high_resolution_min_side = 256;
    int medium_resolution_min_side = 128;

    // Landmark confidence tiers on the mean point confidence
    float high_confidence = 0.8f;
    float medium_confidence = 0.5f;

    /// Points below this confidence are unreliable
    float min_point_confidence = 0.3f;

    // Pose limits in degrees
    float max_yaw_deg = 35.0f;
    float max_pitch_deg = 30.0f;
    float max_roll_deg = 30.0f;

    /// Nose tip position between eye line (0) and mouth line (1) on a frontal face
    float frontal_nose_ratio = 0.52f;

    float min_eye_distance_px = 20.0f;

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief Head pose estimated from 2D landmark geometry
 */
struct PoseEstimate {
    float yaw_deg = 0.0f;     ///< Positive when the nose is right of the eye midpoint
    float pitch_deg = 0.0f;   ///< Positive when the nose sits low (head tilted down)
    float roll_deg = 0.0f;    ///< Eye line angle, positive clockwise in image space
};

/**
 * @brief Rates detector output against quality heuristics
 *
 * Never throws for bad input: every failed check becomes an issue in the
 * report. A failing report still allows best-effort generation.
 */
/// Anchor landmark names per region, used to name regions with unreliable points
using RegionAnchors = std::map<RegionName, std::vector<std::string>>;

/// Anchors of the built-in region layout
RegionAnchors defaultAnchorMap();

class FaceValidator {
public:
    explicit FaceValidator(const ValidatorConfig& config = ValidatorConfig());

    /**
     * @brief Validate landmarks detected in image
     * @param landmarks Detected landmarks, std::nullopt when no face was found
     * @param image Source image the landmarks refer to
     * @param faces_detected Face count reported by the detector
     */
    ValidationReport validate(const std::optional<LandmarkSet>& landmarks,
                              const cv::Mat& image,
                              int faces_detected = -1) const;

    /// As above, with region issues named against a template's own anchors
    ValidationReport validate(const std::optional<LandmarkSet>& landmarks,
                              const cv::Mat& image,
                              int faces_detected,
                              const RegionAnchors& region_anchors) const;

    ImageQuality resolutionTier(const cv::Size& size) const;
    ImageQuality confidenceTier(float mean_confidence) const;

    PoseEstimate estimatePose(const LandmarkSet& landmarks) const;

    const ValidatorConfig& getConfig() const { return config_; }

private:
    ValidatorConfig config_;
};

} // namespace face
} // namespace wojak
