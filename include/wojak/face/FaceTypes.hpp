#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wojak {
namespace face {

/**
 * @brief Facial landmark types shared by detector, validator, templates and compositor
 *
 * Detected landmarks and template anchors use the same named schema so that a
 * region's anchors can be looked up by name on both sides of an alignment.
 */

/// Image quality tiers, ordered so that std::min yields the worse tier
enum class ImageQuality {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2
};

/// Named facial regions. Enumerator order is the blend order.
enum class RegionName {
    FACE = 0,
    NOSE = 1,
    MOUTH = 2,
    LEFT_EYE = 3,
    RIGHT_EYE = 4
};

/// Fixed compositing order: coarse face first, fine features last
const std::array<RegionName, 5>& blendOrder();

std::string regionNameToString(RegionName region);
std::optional<RegionName> regionNameFromString(const std::string& name);

std::string imageQualityToString(ImageQuality quality);

/// Canonical landmark names, in schema order. "left" is the viewer's left.
namespace landmark_names {
    constexpr const char* LEFT_EYE_CENTER = "left_eye_center";
    constexpr const char* LEFT_EYE_OUTER = "left_eye_outer";
    constexpr const char* LEFT_EYE_INNER = "left_eye_inner";
    constexpr const char* LEFT_EYE_TOP = "left_eye_top";
    constexpr const char* LEFT_EYE_BOTTOM = "left_eye_bottom";
    constexpr const char* RIGHT_EYE_CENTER = "right_eye_center";
    constexpr const char* RIGHT_EYE_INNER = "right_eye_inner";
    constexpr const char* RIGHT_EYE_OUTER = "right_eye_outer";
    constexpr const char* RIGHT_EYE_TOP = "right_eye_top";
    constexpr const char* RIGHT_EYE_BOTTOM = "right_eye_bottom";
    constexpr const char* NOSE_BRIDGE = "nose_bridge";
    constexpr const char* NOSE_TIP = "nose_tip";
    constexpr const char* NOSE_LEFT = "nose_left";
    constexpr const char* NOSE_RIGHT = "nose_right";
    constexpr const char* MOUTH_LEFT = "mouth_left";
    constexpr const char* MOUTH_RIGHT = "mouth_right";
    constexpr const char* MOUTH_TOP = "mouth_top";
    constexpr const char* MOUTH_BOTTOM = "mouth_bottom";
    constexpr const char* CHIN = "chin";
} // namespace landmark_names

/// All canonical names in schema order
const std::vector<std::string>& canonicalLandmarkNames();

/// Default anchor names for a region (used when a template does not override them)
const std::vector<std::string>& defaultRegionAnchors(RegionName region);

/// Minimum number of outline points for a populated landmark set
constexpr size_t kMinOutlinePoints = 3;

/**
 * @brief 2D facial landmark point with confidence
 */
struct LandmarkPoint2D {
    float x, y;           ///< 2D coordinates in image space
    float confidence;     ///< Detection confidence (0-1)

    LandmarkPoint2D() : x(0), y(0), confidence(0) {}
    LandmarkPoint2D(float x_, float y_, float conf = 1.0f)
        : x(x_), y(y_), confidence(conf) {}

    cv::Point2f point() const { return cv::Point2f(x, y); }
};

struct NamedLandmark {
    std::string name;
    LandmarkPoint2D point;
};

/**
 * @brief Ordered named landmark set plus face outline polygon
 *
 * Either fully populated (every canonical name, finite coordinates, outline of
 * at least kMinOutlinePoints) or not produced at all.
 */
class LandmarkSet {
public:
    LandmarkSet() = default;

    /**
     * @brief Build a set from named points and an outline
     * @return std::nullopt unless the result is fully populated
     */
    static std::optional<LandmarkSet> create(std::vector<NamedLandmark> points,
                                             std::vector<cv::Point2f> outline);

    const std::vector<NamedLandmark>& points() const { return points_; }
    const std::vector<cv::Point2f>& outline() const { return outline_; }

    bool has(const std::string& name) const;

    /**
     * @brief Get a point by name
     * @throws std::out_of_range if the name is not part of the set
     */
    const LandmarkPoint2D& at(const std::string& name) const;

    cv::Point2f position(const std::string& name) const { return at(name).point(); }

    float meanConfidence() const;

    float interEyeDistance() const;

    cv::Rect2f boundingBox() const;

    /// Copy with every point and outline vertex mapped through fn
    template<typename Fn>
    LandmarkSet transformed(Fn fn) const {
        LandmarkSet out(*this);
        for (auto& named : out.points_) {
            cv::Point2f p = fn(named.point.point());
            named.point.x = p.x;
            named.point.y = p.y;
        }
        for (auto& p : out.outline_) {
            p = fn(p);
        }
        return out;
    }

private:
    std::vector<NamedLandmark> points_;
    std::map<std::string, size_t> index_;
    std::vector<cv::Point2f> outline_;
};

/**
 * @brief Face detection bounding box with metadata
 */
struct FaceBoundingBox {
    cv::Rect2f bbox;              ///< Face bounding box in image coordinates
    float confidence;             ///< Detection confidence (0-1)

    FaceBoundingBox() : confidence(0) {}
    FaceBoundingBox(const cv::Rect2f& box, float conf) : bbox(box), confidence(conf) {}

    float area() const { return bbox.area(); }
};

/**
 * @brief One face reported by a landmark backend, 68 points in iBUG order
 */
struct FaceCandidate {
    FaceBoundingBox face;
    std::vector<LandmarkPoint2D> points68;
};

/**
 * @brief Validation report attached to every generation result
 */
struct ValidationReport {
    bool valid = false;
    ImageQuality image_quality = ImageQuality::LOW;
    std::vector<std::string> issues;

    // Diagnostics
    bool face_detected = false;
    int faces_detected = 0;
    ImageQuality resolution_quality = ImageQuality::LOW;
    ImageQuality landmark_quality = ImageQuality::LOW;
    float mean_landmark_confidence = 0.0f;
    float inter_eye_distance_px = 0.0f;
    float yaw_deg = 0.0f;
    float pitch_deg = 0.0f;
    float roll_deg = 0.0f;

    /// Landmarks that are low-confidence or out of bounds; regions anchored on them are not blended
    std::set<std::string> unreliable_landmarks;

    std::string toString() const;
};

} // namespace face
} // namespace wojak
