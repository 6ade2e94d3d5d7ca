#include "wojak/face/FaceTypes.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace wojak {
namespace face {

const std::array<RegionName, 5>& blendOrder() {
    static const std::array<RegionName, 5> order = {
        RegionName::FACE, RegionName::NOSE, RegionName::MOUTH,
        RegionName::LEFT_EYE, RegionName::RIGHT_EYE
    };
    return order;
}

std::string regionNameToString(RegionName region) {
    switch (region) {
        case RegionName::FACE:      return "face";
        case RegionName::NOSE:      return "nose";
        case RegionName::MOUTH:     return "mouth";
        case RegionName::LEFT_EYE:  return "left_eye";
        case RegionName::RIGHT_EYE: return "right_eye";
        default:                    return "unknown";
    }
}

std::optional<RegionName> regionNameFromString(const std::string& name) {
    for (RegionName region : blendOrder()) {
        if (regionNameToString(region) == name) {
            return region;
        }
    }
    return std::nullopt;
}

std::string imageQualityToString(ImageQuality quality) {
    switch (quality) {
        case ImageQuality::LOW:    return "low";
        case ImageQuality::MEDIUM: return "medium";
        case ImageQuality::HIGH:   return "high";
        default:                   return "unknown";
    }
}

const std::vector<std::string>& canonicalLandmarkNames() {
    using namespace landmark_names;
    static const std::vector<std::string> names = {
        LEFT_EYE_CENTER, LEFT_EYE_OUTER, LEFT_EYE_INNER, LEFT_EYE_TOP, LEFT_EYE_BOTTOM,
        RIGHT_EYE_CENTER, RIGHT_EYE_INNER, RIGHT_EYE_OUTER, RIGHT_EYE_TOP, RIGHT_EYE_BOTTOM,
        NOSE_BRIDGE, NOSE_TIP, NOSE_LEFT, NOSE_RIGHT,
        MOUTH_LEFT, MOUTH_RIGHT, MOUTH_TOP, MOUTH_BOTTOM,
        CHIN
    };
    return names;
}

const std::vector<std::string>& defaultRegionAnchors(RegionName region) {
    using namespace landmark_names;
    static const std::vector<std::string> face = {
        LEFT_EYE_CENTER, RIGHT_EYE_CENTER, NOSE_TIP, MOUTH_LEFT, MOUTH_RIGHT, CHIN
    };
    static const std::vector<std::string> left_eye = {
        LEFT_EYE_OUTER, LEFT_EYE_INNER, LEFT_EYE_TOP, LEFT_EYE_BOTTOM
    };
    static const std::vector<std::string> right_eye = {
        RIGHT_EYE_INNER, RIGHT_EYE_OUTER, RIGHT_EYE_TOP, RIGHT_EYE_BOTTOM
    };
    static const std::vector<std::string> nose = {
        NOSE_BRIDGE, NOSE_TIP, NOSE_LEFT, NOSE_RIGHT
    };
    static const std::vector<std::string> mouth = {
        MOUTH_LEFT, MOUTH_RIGHT, MOUTH_TOP, MOUTH_BOTTOM
    };

    switch (region) {
        case RegionName::LEFT_EYE:  return left_eye;
        case RegionName::RIGHT_EYE: return right_eye;
        case RegionName::NOSE:      return nose;
        case RegionName::MOUTH:     return mouth;
        case RegionName::FACE:
        default:                    return face;
    }
}

std::optional<LandmarkSet> LandmarkSet::create(std::vector<NamedLandmark> points,
                                               std::vector<cv::Point2f> outline) {
    if (outline.size() < kMinOutlinePoints) {
        return std::nullopt;
    }
    for (const auto& p : outline) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            return std::nullopt;
        }
    }

    LandmarkSet set;
    for (auto& named : points) {
        if (!std::isfinite(named.point.x) || !std::isfinite(named.point.y)) {
            return std::nullopt;
        }
        if (set.index_.count(named.name) != 0) {
            return std::nullopt;
        }
        set.index_[named.name] = set.points_.size();
        set.points_.push_back(std::move(named));
    }

    for (const auto& name : canonicalLandmarkNames()) {
        if (set.index_.count(name) == 0) {
            return std::nullopt;
        }
    }

    set.outline_ = std::move(outline);
    return set;
}

bool LandmarkSet::has(const std::string& name) const {
    return index_.count(name) != 0;
}

const LandmarkPoint2D& LandmarkSet::at(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::out_of_range("Landmark '" + name + "' not in set");
    }
    return points_[it->second].point;
}

float LandmarkSet::meanConfidence() const {
    if (points_.empty()) {
        return 0.0f;
    }
    float sum = 0.0f;
    for (const auto& named : points_) {
        sum += named.point.confidence;
    }
    return sum / static_cast<float>(points_.size());
}

float LandmarkSet::interEyeDistance() const {
    if (!has(landmark_names::LEFT_EYE_CENTER) || !has(landmark_names::RIGHT_EYE_CENTER)) {
        return 0.0f;
    }
    cv::Point2f d = position(landmark_names::RIGHT_EYE_CENTER) -
                    position(landmark_names::LEFT_EYE_CENTER);
    return std::sqrt(d.x * d.x + d.y * d.y);
}

cv::Rect2f LandmarkSet::boundingBox() const {
    if (outline_.empty() && points_.empty()) {
        return cv::Rect2f();
    }
    float min_x = std::numeric_limits<float>::max();
    float min_y = std::numeric_limits<float>::max();
    float max_x = std::numeric_limits<float>::lowest();
    float max_y = std::numeric_limits<float>::lowest();

    auto extend = [&](const cv::Point2f& p) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    };
    for (const auto& p : outline_) extend(p);
    for (const auto& named : points_) extend(named.point.point());

    return cv::Rect2f(min_x, min_y, max_x - min_x, max_y - min_y);
}

std::string ValidationReport::toString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "ValidationReport {\n";
    oss << "  valid: " << (valid ? "true" : "false") << "\n";
    oss << "  image_quality: " << imageQualityToString(image_quality) << "\n";
    oss << "  faces_detected: " << faces_detected << "\n";
    if (face_detected) {
        oss << "  resolution_quality: " << imageQualityToString(resolution_quality) << "\n";
        oss << "  landmark_quality: " << imageQualityToString(landmark_quality)
            << " (mean confidence " << std::setprecision(2) << mean_landmark_confidence
            << std::setprecision(1) << ")\n";
        oss << "  inter_eye_distance: " << inter_eye_distance_px << " px\n";
        oss << "  pose: yaw=" << yaw_deg << " pitch=" << pitch_deg << " roll=" << roll_deg << "\n";
    }
    if (!unreliable_landmarks.empty()) {
        oss << "  unreliable_landmarks:";
        for (const auto& name : unreliable_landmarks) {
            oss << " " << name;
        }
        oss << "\n";
    }
    oss << "  issues: [";
    for (size_t i = 0; i < issues.size(); ++i) {
        oss << (i ? ", " : "") << "\"" << issues[i] << "\"";
    }
    oss << "]\n}";
    return oss.str();
}

} // namespace face
} // namespace wojak
