#include "wojak/templates/TemplateGeometry.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace wojak {
namespace templates {

namespace {

constexpr int kCanvasSide = 256;
constexpr int kOutlinePoints = 27;
constexpr double kPi = 3.14159265358979323846;

cv::Point toPixel(const cv::Point2f& p) {
    return cv::Point(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
}

std::vector<cv::Point> ellipsePolygon(const cv::Point2f& center, float axis_x, float axis_y) {
    std::vector<cv::Point> poly;
    cv::ellipse2Poly(toPixel(center),
                     cv::Size(std::max(1, static_cast<int>(std::lround(axis_x))),
                              std::max(1, static_cast<int>(std::lround(axis_y)))),
                     0, 0, 360, 10, poly);
    return poly;
}

face::NamedLandmark at(const char* name, const cv::Point2f& p) {
    return face::NamedLandmark{name, face::LandmarkPoint2D(p.x, p.y, 1.0f)};
}

// Placeholder drawings, colors in BGR
cv::Mat drawBasic() {
    cv::Mat image(kCanvasSide, kCanvasSide, CV_8UC3, cv::Scalar(240, 240, 240));

    cv::circle(image, cv::Point(128, 128), 100, cv::Scalar(220, 220, 220), -1);
    cv::circle(image, cv::Point(128, 128), 100, cv::Scalar(200, 200, 200), 2);

    cv::circle(image, cv::Point(108, 108), 8, cv::Scalar(0, 0, 0), -1);
    cv::circle(image, cv::Point(148, 108), 8, cv::Scalar(0, 0, 0), -1);

    cv::ellipse(image, cv::Point(128, 160), cv::Size(15, 8), 0, 0, 180, cv::Scalar(0, 0, 0), 2);

    cv::circle(image, cv::Point(128, 135), 3, cv::Scalar(180, 180, 180), -1);
    return image;
}

cv::Mat drawPointer() {
    cv::Mat image = drawBasic();
    cv::line(image, cv::Point(200, 140), cv::Point(230, 120), cv::Scalar(220, 180, 150), 8);
    cv::circle(image, cv::Point(230, 120), 6, cv::Scalar(220, 180, 150), -1);
    return image;
}

cv::Mat drawDoomer() {
    cv::Mat image;
    cv::convertScaleAbs(drawBasic(), image, 0.8, -20);

    // Dark circles under the eyes
    cv::ellipse(image, cv::Point(108, 118), cv::Size(12, 6), 0, 0, 180, cv::Scalar(100, 100, 100), -1);
    cv::ellipse(image, cv::Point(148, 118), cv::Size(12, 6), 0, 0, 180, cv::Scalar(100, 100, 100), -1);

    // Frown
    cv::ellipse(image, cv::Point(128, 170), cv::Size(15, 8), 0, 180, 360, cv::Scalar(0, 0, 0), 2);
    return image;
}

cv::Mat drawSoyjak() {
    cv::Mat image = drawBasic();

    // Open mouth
    cv::ellipse(image, cv::Point(128, 165), cv::Size(20, 15), 0, 0, 180, cv::Scalar(0, 0, 0), -1);
    cv::ellipse(image, cv::Point(128, 165), cv::Size(15, 10), 0, 0, 180, cv::Scalar(255, 255, 255), -1);

    // Wide eyes
    cv::circle(image, cv::Point(108, 108), 10, cv::Scalar(255, 255, 255), -1);
    cv::circle(image, cv::Point(148, 108), 10, cv::Scalar(255, 255, 255), -1);
    cv::circle(image, cv::Point(108, 108), 6, cv::Scalar(0, 0, 0), -1);
    cv::circle(image, cv::Point(148, 108), 6, cv::Scalar(0, 0, 0), -1);
    return image;
}

cv::Mat drawBrainlet() {
    cv::Mat image = drawBasic();

    // Small head over the basic one
    cv::circle(image, cv::Point(128, 128), 80, cv::Scalar(240, 240, 240), -1);
    cv::circle(image, cv::Point(128, 138), 70, cv::Scalar(220, 220, 220), -1);
    cv::circle(image, cv::Point(128, 138), 70, cv::Scalar(200, 200, 200), 2);

    cv::circle(image, cv::Point(118, 128), 6, cv::Scalar(0, 0, 0), -1);
    cv::circle(image, cv::Point(138, 128), 6, cv::Scalar(0, 0, 0), -1);

    cv::ellipse(image, cv::Point(128, 160), cv::Size(10, 5), 0, 0, 180, cv::Scalar(0, 0, 0), 2);
    return image;
}

} // namespace

const std::vector<std::string>& builtinTemplateIds() {
    static const std::vector<std::string> ids = {
        "wojak_basic", "pointer_wojak", "doomer", "soyjak", "brainlet"
    };
    return ids;
}

TemplateGeometry TemplateGeometry::builtin(const std::string& template_id) {
    TemplateGeometry g;
    if (template_id == "doomer") {
        g.mouth = cv::Point2f(128.0f, 170.0f);
    } else if (template_id == "soyjak") {
        g.eye_radius = 10.0f;
        g.mouth = cv::Point2f(128.0f, 165.0f);
        g.mouth_axes = cv::Size2f(20.0f, 15.0f);
    } else if (template_id == "brainlet") {
        g.head_center = cv::Point2f(128.0f, 138.0f);
        g.head_radius = 70.0f;
        g.left_eye = cv::Point2f(118.0f, 128.0f);
        g.right_eye = cv::Point2f(138.0f, 128.0f);
        g.eye_radius = 6.0f;
        g.nose = cv::Point2f(128.0f, 145.0f);
        g.mouth_axes = cv::Size2f(10.0f, 5.0f);
    }
    return g;
}

TemplateGeometry TemplateGeometry::scaledTo(const cv::Size& target) const {
    if (target == canvas || canvas.width <= 0 || canvas.height <= 0) {
        TemplateGeometry same(*this);
        same.canvas = target;
        return same;
    }

    const float sx = static_cast<float>(target.width) / canvas.width;
    const float sy = static_cast<float>(target.height) / canvas.height;
    const float s = std::min(sx, sy);
    auto scale = [&](const cv::Point2f& p) { return cv::Point2f(p.x * sx, p.y * sy); };

    TemplateGeometry g;
    g.canvas = target;
    g.head_center = scale(head_center);
    g.head_radius = head_radius * s;
    g.left_eye = scale(left_eye);
    g.right_eye = scale(right_eye);
    g.eye_radius = eye_radius * s;
    g.nose = scale(nose);
    g.mouth = scale(mouth);
    g.mouth_axes = cv::Size2f(mouth_axes.width * s, mouth_axes.height * s);
    return g;
}

face::LandmarkSet landmarksFromGeometry(const TemplateGeometry& g) {
    using namespace face::landmark_names;
    const float s = g.head_radius / 100.0f;
    const float eye_half_width = 1.25f * g.eye_radius;
    const float eye_half_height = 0.875f * g.eye_radius;
    const cv::Point2f eye_mid = (g.left_eye + g.right_eye) * 0.5f;
    const cv::Point2f bridge = eye_mid + (g.nose - eye_mid) * 0.15f;

    std::vector<face::NamedLandmark> points = {
        at(LEFT_EYE_CENTER, g.left_eye),
        at(LEFT_EYE_OUTER, g.left_eye - cv::Point2f(eye_half_width, 0)),
        at(LEFT_EYE_INNER, g.left_eye + cv::Point2f(eye_half_width, 0)),
        at(LEFT_EYE_TOP, g.left_eye - cv::Point2f(0, eye_half_height)),
        at(LEFT_EYE_BOTTOM, g.left_eye + cv::Point2f(0, eye_half_height)),
        at(RIGHT_EYE_CENTER, g.right_eye),
        at(RIGHT_EYE_INNER, g.right_eye - cv::Point2f(eye_half_width, 0)),
        at(RIGHT_EYE_OUTER, g.right_eye + cv::Point2f(eye_half_width, 0)),
        at(RIGHT_EYE_TOP, g.right_eye - cv::Point2f(0, eye_half_height)),
        at(RIGHT_EYE_BOTTOM, g.right_eye + cv::Point2f(0, eye_half_height)),
        at(NOSE_BRIDGE, bridge),
        at(NOSE_TIP, g.nose),
        at(NOSE_LEFT, g.nose + cv::Point2f(-7.0f * s, 3.0f * s)),
        at(NOSE_RIGHT, g.nose + cv::Point2f(7.0f * s, 3.0f * s)),
        at(MOUTH_LEFT, g.mouth - cv::Point2f(g.mouth_axes.width, 0)),
        at(MOUTH_RIGHT, g.mouth + cv::Point2f(g.mouth_axes.width, 0)),
        at(MOUTH_TOP, g.mouth - cv::Point2f(0, 0.75f * g.mouth_axes.height)),
        at(MOUTH_BOTTOM, g.mouth + cv::Point2f(0, g.mouth_axes.height)),
        at(CHIN, g.head_center + cv::Point2f(0, 0.9f * g.head_radius))
    };

    std::vector<cv::Point2f> outline;
    outline.reserve(kOutlinePoints);
    for (int i = 0; i < kOutlinePoints; ++i) {
        double angle = 2.0 * kPi * i / kOutlinePoints;
        outline.emplace_back(g.head_center.x + g.head_radius * static_cast<float>(std::cos(angle)),
                             g.head_center.y + g.head_radius * static_cast<float>(std::sin(angle)));
    }

    auto set = face::LandmarkSet::create(std::move(points), std::move(outline));
    if (!set) {
        throw std::invalid_argument("Template geometry yields non-finite landmarks");
    }
    return *set;
}

std::vector<RegionDefinition> regionsFromGeometry(const TemplateGeometry& g) {
    const float s = g.head_radius / 100.0f;
    const cv::Point2f eye_mid = (g.left_eye + g.right_eye) * 0.5f;
    const cv::Point2f bridge = eye_mid + (g.nose - eye_mid) * 0.15f;
    const float nose_bottom = g.nose.y + 3.0f * s;

    std::vector<RegionDefinition> regions;
    for (face::RegionName name : face::blendOrder()) {
        RegionDefinition def;
        def.name = name;
        def.anchors = face::defaultRegionAnchors(name);

        switch (name) {
            case face::RegionName::FACE:
                def.mask_polygon = ellipsePolygon(g.head_center, 0.96f * g.head_radius, 0.96f * g.head_radius);
                break;
            case face::RegionName::NOSE:
                def.mask_polygon = ellipsePolygon(cv::Point2f(g.nose.x, 0.5f * (bridge.y + nose_bottom)),
                                                  10.0f * s, 0.5f * (nose_bottom - bridge.y) + 3.0f * s);
                break;
            case face::RegionName::MOUTH:
                def.mask_polygon = ellipsePolygon(g.mouth + cv::Point2f(0, s),
                                                  g.mouth_axes.width + 7.0f * s,
                                                  g.mouth_axes.height + 5.0f * s);
                break;
            case face::RegionName::LEFT_EYE:
                def.mask_polygon = ellipsePolygon(g.left_eye, 2.0f * g.eye_radius, 1.375f * g.eye_radius);
                break;
            case face::RegionName::RIGHT_EYE:
                def.mask_polygon = ellipsePolygon(g.right_eye, 2.0f * g.eye_radius, 1.375f * g.eye_radius);
                break;
        }
        regions.push_back(std::move(def));
    }
    return regions;
}

cv::Mat renderPlaceholder(const std::string& template_id, const cv::Size& size) {
    cv::Mat image;
    if (template_id == "pointer_wojak") {
        image = drawPointer();
    } else if (template_id == "doomer") {
        image = drawDoomer();
    } else if (template_id == "soyjak") {
        image = drawSoyjak();
    } else if (template_id == "brainlet") {
        image = drawBrainlet();
    } else {
        image = drawBasic();
    }

    if (size.width > 0 && size.height > 0 && size != image.size()) {
        cv::Mat resized;
        cv::resize(image, resized, size, 0, 0, cv::INTER_LINEAR);
        return resized;
    }
    return image;
}

} // namespace templates
} // namespace wojak
