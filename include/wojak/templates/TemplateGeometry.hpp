#pragma once

#include "wojak/templates/TemplateTypes.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace wojak {
namespace templates {

/**
 * @brief Authoring-time facial layout of a template
 *
 * Positions are in pixels of the template image. Reference landmarks and
 * region masks are derived from this layout. The built-in layouts are drawn
 * on a 256x256 canvas.
 */
struct TemplateGeometry {
    cv::Size canvas{256, 256};

    cv::Point2f head_center{128.0f, 128.0f};
    float head_radius = 100.0f;

    cv::Point2f left_eye{108.0f, 108.0f};
    cv::Point2f right_eye{148.0f, 108.0f};
    float eye_radius = 8.0f;

    cv::Point2f nose{128.0f, 135.0f};

    cv::Point2f mouth{128.0f, 160.0f};
    cv::Size2f mouth_axes{15.0f, 8.0f};

    /**
     * @brief Same layout on a canvas of another size
     *
     * Positions scale per axis, radii and axes by the smaller factor.
     */
    TemplateGeometry scaledTo(const cv::Size& target) const;

    /// Layout of a built-in template; unknown ids get the basic layout
    static TemplateGeometry builtin(const std::string& template_id);
};

/**
 * @brief Reference landmarks derived from a layout
 *
 * Eye corners sit 1.25 eye radii from the eye center, the outline is sampled
 * on the head circle.
 */
face::LandmarkSet landmarksFromGeometry(const TemplateGeometry& geometry);

/**
 * @brief Region masks and anchors derived from a layout, in blend order
 */
std::vector<RegionDefinition> regionsFromGeometry(const TemplateGeometry& geometry);

/**
 * @brief Draw the placeholder art of a built-in template
 *
 * Deterministic: same id and size always give the same pixels. Unknown ids
 * get the basic drawing. Drawn on 256x256 and resized when size differs.
 */
cv::Mat renderPlaceholder(const std::string& template_id, const cv::Size& size = cv::Size(256, 256));

/// Ids of the built-in templates, in listing order
const std::vector<std::string>& builtinTemplateIds();

} // namespace templates
} // namespace wojak
