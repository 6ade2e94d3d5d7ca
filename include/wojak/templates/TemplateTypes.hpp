#pragma once

#include "wojak/face/FaceTypes.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wojak {
namespace templates {

/**
 * @brief Per-channel color statistics in CIE Lab (float, L in [0,100])
 */
struct LabStatistics {
    cv::Scalar mean;
    cv::Scalar stddev;
    double pixel_count = 0;   ///< Pixels under the mask

    bool valid() const { return pixel_count > 0; }
};

/**
 * @brief Named facial region of a template
 *
 * Immutable after load. The mask polygon is in template pixel coordinates.
 */
struct RegionDefinition {
    face::RegionName name = face::RegionName::FACE;
    std::vector<std::string> anchors;      ///< Landmark names anchoring the region
    std::vector<cv::Point> mask_polygon;   ///< Closed polygon in template coordinates
    std::optional<float> default_weight;   ///< Template's blend weight in [0,1], unset uses the configured default
};

enum class TemplateSource {
    ASSET,          ///< Base image loaded from disk
    PLACEHOLDER     ///< Synthesized because the asset was missing
};

std::string templateSourceToString(TemplateSource source);

/**
 * @brief Cartoon template: base image, reference landmarks and regions
 */
struct Template {
    std::string id;
    std::string display_name;
    std::string description;

    cv::Mat image;                          ///< BGR, CV_8UC3
    face::LandmarkSet landmarks;            ///< Reference landmarks in template coordinates
    std::vector<RegionDefinition> regions;  ///< One per region name

    TemplateSource source = TemplateSource::PLACEHOLDER;
    std::string image_path;                 ///< Asset path (may not exist for placeholders)

    /// Lab statistics of the template under each region mask, computed at load
    std::map<face::RegionName, LabStatistics> palette;

    std::vector<uint8_t> thumbnail_png;

    /// Region by name, nullptr if the template does not define it
    const RegionDefinition* region(face::RegionName name) const;
};

/**
 * @brief Listing entry returned to callers
 */
struct TemplateSummary {
    std::string id;
    std::string display_name;
    std::string description;
    std::vector<uint8_t> thumbnail_bytes;   ///< PNG, fits in 150x150
};

} // namespace templates
} // namespace wojak
