#pragma once

#include "wojak/templates/TemplateGeometry.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wojak {
namespace templates {

/**
 * @brief Per-region overrides of a manifest entry
 */
struct RegionOverride {
    std::optional<std::vector<std::string>> anchors;
    std::optional<std::vector<cv::Point>> polygon;
    std::optional<float> weight;
};

/**
 * @brief One template described in templates.yaml
 *
 * @code
 * templates:
 *   - id: doomer
 *     display_name: Doomer
 *     description: Depressed night-walking Wojak
 *     image: doomer.png
 *     geometry:                 # optional, canvas pixels scaled to the image
 *       preset: doomer          # built-in layout to start from
 *       canvas: [256, 256]
 *       head: { center: [128, 128], radius: 100 }
 *       left_eye: [108, 108]
 *       right_eye: [148, 108]
 *       eye_radius: 8
 *       nose: [128, 135]
 *       mouth: { center: [128, 170], axes: [15, 8] }
 *     landmarks:                # optional per-name overrides, image pixels
 *       chin: [128, 220]
 *     regions:                  # optional per-region overrides
 *       mouth: { weight: 0.7, anchors: [mouth_left, mouth_right], polygon: [[100, 150], ...] }
 * @endcode
 */
struct ManifestEntry {
    std::string id;
    std::string display_name;
    std::string description;
    std::string image;                          ///< File name relative to the template directory

    std::string geometry_preset;                ///< Built-in layout id, empty: use id
    std::optional<TemplateGeometry> geometry;   ///< Explicit layout on its canvas
    std::map<std::string, cv::Point2f> landmark_overrides;
    std::map<face::RegionName, RegionOverride> region_overrides;
};

constexpr const char* kManifestFileName = "templates.yaml";

/**
 * @brief Read <directory>/templates.yaml
 *
 * Malformed entries are skipped with an error log.
 * @return std::nullopt if the manifest is absent or not valid YAML
 */
std::optional<std::vector<ManifestEntry>> readManifest(const std::string& directory);

/**
 * @brief Manifest entries for the built-in templates
 */
std::vector<ManifestEntry> builtinManifest();

/**
 * @brief Register a new template image in a template directory
 *
 * Copies the image into the directory as <id><ext> and appends an entry with
 * the default geometry to templates.yaml. A directory without a manifest gets
 * one listing the built-in templates first. Takes effect on the next load.
 *
 * @throws core::Exception ERROR_INVALID_PARAMETER for a bad id, duplicate id or
 *         unsupported image type
 * @throws core::FileException on I/O failure
 */
void appendManifestEntry(const std::string& directory,
                         const std::string& source_image_path,
                         const ManifestEntry& entry);

/// Display name from an id or file stem ("pointer_wojak" -> "Pointer Wojak")
std::string displayNameFromId(const std::string& id);

} // namespace templates
} // namespace wojak
