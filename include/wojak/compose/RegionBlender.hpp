#pragma once

#include "wojak/compose/RegionPlan.hpp"
#include "wojak/templates/TemplateTypes.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace wojak {
namespace compose {

/**
 * @brief Blender configuration
 */
struct BlenderConfig {
    /// Mask weight ramps from 0 at the polygon edge to 1 at this depth
    float feather_radius_px = 4.0f;

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief Blend strength per region group, each in [0,1]
 */
struct RegionStrengths {
    float face = 0.6f;
    float eye = 0.8f;     ///< Both eyes
    float mouth = 0.7f;
    float nose = 0.3f;

    float forRegion(face::RegionName region) const;
};

/**
 * @brief What happened to one region during blending
 */
struct RegionBlendInfo {
    face::RegionName region = face::RegionName::FACE;
    bool blended = false;
    double mask_area = 0.0;      ///< Sum of the soft mask weights
    std::string note;            ///< Exclusion reason or "strength 0"
    cv::Mat hard_mask;           ///< CV_8U 0/255 region polygon (blended regions only)
    cv::Mat soft_mask;           ///< CV_32F [0,1] feathered mask actually used
};

struct BlendResult {
    cv::Mat image;                          ///< CV_8UC3, template size
    std::vector<RegionBlendInfo> regions;   ///< In blend order
};

/**
 * @brief Warps source regions into template space and composites them
 *
 * Regions are processed in the fixed order face, nose, mouth, left eye,
 * right eye. Each eligible region with a non-zero strength w contributes
 * out = out * (1 - w*m) + warped * (w*m), with m the feathered mask. All
 * compositing happens in float; a zero strength leaves the template bytes
 * unchanged.
 */
class RegionBlender {
public:
    explicit RegionBlender(const BlenderConfig& config = BlenderConfig());

    BlendResult blend(const cv::Mat& source,
                      const templates::Template& tmpl,
                      const RegionPlan& plan,
                      const RegionStrengths& strengths) const;

    /**
     * @brief Feathered CV_32F mask of a polygon
     *
     * Weight is min(1, d / r) with d the L2 distance to the nearest pixel
     * outside the polygon.
     */
    cv::Mat featherMask(const std::vector<cv::Point>& polygon, const cv::Size& size) const;

    /// Source resampled into template space (bilinear)
    static cv::Mat warpToTemplate(const cv::Mat& source, const SimilarityTransform& transform,
                                  const cv::Size& template_size);

    /// CV_8U mask of template pixels that map inside the source image
    static cv::Mat warpValidity(const cv::Size& source_size, const SimilarityTransform& transform,
                                const cv::Size& template_size);

    const BlenderConfig& getConfig() const { return config_; }

private:
    BlenderConfig config_;
};

} // namespace compose
} // namespace wojak
