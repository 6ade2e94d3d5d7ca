#pragma once

#include "wojak/compose/RegionBlender.hpp"
#include "wojak/templates/TemplateTypes.hpp"
#include <opencv2/core.hpp>
#include <map>
#include <vector>

namespace wojak {
namespace compose {

/**
 * @brief Color statistics transfer and final tone adjustments
 *
 * Color matching works per blended region in CIE Lab: the region's mean and
 * standard deviation are moved toward the template's statistics for that
 * region by the match strength, and the result is written back through the
 * region's soft mask. Pixels outside every blended region keep their value.
 */
class ColorMatcher {
public:
    /**
     * @brief Lab mean/stddev of the pixels under mask
     * @param bgr CV_8UC3 image
     * @param mask CV_8U mask, empty for the whole image
     */
    static templates::LabStatistics measure(const cv::Mat& bgr, const cv::Mat& mask = cv::Mat());

    /**
     * @brief Move blended regions toward the template palette
     * @param strength 0 returns the image unchanged, 1 matches the palette exactly
     */
    cv::Mat match(const cv::Mat& image,
                  const std::vector<RegionBlendInfo>& regions,
                  const std::map<face::RegionName, templates::LabStatistics>& palette,
                  float strength) const;

    /**
     * @brief Contrast around mid-gray: 128 + (p - 128) * factor, saturated
     *
     * A factor of 1 returns an identical copy.
     */
    static cv::Mat enhanceContrast(const cv::Mat& image, float factor);

    /**
     * @brief Mix with a 3x3 sharpened copy, amount in [0,1]
     */
    static cv::Mat sharpen(const cv::Mat& image, float amount);
};

} // namespace compose
} // namespace wojak
