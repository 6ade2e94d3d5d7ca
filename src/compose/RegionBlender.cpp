#include "wojak/compose/RegionBlender.hpp"
#include "wojak/core/Logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <sstream>

namespace wojak {
namespace compose {

bool BlenderConfig::validate() const {
    return feather_radius_px >= 0.0f;
}

std::string BlenderConfig::toString() const {
    std::ostringstream oss;
    oss << "BlenderConfig { feather_radius_px: " << feather_radius_px << " }";
    return oss.str();
}

float RegionStrengths::forRegion(face::RegionName region) const {
    switch (region) {
        case face::RegionName::FACE:      return face;
        case face::RegionName::LEFT_EYE:
        case face::RegionName::RIGHT_EYE: return eye;
        case face::RegionName::MOUTH:     return mouth;
        case face::RegionName::NOSE:      return nose;
        default:                          return 0.0f;
    }
}

RegionBlender::RegionBlender(const BlenderConfig& config) : config_(config) {
    if (!config_.validate()) {
        LOG_WARNING("Invalid blender configuration, using defaults");
        config_ = BlenderConfig();
    }
}

cv::Mat RegionBlender::featherMask(const std::vector<cv::Point>& polygon, const cv::Size& size) const {
    cv::Mat hard = cv::Mat::zeros(size, CV_8U);
    if (polygon.size() >= 3) {
        std::vector<std::vector<cv::Point>> polys = {polygon};
        cv::fillPoly(hard, polys, cv::Scalar(255));
    }

    cv::Mat soft;
    if (config_.feather_radius_px <= 0.0f) {
        hard.convertTo(soft, CV_32F, 1.0 / 255.0);
        return soft;
    }

    cv::Mat dist;
    cv::distanceTransform(hard, dist, cv::DIST_L2, cv::DIST_MASK_PRECISE);
    dist.convertTo(soft, CV_32F, 1.0 / config_.feather_radius_px);
    cv::min(soft, 1.0, soft);
    return soft;
}

cv::Mat RegionBlender::warpToTemplate(const cv::Mat& source, const SimilarityTransform& transform,
                                      const cv::Size& template_size) {
    cv::Mat warped;
    cv::warpAffine(source, warped, transform.toAffine(), template_size,
                   cv::INTER_LINEAR, cv::BORDER_REPLICATE);
    return warped;
}

cv::Mat RegionBlender::warpValidity(const cv::Size& source_size, const SimilarityTransform& transform,
                                   const cv::Size& template_size) {
    cv::Mat ones(source_size, CV_8U, cv::Scalar(255));
    cv::Mat valid;
    cv::warpAffine(ones, valid, transform.toAffine(), template_size,
                   cv::INTER_NEAREST, cv::BORDER_CONSTANT, cv::Scalar(0));
    return valid;
}

BlendResult RegionBlender::blend(const cv::Mat& source,
                                 const templates::Template& tmpl,
                                 const RegionPlan& plan,
                                 const RegionStrengths& strengths) const {
    BlendResult result;
    const cv::Size size = tmpl.image.size();

    cv::Mat out;
    tmpl.image.convertTo(out, CV_32FC3);

    cv::Mat source_f;
    if (!source.empty()) {
        source.convertTo(source_f, CV_32FC3);
    }

    for (face::RegionName name : face::blendOrder()) {
        const templates::RegionDefinition* region = tmpl.region(name);
        if (region == nullptr) {
            continue;
        }

        RegionBlendInfo info;
        info.region = name;

        auto it = plan.find(name);
        const float w = std::clamp(strengths.forRegion(name), 0.0f, 1.0f);
        if (it == plan.end()) {
            info.note = "not planned";
        } else if (const auto* excluded = std::get_if<Excluded>(&it->second)) {
            info.note = excluded->reason;
        } else if (w <= 0.0f) {
            info.note = "strength 0";
        } else if (source_f.empty()) {
            info.note = "no source image";
        } else {
            const SimilarityTransform& transform = std::get<Eligible>(it->second).transform;

            cv::Mat warped = warpToTemplate(source_f, transform, size);
            cv::Mat valid = warpValidity(source.size(), transform, size);

            cv::Mat soft = featherMask(region->mask_polygon, size);
            soft.setTo(0.0f, valid == 0);

            cv::Mat alpha = soft * w;
            cv::Mat alpha3;
            cv::merge(std::vector<cv::Mat>{alpha, alpha, alpha}, alpha3);

            cv::Mat inv_alpha3 = cv::Scalar::all(1.0) - alpha3;
            out = out.mul(inv_alpha3) + warped.mul(alpha3);

            info.blended = true;
            info.mask_area = cv::sum(soft)[0];
            info.soft_mask = soft;
            info.hard_mask = cv::Mat::zeros(size, CV_8U);
            std::vector<std::vector<cv::Point>> polys = {region->mask_polygon};
            cv::fillPoly(info.hard_mask, polys, cv::Scalar(255));
            info.hard_mask.setTo(0, valid == 0);
        }

        WOJAK_LOG_DEBUG("RegionBlender") << face::regionNameToString(name) << ": "
                                         << (info.blended ? "blended" : "skipped")
                                         << (info.note.empty() ? "" : " (" + info.note + ")")
                                         << " w=" << w;
        result.regions.push_back(std::move(info));
    }

    out.convertTo(result.image, CV_8UC3);
    return result;
}

} // namespace compose
} // namespace wojak
