#include "wojak/compose/ColorMatcher.hpp"
#include "wojak/core/Logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace wojak {
namespace compose {

namespace {

constexpr double kMinStdDev = 1e-6;

cv::Mat toLab(const cv::Mat& bgr) {
    cv::Mat bgr_f, lab;
    bgr.convertTo(bgr_f, CV_32FC3, 1.0 / 255.0);
    cv::cvtColor(bgr_f, lab, cv::COLOR_BGR2Lab);
    return lab;
}

cv::Mat fromLab(const cv::Mat& lab) {
    cv::Mat bgr_f, bgr;
    cv::cvtColor(lab, bgr_f, cv::COLOR_Lab2BGR);
    bgr_f.convertTo(bgr, CV_8UC3, 255.0);
    return bgr;
}

} // namespace

templates::LabStatistics ColorMatcher::measure(const cv::Mat& bgr, const cv::Mat& mask) {
    templates::LabStatistics stats;
    if (bgr.empty()) {
        return stats;
    }
    stats.pixel_count = mask.empty() ? static_cast<double>(bgr.total())
                                     : static_cast<double>(cv::countNonZero(mask));
    if (stats.pixel_count <= 0) {
        return stats;
    }
    cv::meanStdDev(toLab(bgr), stats.mean, stats.stddev, mask);
    return stats;
}

cv::Mat ColorMatcher::match(const cv::Mat& image,
                            const std::vector<RegionBlendInfo>& regions,
                            const std::map<face::RegionName, templates::LabStatistics>& palette,
                            float strength) const {
    const float s = std::clamp(strength, 0.0f, 1.0f);
    if (s <= 0.0f || image.empty()) {
        return image.clone();
    }

    cv::Mat lab = toLab(image);
    cv::Mat touched = cv::Mat::zeros(image.size(), CV_8U);
    int matched = 0;

    for (const auto& info : regions) {
        if (!info.blended || info.hard_mask.empty() || cv::countNonZero(info.hard_mask) == 0) {
            continue;
        }
        auto target = palette.find(info.region);
        if (target == palette.end() || !target->second.valid()) {
            continue;
        }

        cv::Scalar src_mean, src_std;
        cv::meanStdDev(lab, src_mean, src_std, info.hard_mask);

        std::vector<cv::Mat> channels;
        cv::split(lab, channels);
        for (int c = 0; c < 3; ++c) {
            double goal_mean = src_mean[c] + s * (target->second.mean[c] - src_mean[c]);
            double goal_std = src_std[c] + s * (target->second.stddev[c] - src_std[c]);
            double gain = src_std[c] > kMinStdDev ? goal_std / src_std[c] : 1.0;

            // adjusted = (x - mean) * gain + goal_mean
            cv::Mat adjusted;
            channels[c].convertTo(adjusted, CV_32F, gain, goal_mean - src_mean[c] * gain);

            // channel = channel + (adjusted - channel) * soft
            cv::Mat delta = (adjusted - channels[c]).mul(info.soft_mask);
            channels[c] += delta;
        }
        cv::merge(channels, lab);

        touched.setTo(255, info.soft_mask > 0.0f);
        ++matched;
    }

    if (matched == 0) {
        return image.clone();
    }

    cv::Mat result = fromLab(lab);
    // Lab round trip is not bit exact, restore pixels no region touched
    image.copyTo(result, touched == 0);

    WOJAK_LOG_DEBUG("ColorMatcher") << "Matched " << matched << " region(s) at strength " << s;
    return result;
}

cv::Mat ColorMatcher::enhanceContrast(const cv::Mat& image, float factor) {
    if (image.empty() || factor == 1.0f) {
        return image.clone();
    }
    cv::Mat result;
    image.convertTo(result, image.type(), factor, 128.0 * (1.0 - factor));
    return result;
}

cv::Mat ColorMatcher::sharpen(const cv::Mat& image, float amount) {
    const float a = std::clamp(amount, 0.0f, 1.0f);
    if (image.empty() || a <= 0.0f) {
        return image.clone();
    }
    const cv::Mat kernel = (cv::Mat_<float>(3, 3) << -1, -1, -1,
                                                     -1,  9, -1,
                                                     -1, -1, -1);
    cv::Mat sharpened, result;
    cv::filter2D(image, sharpened, -1, kernel);
    cv::addWeighted(image, 1.0 - a, sharpened, a, 0.0, result);
    return result;
}

} // namespace compose
} // namespace wojak
