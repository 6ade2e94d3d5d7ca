#pragma once

#include "wojak/face/FaceTypes.hpp"
#include "wojak/templates/TemplateTypes.hpp"
#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

namespace wojak {
namespace compose {

/**
 * @brief Aligner configuration
 */
struct AlignerConfig {
    bool weight_by_confidence = false;   ///< Weight anchors by source landmark confidence
    float min_anchor_spread_px = 1.0f;   ///< RMS spread below which anchors are coincident
    double collinearity_ratio = 1e-3;    ///< Min/max scatter eigenvalue ratio below which anchors are collinear

    bool validate() const;
    std::string toString() const;
};

/**
 * @brief 2D similarity transform (uniform scale, rotation, translation)
 *
 * x' = a*x - b*y + tx
 * y' = b*x + a*y + ty
 */
struct SimilarityTransform {
    double a = 1.0;
    double b = 0.0;
    double tx = 0.0;
    double ty = 0.0;

    bool translation_only = false;   ///< Fallback used because the anchors were degenerate
    double residual_rms = 0.0;       ///< RMS distance of mapped source anchors to template anchors
    size_t anchor_count = 0;

    double scale() const;
    double rotationDeg() const;

    cv::Point2f apply(const cv::Point2f& p) const;

    /// 2x3 CV_64F matrix for cv::warpAffine (source -> template)
    cv::Mat toAffine() const;

    static SimilarityTransform translation(double tx, double ty);
};

/**
 * @brief Per-region least-squares similarity alignment onto template anchors
 *
 * Closed-form 2D Procrustes (Umeyama) fit. Degenerate anchor sets (fewer than
 * two anchors, coincident or collinear) fall back to a mean-to-mean
 * translation instead of failing.
 */
class GeometricAligner {
public:
    explicit GeometricAligner(const AlignerConfig& config = AlignerConfig());

    /**
     * @brief Fit one transform per template region
     * @param source Landmarks detected in the source image
     * @param tmpl Template providing reference landmarks and region anchors
     */
    std::map<face::RegionName, SimilarityTransform> align(const face::LandmarkSet& source,
                                                          const templates::Template& tmpl) const;

    /**
     * @brief Fit the transform mapping src onto dst
     * @param weights Optional per-point weights (empty: uniform)
     */
    SimilarityTransform estimate(const std::vector<cv::Point2f>& src,
                                 const std::vector<cv::Point2f>& dst,
                                 const std::vector<float>& weights = {}) const;

    const AlignerConfig& getConfig() const { return config_; }

private:
    AlignerConfig config_;
};

} // namespace compose
} // namespace wojak
