#include "wojak/compose/GeometricAligner.hpp"
#include "wojak/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace wojak {
namespace compose {

namespace {

struct WeightedMoments {
    cv::Point2d mean;
    double total_weight = 0.0;
    double cxx = 0.0, cxy = 0.0, cyy = 0.0;   // weighted covariance

    double rmsSpread() const { return std::sqrt(std::max(0.0, cxx + cyy)); }

    /// Smaller over larger eigenvalue of the covariance, 0 when degenerate
    double eigenRatio() const {
        double trace = cxx + cyy;
        double disc = std::sqrt(std::max(0.0, (cxx - cyy) * (cxx - cyy) + 4.0 * cxy * cxy));
        double l1 = 0.5 * (trace + disc);
        double l2 = 0.5 * (trace - disc);
        return l1 > 0.0 ? std::max(0.0, l2) / l1 : 0.0;
    }
};

WeightedMoments moments(const std::vector<cv::Point2f>& pts, const std::vector<double>& w) {
    WeightedMoments m;
    for (size_t i = 0; i < pts.size(); ++i) {
        m.mean.x += w[i] * pts[i].x;
        m.mean.y += w[i] * pts[i].y;
        m.total_weight += w[i];
    }
    if (m.total_weight <= 0.0) {
        return m;
    }
    m.mean.x /= m.total_weight;
    m.mean.y /= m.total_weight;
    for (size_t i = 0; i < pts.size(); ++i) {
        double dx = pts[i].x - m.mean.x;
        double dy = pts[i].y - m.mean.y;
        m.cxx += w[i] * dx * dx;
        m.cxy += w[i] * dx * dy;
        m.cyy += w[i] * dy * dy;
    }
    m.cxx /= m.total_weight;
    m.cxy /= m.total_weight;
    m.cyy /= m.total_weight;
    return m;
}

double rmsResidual(const SimilarityTransform& t,
                   const std::vector<cv::Point2f>& src,
                   const std::vector<cv::Point2f>& dst) {
    if (src.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = 0; i < src.size(); ++i) {
        cv::Point2f d = t.apply(src[i]) - dst[i];
        sum += static_cast<double>(d.x) * d.x + static_cast<double>(d.y) * d.y;
    }
    return std::sqrt(sum / static_cast<double>(src.size()));
}

} // namespace

bool AlignerConfig::validate() const {
    return min_anchor_spread_px > 0.0f && collinearity_ratio >= 0.0 && collinearity_ratio < 1.0;
}

std::string AlignerConfig::toString() const {
    std::ostringstream oss;
    oss << "AlignerConfig { weight_by_confidence: " << (weight_by_confidence ? "true" : "false")
        << ", min_anchor_spread_px: " << min_anchor_spread_px
        << ", collinearity_ratio: " << collinearity_ratio << " }";
    return oss.str();
}

double SimilarityTransform::scale() const {
    return std::sqrt(a * a + b * b);
}

double SimilarityTransform::rotationDeg() const {
    return std::atan2(b, a) * 180.0 / CV_PI;
}

cv::Point2f SimilarityTransform::apply(const cv::Point2f& p) const {
    return cv::Point2f(static_cast<float>(a * p.x - b * p.y + tx),
                       static_cast<float>(b * p.x + a * p.y + ty));
}

cv::Mat SimilarityTransform::toAffine() const {
    cv::Mat m = (cv::Mat_<double>(2, 3) << a, -b, tx,
                                           b,  a, ty);
    return m;
}

SimilarityTransform SimilarityTransform::translation(double tx, double ty) {
    SimilarityTransform t;
    t.tx = tx;
    t.ty = ty;
    t.translation_only = true;
    return t;
}

GeometricAligner::GeometricAligner(const AlignerConfig& config) : config_(config) {
    if (!config_.validate()) {
        LOG_WARNING("Invalid aligner configuration, using defaults");
        config_ = AlignerConfig();
    }
}

SimilarityTransform GeometricAligner::estimate(const std::vector<cv::Point2f>& src,
                                               const std::vector<cv::Point2f>& dst,
                                               const std::vector<float>& weights) const {
    const size_t n = std::min(src.size(), dst.size());
    if (n == 0) {
        SimilarityTransform identity = SimilarityTransform::translation(0.0, 0.0);
        return identity;
    }

    std::vector<cv::Point2f> p(src.begin(), src.begin() + n);
    std::vector<cv::Point2f> q(dst.begin(), dst.begin() + n);
    std::vector<double> w(n, 1.0);
    if (weights.size() >= n) {
        double sum = 0.0;
        for (size_t i = 0; i < n; ++i) {
            w[i] = std::max(0.0, static_cast<double>(weights[i]));
            sum += w[i];
        }
        if (sum <= 0.0) {
            std::fill(w.begin(), w.end(), 1.0);
        }
    }

    WeightedMoments mp = moments(p, w);
    WeightedMoments mq = moments(q, w);

    bool degenerate = n < 2 ||
                      mp.rmsSpread() < config_.min_anchor_spread_px ||
                      mq.rmsSpread() < config_.min_anchor_spread_px ||
                      (n >= 3 && mp.eigenRatio() < config_.collinearity_ratio);

    SimilarityTransform t;
    if (degenerate) {
        t = SimilarityTransform::translation(mq.mean.x - mp.mean.x, mq.mean.y - mp.mean.y);
    } else {
        // Umeyama: a = sum(w p'.q') / sum(w |p'|^2), b = sum(w p' x q') / sum(w |p'|^2)
        double dot = 0.0, cross = 0.0, norm = 0.0;
        for (size_t i = 0; i < n; ++i) {
            double px = p[i].x - mp.mean.x, py = p[i].y - mp.mean.y;
            double qx = q[i].x - mq.mean.x, qy = q[i].y - mq.mean.y;
            dot += w[i] * (px * qx + py * qy);
            cross += w[i] * (px * qy - py * qx);
            norm += w[i] * (px * px + py * py);
        }
        if (norm <= 1e-12) {
            t = SimilarityTransform::translation(mq.mean.x - mp.mean.x, mq.mean.y - mp.mean.y);
        } else {
            t.a = dot / norm;
            t.b = cross / norm;
            t.tx = mq.mean.x - (t.a * mp.mean.x - t.b * mp.mean.y);
            t.ty = mq.mean.y - (t.b * mp.mean.x + t.a * mp.mean.y);
        }
    }

    t.anchor_count = n;
    t.residual_rms = rmsResidual(t, p, q);
    return t;
}

std::map<face::RegionName, SimilarityTransform> GeometricAligner::align(const face::LandmarkSet& source,
                                                                        const templates::Template& tmpl) const {
    std::map<face::RegionName, SimilarityTransform> transforms;

    for (const auto& region : tmpl.regions) {
        std::vector<cv::Point2f> src, dst;
        std::vector<float> weights;
        for (const auto& name : region.anchors) {
            if (!source.has(name) || !tmpl.landmarks.has(name)) {
                continue;
            }
            src.push_back(source.position(name));
            dst.push_back(tmpl.landmarks.position(name));
            weights.push_back(source.at(name).confidence);
        }

        SimilarityTransform t = estimate(src, dst, config_.weight_by_confidence ? weights
                                                                                 : std::vector<float>());
        if (t.translation_only) {
            WOJAK_LOG_WARNING("GeometricAligner") << "Degenerate anchors for region '"
                                                  << face::regionNameToString(region.name)
                                                  << "', using translation only";
        }
        WOJAK_LOG_DEBUG("GeometricAligner") << face::regionNameToString(region.name)
                                            << ": scale=" << t.scale()
                                            << " rot=" << t.rotationDeg()
                                            << " residual=" << t.residual_rms;
        transforms[region.name] = t;
    }
    return transforms;
}

} // namespace compose
} // namespace wojak
