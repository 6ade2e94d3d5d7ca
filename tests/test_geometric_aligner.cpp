/**
 * @file test_geometric_aligner.cpp
 * @brief Unit tests for the similarity fit and its degenerate fallbacks
 */

#include <gtest/gtest.h>
#include <wojak/compose/GeometricAligner.hpp>
#include <wojak/face/LandmarkDetector.hpp>
#include <wojak/templates/TemplateRegistry.hpp>
#include "TestFaces.hpp"
#include <cmath>

using namespace wojak;
using namespace wojak::compose;

namespace {

std::vector<cv::Point2f> mapPoints(const std::vector<cv::Point2f>& points, double scale, double degrees,
                                   const cv::Point2f& shift) {
    const double rad = degrees * CV_PI / 180.0;
    const double a = scale * std::cos(rad);
    const double b = scale * std::sin(rad);
    std::vector<cv::Point2f> out;
    for (const auto& p : points) {
        out.emplace_back(static_cast<float>(a * p.x - b * p.y + shift.x),
                         static_cast<float>(b * p.x + a * p.y + shift.y));
    }
    return out;
}

} // namespace

TEST(GeometricAlignerTest, RecoversExactSimilarity) {
    GeometricAligner aligner;
    std::vector<cv::Point2f> src = {{10, 10}, {60, 15}, {35, 50}, {20, 70}};
    auto dst = mapPoints(src, 1.7, 20.0, cv::Point2f(-12.0f, 33.0f));

    SimilarityTransform t = aligner.estimate(src, dst);
    EXPECT_FALSE(t.translation_only);
    EXPECT_EQ(t.anchor_count, 4u);
    EXPECT_NEAR(t.scale(), 1.7, 1e-4);
    EXPECT_NEAR(t.rotationDeg(), 20.0, 1e-3);
    EXPECT_NEAR(t.tx, -12.0, 1e-3);
    EXPECT_NEAR(t.ty, 33.0, 1e-3);
    EXPECT_LT(t.residual_rms, 1e-3);

    cv::Point2f mapped = t.apply(src[2]);
    EXPECT_NEAR(mapped.x, dst[2].x, 1e-3f);
    EXPECT_NEAR(mapped.y, dst[2].y, 1e-3f);
}

TEST(GeometricAlignerTest, AffineMatrixMatchesApply) {
    SimilarityTransform t;
    t.a = 0.8;
    t.b = -0.3;
    t.tx = 5.0;
    t.ty = -2.0;

    cv::Mat m = t.toAffine();
    ASSERT_EQ(m.type(), CV_64F);
    ASSERT_EQ(m.rows, 2);
    ASSERT_EQ(m.cols, 3);

    cv::Point2f p(7.0f, 11.0f);
    cv::Point2f q = t.apply(p);
    EXPECT_NEAR(m.at<double>(0, 0) * p.x + m.at<double>(0, 1) * p.y + m.at<double>(0, 2), q.x, 1e-4);
    EXPECT_NEAR(m.at<double>(1, 0) * p.x + m.at<double>(1, 1) * p.y + m.at<double>(1, 2), q.y, 1e-4);
}

TEST(GeometricAlignerTest, TwoAnchorsGiveFullSimilarity) {
    GeometricAligner aligner;
    std::vector<cv::Point2f> src = {{0, 0}, {10, 0}};
    std::vector<cv::Point2f> dst = {{5, 5}, {5, 25}};

    SimilarityTransform t = aligner.estimate(src, dst);
    EXPECT_FALSE(t.translation_only);
    EXPECT_NEAR(t.scale(), 2.0, 1e-6);
    EXPECT_NEAR(t.rotationDeg(), 90.0, 1e-4);
}

TEST(GeometricAlignerTest, SingleAnchorFallsBackToTranslation) {
    GeometricAligner aligner;
    SimilarityTransform t = aligner.estimate({{3, 4}}, {{10, 20}});
    EXPECT_TRUE(t.translation_only);
    EXPECT_DOUBLE_EQ(t.scale(), 1.0);
    EXPECT_NEAR(t.tx, 7.0, 1e-6);
    EXPECT_NEAR(t.ty, 16.0, 1e-6);
}

TEST(GeometricAlignerTest, CoincidentAnchorsFallBackToTranslation) {
    GeometricAligner aligner;
    std::vector<cv::Point2f> src = {{50, 50}, {50, 50}, {50.2f, 50}};
    std::vector<cv::Point2f> dst = {{100, 90}, {120, 90}, {110, 110}};

    SimilarityTransform t = aligner.estimate(src, dst);
    EXPECT_TRUE(t.translation_only);
    EXPECT_NEAR(t.tx, 110.0 - 50.0667, 1e-3);
    EXPECT_GT(t.residual_rms, 0.0);
}

TEST(GeometricAlignerTest, CoincidentAnchorsZeroSpreadConfig) {
    AlignerConfig config;
    config.min_anchor_spread_px = 0.0f;
    EXPECT_FALSE(config.validate());

    GeometricAligner aligner(config);
    std::vector<cv::Point2f> src = {{50, 60}, {50, 60}};
    std::vector<cv::Point2f> dst = {{100, 100}, {120, 100}};

    SimilarityTransform t = aligner.estimate(src, dst);
    EXPECT_TRUE(t.translation_only);
    EXPECT_TRUE(std::isfinite(t.a));
    EXPECT_TRUE(std::isfinite(t.b));
    EXPECT_NEAR(t.tx, 60.0, 1e-4);
    EXPECT_NEAR(t.ty, 40.0, 1e-4);

    cv::Mat m = t.toAffine();
    EXPECT_TRUE(cv::checkRange(m));
}

TEST(GeometricAlignerTest, CollinearAnchorsFallBackToTranslation) {
    GeometricAligner aligner;
    std::vector<cv::Point2f> src = {{0, 0}, {10, 10}, {20, 20}, {30, 30}};
    std::vector<cv::Point2f> dst = {{0, 0}, {10, 0}, {0, 10}, {10, 10}};

    SimilarityTransform t = aligner.estimate(src, dst);
    EXPECT_TRUE(t.translation_only);
    EXPECT_NEAR(t.tx, 5.0 - 15.0, 1e-4);
    EXPECT_NEAR(t.ty, 5.0 - 15.0, 1e-4);
}

TEST(GeometricAlignerTest, ConfidenceWeightingFavorsReliableAnchors) {
    AlignerConfig config;
    config.weight_by_confidence = true;
    GeometricAligner weighted(config);
    GeometricAligner uniform;

    std::vector<cv::Point2f> src = {{0, 0}, {40, 0}, {0, 40}, {40, 40}};
    std::vector<cv::Point2f> dst = src;
    dst[3] = cv::Point2f(60, 60);   // one outlier
    std::vector<float> weights = {1.0f, 1.0f, 1.0f, 0.01f};

    double weighted_scale = weighted.estimate(src, dst, weights).scale();
    double uniform_scale = uniform.estimate(src, dst).scale();
    EXPECT_LT(std::fabs(weighted_scale - 1.0), std::fabs(uniform_scale - 1.0));
}

TEST(GeometricAlignerTest, AlignsEveryTemplateRegion) {
    auto registry = templates::TemplateRegistry::loadAll("");
    const templates::Template& tmpl = registry->get("wojak_basic");

    // Source face is the template landmarks scaled by 2 and shifted
    face::LandmarkSet source = tmpl.landmarks.transformed(
        [](const cv::Point2f& p) { return cv::Point2f(p.x * 2.0f + 30.0f, p.y * 2.0f - 10.0f); });

    GeometricAligner aligner;
    auto transforms = aligner.align(source, tmpl);
    ASSERT_EQ(transforms.size(), 5u);

    for (const auto& entry : transforms) {
        const SimilarityTransform& t = entry.second;
        EXPECT_FALSE(t.translation_only) << face::regionNameToString(entry.first);
        EXPECT_NEAR(t.scale(), 0.5, 1e-3);
        EXPECT_NEAR(t.rotationDeg(), 0.0, 1e-2);
        EXPECT_LT(t.residual_rms, 1e-2);
    }
}
