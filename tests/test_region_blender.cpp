/**
 * @file test_region_blender.cpp
 * @brief Unit tests for masked region compositing
 */

#include <gtest/gtest.h>
#include <wojak/compose/RegionBlender.hpp>
#include <wojak/compose/RegionPlan.hpp>
#include <wojak/templates/TemplateRegistry.hpp>
#include <opencv2/imgproc.hpp>

using namespace wojak;
using namespace wojak::compose;

namespace {

RegionPlan identityPlan(const templates::Template& tmpl) {
    RegionPlan plan;
    for (const auto& region : tmpl.regions) {
        plan[region.name] = Eligible{SimilarityTransform()};
    }
    return plan;
}

RegionStrengths uniformStrengths(float value) {
    RegionStrengths s;
    s.face = value;
    s.eye = value;
    s.mouth = value;
    s.nose = value;
    return s;
}

bool identical(const cv::Mat& a, const cv::Mat& b) {
    if (a.size() != b.size() || a.type() != b.type()) {
        return false;
    }
    cv::Mat diff;
    cv::absdiff(a, b, diff);
    return cv::countNonZero(diff.reshape(1)) == 0;
}

} // namespace

class RegionBlenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = templates::TemplateRegistry::loadAll("");
        tmpl_ = &registry_->get("wojak_basic");
        source_ = cv::Mat(tmpl_->image.size(), CV_8UC3, cv::Scalar(10, 200, 30));
    }

    std::shared_ptr<const templates::TemplateRegistry> registry_;
    const templates::Template* tmpl_ = nullptr;
    cv::Mat source_;
    RegionBlender blender_;
};

TEST_F(RegionBlenderTest, ZeroStrengthLeavesTemplateUnchanged) {
    BlendResult result = blender_.blend(source_, *tmpl_, identityPlan(*tmpl_), uniformStrengths(0.0f));

    EXPECT_TRUE(identical(result.image, tmpl_->image));
    ASSERT_EQ(result.regions.size(), 5u);
    for (const auto& info : result.regions) {
        EXPECT_FALSE(info.blended);
        EXPECT_EQ(info.note, "strength 0");
    }
}

TEST_F(RegionBlenderTest, FullStrengthCopiesSourceInsideMasks) {
    BlendResult result = blender_.blend(source_, *tmpl_, identityPlan(*tmpl_), uniformStrengths(1.0f));

    // Head center lies deep inside the face mask
    cv::Vec3b center = result.image.at<cv::Vec3b>(128, 128);
    EXPECT_EQ(center, cv::Vec3b(10, 200, 30));

    // Corners are outside every region
    EXPECT_EQ(result.image.at<cv::Vec3b>(2, 2), tmpl_->image.at<cv::Vec3b>(2, 2));
    EXPECT_EQ(result.image.at<cv::Vec3b>(253, 253), tmpl_->image.at<cv::Vec3b>(253, 253));
}

TEST_F(RegionBlenderTest, RegionsFollowBlendOrder) {
    BlendResult result = blender_.blend(source_, *tmpl_, identityPlan(*tmpl_), uniformStrengths(0.5f));

    ASSERT_EQ(result.regions.size(), 5u);
    const auto& order = face::blendOrder();
    for (size_t i = 0; i < order.size(); ++i) {
        EXPECT_EQ(result.regions[i].region, order[i]);
        EXPECT_TRUE(result.regions[i].blended);
        EXPECT_GT(result.regions[i].mask_area, 0.0);
    }
}

TEST_F(RegionBlenderTest, ExcludedRegionKeepsTemplatePixels) {
    RegionPlan plan = identityPlan(*tmpl_);
    plan[face::RegionName::MOUTH] = Excluded{"unreliable landmarks: mouth_left"};
    RegionStrengths strengths = uniformStrengths(0.0f);
    strengths.mouth = 1.0f;

    BlendResult result = blender_.blend(source_, *tmpl_, plan, strengths);
    EXPECT_TRUE(identical(result.image, tmpl_->image));

    const RegionBlendInfo& mouth = result.regions[2];
    EXPECT_EQ(mouth.region, face::RegionName::MOUTH);
    EXPECT_FALSE(mouth.blended);
    EXPECT_EQ(mouth.note, "unreliable landmarks: mouth_left");
}

TEST_F(RegionBlenderTest, FeatherMaskRampsAtTheEdge) {
    std::vector<cv::Point> square = {{20, 20}, {80, 20}, {80, 80}, {20, 80}};
    cv::Mat mask = blender_.featherMask(square, cv::Size(100, 100));

    ASSERT_EQ(mask.type(), CV_32F);
    EXPECT_FLOAT_EQ(mask.at<float>(50, 50), 1.0f);
    EXPECT_FLOAT_EQ(mask.at<float>(5, 5), 0.0f);

    float edge = mask.at<float>(50, 21);
    EXPECT_GT(edge, 0.0f);
    EXPECT_LT(edge, 1.0f);

    double min_val, max_val;
    cv::minMaxLoc(mask, &min_val, &max_val);
    EXPECT_GE(min_val, 0.0);
    EXPECT_LE(max_val, 1.0);
}

TEST_F(RegionBlenderTest, PixelsOutsideSourceAreNotBlended) {
    // Shift far enough that the source covers only the left part of the template
    RegionPlan plan;
    plan[face::RegionName::FACE] = Eligible{SimilarityTransform::translation(-200.0, 0.0)};
    RegionStrengths strengths = uniformStrengths(1.0f);

    BlendResult result = blender_.blend(source_, *tmpl_, plan, strengths);
    EXPECT_EQ(result.image.at<cv::Vec3b>(128, 128), tmpl_->image.at<cv::Vec3b>(128, 128));
    EXPECT_EQ(result.image.at<cv::Vec3b>(128, 40), cv::Vec3b(10, 200, 30));
}

TEST(RegionPlanTest, UnreliableAnchorsExcludeRegion) {
    auto registry = templates::TemplateRegistry::loadAll("");
    const templates::Template& tmpl = registry->get("doomer");

    std::map<face::RegionName, SimilarityTransform> transforms;
    for (const auto& region : tmpl.regions) {
        transforms[region.name] = SimilarityTransform();
    }
    face::ValidationReport report;
    report.face_detected = true;
    report.unreliable_landmarks = {face::landmark_names::LEFT_EYE_TOP};

    RegionPlan plan = buildRegionPlan(transforms, report, tmpl);
    ASSERT_EQ(plan.size(), 5u);
    EXPECT_FALSE(isEligible(plan.at(face::RegionName::LEFT_EYE)));
    EXPECT_NE(describeOutcome(plan.at(face::RegionName::LEFT_EYE)).find("left_eye_top"), std::string::npos);
    EXPECT_TRUE(isEligible(plan.at(face::RegionName::RIGHT_EYE)));
    EXPECT_TRUE(isEligible(plan.at(face::RegionName::FACE)));

    report.face_detected = false;
    RegionPlan none = buildRegionPlan(transforms, report, tmpl);
    for (const auto& entry : none) {
        EXPECT_FALSE(isEligible(entry.second));
    }
}
