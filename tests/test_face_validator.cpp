/**
 * @file test_face_validator.cpp
 * @brief Unit tests for FaceValidator quality heuristics
 */

#include <gtest/gtest.h>
#include <wojak/face/FaceValidator.hpp>
#include <wojak/face/LandmarkDetector.hpp>
#include "TestFaces.hpp"
#include <algorithm>
#include <cmath>

using namespace wojak::face;
using wojak::test_support::frontalFace68;

namespace {

LandmarkSet makeFace(float cx, float cy, float w, float confidence = 0.9f) {
    auto set = LandmarkDetector::fromIbug68(frontalFace68(cx, cy, w, confidence));
    EXPECT_TRUE(set.has_value());
    return *set;
}

LandmarkSet rotateFace(const LandmarkSet& face, const cv::Point2f& center, float degrees) {
    const float rad = degrees * 3.14159265f / 180.0f;
    const float c = std::cos(rad);
    const float s = std::sin(rad);
    return face.transformed([&](const cv::Point2f& p) {
        cv::Point2f d = p - center;
        return cv::Point2f(center.x + c * d.x - s * d.y, center.y + s * d.x + c * d.y);
    });
}

bool hasIssueContaining(const ValidationReport& report, const std::string& text) {
    return std::any_of(report.issues.begin(), report.issues.end(),
                       [&](const std::string& issue) { return issue.find(text) != std::string::npos; });
}

} // namespace

class FaceValidatorTest : public ::testing::Test {
protected:
    FaceValidator validator_;
    cv::Mat image_{300, 300, CV_8UC3, cv::Scalar::all(128)};
};

TEST_F(FaceValidatorTest, FrontalHighResolutionFaceIsValid) {
    ValidationReport report = validator_.validate(makeFace(150.0f, 140.0f, 80.0f), image_, 1);

    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.image_quality, ImageQuality::HIGH);
    EXPECT_TRUE(report.issues.empty()) << report.toString();
    EXPECT_NEAR(report.yaw_deg, 0.0f, 2.0f);
    EXPECT_NEAR(report.pitch_deg, 0.0f, 2.0f);
    EXPECT_NEAR(report.roll_deg, 0.0f, 0.5f);
    EXPECT_NEAR(report.inter_eye_distance_px, 64.0f, 0.1f);
}

TEST_F(FaceValidatorTest, NoFaceIsInvalid) {
    ValidationReport report = validator_.validate(std::nullopt, image_, 0);

    EXPECT_FALSE(report.valid);
    EXPECT_FALSE(report.face_detected);
    EXPECT_TRUE(hasIssueContaining(report, "No face detected"));
}

TEST_F(FaceValidatorTest, ResolutionTiers) {
    EXPECT_EQ(validator_.resolutionTier(cv::Size(300, 256)), ImageQuality::HIGH);
    EXPECT_EQ(validator_.resolutionTier(cv::Size(300, 255)), ImageQuality::MEDIUM);
    EXPECT_EQ(validator_.resolutionTier(cv::Size(128, 400)), ImageQuality::MEDIUM);
    EXPECT_EQ(validator_.resolutionTier(cv::Size(127, 400)), ImageQuality::LOW);
}

TEST_F(FaceValidatorTest, LowResolutionIsInvalid) {
    cv::Mat small(100, 100, CV_8UC3, cv::Scalar::all(128));
    ValidationReport report = validator_.validate(makeFace(50.0f, 40.0f, 30.0f), small, 1);

    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.image_quality, ImageQuality::LOW);
    EXPECT_TRUE(hasIssueContaining(report, "resolution"));
}

TEST_F(FaceValidatorTest, ConfidenceLowersQualityButNotValidity) {
    ValidationReport report = validator_.validate(makeFace(150.0f, 140.0f, 80.0f, 0.6f), image_, 1);

    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.landmark_quality, ImageQuality::MEDIUM);
    EXPECT_EQ(report.image_quality, ImageQuality::MEDIUM);
}

TEST_F(FaceValidatorTest, RolledFaceIsRejected) {
    LandmarkSet face = rotateFace(makeFace(150.0f, 140.0f, 60.0f), cv::Point2f(150.0f, 140.0f), 45.0f);
    ValidationReport report = validator_.validate(face, image_, 1);

    EXPECT_NEAR(report.roll_deg, 45.0f, 0.5f);
    EXPECT_FALSE(report.valid);
    EXPECT_TRUE(hasIssueContaining(report, "roll"));
}

TEST_F(FaceValidatorTest, ProfileFaceIsRejected) {
    // Nose tip pushed toward the right eye
    LandmarkSet base = makeFace(150.0f, 140.0f, 80.0f);
    std::vector<NamedLandmark> points = base.points();
    for (auto& named : points) {
        if (named.name == landmark_names::NOSE_TIP) {
            named.point.x += 28.0f;
        }
    }
    auto turned = LandmarkSet::create(points, base.outline());
    ASSERT_TRUE(turned.has_value());

    ValidationReport report = validator_.validate(*turned, image_, 1);
    EXPECT_GT(report.yaw_deg, 35.0f);
    EXPECT_FALSE(report.valid);
    EXPECT_TRUE(hasIssueContaining(report, "yaw"));
}

TEST_F(FaceValidatorTest, UpsideDownFaceIsRejected) {
    LandmarkSet face = rotateFace(makeFace(150.0f, 140.0f, 60.0f), cv::Point2f(150.0f, 140.0f), 180.0f);
    ValidationReport report = validator_.validate(face, image_, 1);
    EXPECT_FALSE(report.valid);
}

TEST_F(FaceValidatorTest, TinyFaceIsRejected) {
    ValidationReport report = validator_.validate(makeFace(150.0f, 140.0f, 20.0f), image_, 1);

    EXPECT_LT(report.inter_eye_distance_px, 20.0f);
    EXPECT_FALSE(report.valid);
    EXPECT_TRUE(hasIssueContaining(report, "too small"));
}

TEST_F(FaceValidatorTest, MultipleFacesAddIssue) {
    ValidationReport report = validator_.validate(makeFace(150.0f, 140.0f, 80.0f), image_, 3);

    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.faces_detected, 3);
    EXPECT_TRUE(hasIssueContaining(report, "Multiple faces"));
}

TEST_F(FaceValidatorTest, OutOfBoundsPointsAreUnreliable) {
    // Chin falls below the bottom edge
    LandmarkSet face = makeFace(150.0f, 220.0f, 80.0f);
    ValidationReport report = validator_.validate(face, image_, 1);

    EXPECT_EQ(report.unreliable_landmarks.count(landmark_names::CHIN), 1u);
    EXPECT_TRUE(hasIssueContaining(report, "'face'"));
    EXPECT_FALSE(hasIssueContaining(report, "'left_eye'"));
}

TEST_F(FaceValidatorTest, RegionIssuesFollowSuppliedAnchors) {
    LandmarkSet face = makeFace(150.0f, 220.0f, 80.0f);

    RegionAnchors anchors = defaultAnchorMap();
    anchors[RegionName::FACE] = {landmark_names::LEFT_EYE_CENTER, landmark_names::RIGHT_EYE_CENTER,
                                 landmark_names::NOSE_TIP};
    anchors[RegionName::MOUTH] = {landmark_names::MOUTH_LEFT, landmark_names::MOUTH_RIGHT,
                                  landmark_names::CHIN};
    ValidationReport report = validator_.validate(face, image_, 1, anchors);

    EXPECT_EQ(report.unreliable_landmarks.count(landmark_names::CHIN), 1u);
    EXPECT_FALSE(hasIssueContaining(report, "'face'"));
    EXPECT_TRUE(hasIssueContaining(report, "'mouth'"));
}

TEST(ValidatorConfigTest, InvalidConfigFallsBackToDefaults) {
    ValidatorConfig config;
    config.medium_resolution_min_side = 512;   // above the high tier
    EXPECT_FALSE(config.validate());

    FaceValidator validator(config);
    EXPECT_EQ(validator.getConfig().medium_resolution_min_side, 128);
}
