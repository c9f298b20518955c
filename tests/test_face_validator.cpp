/**
 * @file test_face_validator.cpp
 * @brief Unit tests for the FaceValidator portrait advisory
 */

#include <gtest/gtest.h>
#include <skintone/analysis/FaceValidator.hpp>
#include <skintone/core/Logger.hpp>
#include "SyntheticImages.hpp"

using namespace skintone::analysis;
using namespace skintone::synthetic;

class FaceValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        skintone::core::Logger::getInstance().setLevel(skintone::core::LogLevel::WARNING);
        validator_ = std::make_unique<FaceValidator>(ValidationConfig(), SkinToneClassifier());
    }

    void TearDown() override {
        validator_.reset();
    }

    /// 300x300 striped gray background with a filled skin disc in the middle
    static cv::Mat portrait() {
        cv::Mat rgba = canvas(300, 300);
        stripeRect(rgba, cv::Rect(0, 0, 300, 300), rgb(40, 40, 40), rgb(44, 44, 44));
        cv::circle(rgba, cv::Point(150, 150), 90, warmSkin(), cv::FILLED);
        return rgba;
    }

    std::unique_ptr<FaceValidator> validator_;
};

/**
 * Test 1: Portrait-like composition passes every check
 */
TEST_F(FaceValidatorTest, PortraitIsValid) {
    const FaceValidation result = validator_->validate(toBuffer(portrait()));

    EXPECT_TRUE(result.is_valid) << FaceValidator::issueToString(result.issue);
    EXPECT_EQ(result.issue, ValidationIssue::NONE);
    EXPECT_EQ(result.message, "Face detected");
    EXPECT_GT(result.center_skin_ratio, 0.3f);
    EXPECT_FLOAT_EQ(result.edge_skin_ratio, 0.0f);
}

/**
 * Test 2: Empty buffer
 */
TEST_F(FaceValidatorTest, EmptyImage) {
    const FaceValidation result = validator_->validate(PixelBuffer());
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.issue, ValidationIssue::EMPTY_IMAGE);
}

/**
 * Test 3: Panorama framing
 */
TEST_F(FaceValidatorTest, WideImageRejected) {
    const FaceValidation result = validator_->validate(toBuffer(canvas(300, 100, warmSkin())));
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.issue, ValidationIssue::IMAGE_ASPECT_RATIO);
    EXPECT_FLOAT_EQ(result.image_aspect, 3.0f);
    EXPECT_FALSE(result.message.empty());
}

/**
 * Test 4: No skin
 */
TEST_F(FaceValidatorTest, NoSkinRejected) {
    const FaceValidation result = validator_->validate(toBuffer(canvas(200, 200)));
    EXPECT_EQ(result.issue, ValidationIssue::INSUFFICIENT_SKIN);
    EXPECT_EQ(result.message, FaceValidator::issueMessage(ValidationIssue::INSUFFICIENT_SKIN));
}

/**
 * Test 5: Flat image has no color variation
 */
TEST_F(FaceValidatorTest, UniformImageRejected) {
    const FaceValidation result = validator_->validate(toBuffer(canvas(200, 200, warmSkin())));
    EXPECT_EQ(result.issue, ValidationIssue::COLOR_VARIATION);
    EXPECT_FLOAT_EQ(result.color_variation, 0.0f);
}

/**
 * Test 6: Skin on the border, not in the center
 */
TEST_F(FaceValidatorTest, InvertedDistributionRejected) {
    cv::Mat rgba = canvas(300, 300);
    stripeRect(rgba, cv::Rect(0, 0, 300, 300), warmSkin(), rgb(184, 144, 114));
    cv::circle(rgba, cv::Point(150, 150), 110, rgb(40, 40, 40), cv::FILLED);

    const FaceValidation result = validator_->validate(toBuffer(rgba));
    EXPECT_EQ(result.issue, ValidationIssue::SKIN_DISTRIBUTION);
    EXPECT_FLOAT_EQ(result.center_skin_ratio, 0.0f);
}

/**
 * Test 7: Color variation measure
 */
TEST_F(FaceValidatorTest, ColorVariation) {
    EXPECT_FLOAT_EQ(FaceValidator::colorVariation(canvas(64, 64, warmSkin())), 0.0f);

    // Every sampled step alternates between two grays 4 apart per channel
    cv::Mat striped = canvas(64, 64);
    stripeRect(striped, cv::Rect(0, 0, 64, 64), rgb(40, 40, 40), rgb(44, 44, 44));
    const float variation = FaceValidator::colorVariation(striped);
    EXPECT_NEAR(variation, 48.0f, 0.1f);
}

/**
 * Test 8: Large photos are analyzed on a downscaled copy
 */
TEST_F(FaceValidatorTest, LargeImageDownscaled) {
    cv::Mat large;
    cv::resize(portrait(), large, cv::Size(900, 900), 0, 0, cv::INTER_NEAREST);

    const FaceValidation result = validator_->validate(toBuffer(large));
    EXPECT_NE(result.issue, ValidationIssue::INSUFFICIENT_SKIN);
    EXPECT_GT(result.center_skin_ratio, 0.3f);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
