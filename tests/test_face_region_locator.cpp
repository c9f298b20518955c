/**
 * @file test_face_region_locator.cpp
 * @brief Unit tests for FaceRegionLocator
 *
 * Validates:
 * - Detection on uniform and block skin images
 * - Aspect ratio band boundaries (2.0 accepted, 3.0 rejected)
 * - Rejection reasons (no skin, small box, sparse box)
 * - Padding and clamping of the accepted region
 * - Candidate area and stride options
 */

#include <gtest/gtest.h>
#include <skintone/analysis/FaceRegionLocator.hpp>
#include <skintone/core/Logger.hpp>
#include "SyntheticImages.hpp"

using namespace skintone::analysis;
using namespace skintone::synthetic;

class FaceRegionLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        skintone::core::Logger::getInstance().setLevel(skintone::core::LogLevel::WARNING);
        locator_ = std::make_unique<FaceRegionLocator>(LocatorConfig(), SkinToneClassifier());
    }

    void TearDown() override {
        locator_.reset();
    }

    std::unique_ptr<FaceRegionLocator> locator_;
};

/**
 * Test 1: Uniform skin image is one large face region
 */
TEST_F(FaceRegionLocatorTest, UniformSkinImage) {
    const auto image = toBuffer(canvas(100, 100, warmSkin()));
    const FaceLocation location = locator_->locate(image);

    ASSERT_TRUE(location.faceDetected());
    EXPECT_EQ(location.decision, RegionDecision::ACCEPTED);
    EXPECT_EQ(location.skin_bounds, cv::Rect(0, 0, 100, 100));
    EXPECT_EQ(*location.region, cv::Rect(0, 0, 100, 100));
    EXPECT_FLOAT_EQ(location.skin_ratio, 1.0f);
    EXPECT_FLOAT_EQ(location.box_density, 1.0f);
}

/**
 * Test 2: No skin at all
 */
TEST_F(FaceRegionLocatorTest, BlackImageHasNoFace) {
    const auto image = toBuffer(canvas(100, 100));
    const FaceLocation location = locator_->locate(image);

    EXPECT_FALSE(location.faceDetected());
    EXPECT_EQ(location.decision, RegionDecision::INSUFFICIENT_SKIN);
    EXPECT_EQ(location.skin_pixels, 0u);
    EXPECT_FALSE(location.region.has_value());
}

/**
 * Test 3: Empty buffer
 */
TEST_F(FaceRegionLocatorTest, EmptyImage) {
    const FaceLocation location = locator_->locate(PixelBuffer());
    EXPECT_FALSE(location.faceDetected());
    EXPECT_EQ(location.decision, RegionDecision::EMPTY_IMAGE);
}

/**
 * Test 4: Aspect ratio exactly 2.0 is inside the band
 */
TEST_F(FaceRegionLocatorTest, AspectRatioTwoAccepted) {
    cv::Mat rgba = canvas(400, 300);
    fillRect(rgba, cv::Rect(100, 100, 200, 100), warmSkin());

    const FaceLocation location = locator_->locate(toBuffer(rgba));

    ASSERT_TRUE(location.faceDetected());
    EXPECT_EQ(location.skin_bounds, cv::Rect(100, 100, 200, 100));
    EXPECT_FLOAT_EQ(location.aspect_ratio, 2.0f);
}

/**
 * Test 5: Aspect ratio 3.0 is rejected
 */
TEST_F(FaceRegionLocatorTest, AspectRatioThreeRejected) {
    cv::Mat rgba = canvas(500, 300);
    fillRect(rgba, cv::Rect(100, 100, 300, 100), warmSkin());

    const FaceLocation location = locator_->locate(toBuffer(rgba));

    EXPECT_FALSE(location.faceDetected());
    EXPECT_EQ(location.decision, RegionDecision::ASPECT_RATIO_OUT_OF_RANGE);
    EXPECT_FLOAT_EQ(location.aspect_ratio, 3.0f);
}

/**
 * Test 6: Tall boxes below 0.5 are rejected as well
 */
TEST_F(FaceRegionLocatorTest, TallBoxRejected) {
    cv::Mat rgba = canvas(200, 300);
    fillRect(rgba, cv::Rect(80, 20, 40, 200), warmSkin());

    const FaceLocation location = locator_->locate(toBuffer(rgba));
    EXPECT_EQ(location.decision, RegionDecision::ASPECT_RATIO_OUT_OF_RANGE);
}

/**
 * Test 7: Box smaller than the minimum side
 */
TEST_F(FaceRegionLocatorTest, SmallBoxRejected) {
    cv::Mat rgba = canvas(50, 50);
    fillRect(rgba, cv::Rect(20, 20, 8, 8), warmSkin());

    const FaceLocation location = locator_->locate(toBuffer(rgba));
    EXPECT_EQ(location.decision, RegionDecision::REGION_TOO_SMALL);
}

/**
 * Test 8: Scattered skin spanning a large, mostly empty box
 */
TEST_F(FaceRegionLocatorTest, SparseBoxRejected) {
    cv::Mat rgba = canvas(200, 200);
    fillRect(rgba, cv::Rect(0, 0, 20, 20), warmSkin());
    fillRect(rgba, cv::Rect(180, 180, 20, 20), warmSkin());

    const FaceLocation location = locator_->locate(toBuffer(rgba));
    EXPECT_EQ(location.decision, RegionDecision::LOW_DENSITY);
    EXPECT_NEAR(location.box_density, 0.02f, 1e-4f);
}

/**
 * Test 9: Padding grows the box by half its larger side
 */
TEST_F(FaceRegionLocatorTest, PaddingApplied) {
    cv::Mat rgba = canvas(200, 200);
    fillRect(rgba, cv::Rect(80, 80, 40, 40), warmSkin());

    const FaceLocation location = locator_->locate(toBuffer(rgba));

    ASSERT_TRUE(location.faceDetected());
    EXPECT_EQ(location.skin_bounds, cv::Rect(80, 80, 40, 40));
    EXPECT_EQ(*location.region, cv::Rect(60, 60, 80, 80));
}

/**
 * Test 10: Padding is clamped at the image border
 */
TEST_F(FaceRegionLocatorTest, PaddingClampedToImage) {
    cv::Mat rgba = canvas(200, 200);
    fillRect(rgba, cv::Rect(0, 0, 40, 40), warmSkin());

    const FaceLocation location = locator_->locate(toBuffer(rgba));

    ASSERT_TRUE(location.faceDetected());
    EXPECT_EQ(*location.region, cv::Rect(0, 0, 60, 60));
}

/**
 * Test 11: Only the candidate area is scanned
 */
TEST_F(FaceRegionLocatorTest, CandidateRegionLimitsScan) {
    cv::Mat rgba = canvas(200, 200);
    fillRect(rgba, cv::Rect(10, 80, 40, 40), warmSkin());

    LocatorConfig config;
    config.candidate_region = cv::Rect2f(0.5f, 0.0f, 0.5f, 1.0f);
    FaceRegionLocator right_half(config, SkinToneClassifier());

    EXPECT_EQ(right_half.candidateRect(200, 200), cv::Rect(100, 0, 100, 200));
    EXPECT_EQ(right_half.locate(toBuffer(rgba)).decision, RegionDecision::INSUFFICIENT_SKIN);
    EXPECT_TRUE(locator_->locate(toBuffer(rgba)).faceDetected());
}

/**
 * Test 12: Strided scan still finds a uniform face
 */
TEST_F(FaceRegionLocatorTest, StridedScan) {
    LocatorConfig config;
    config.scan_stride = 2;
    FaceRegionLocator strided(config, SkinToneClassifier());

    const FaceLocation location = strided.locate(toBuffer(canvas(100, 100, warmSkin())));

    ASSERT_TRUE(location.faceDetected());
    EXPECT_EQ(location.scanned_pixels, 2500u);
    EXPECT_FLOAT_EQ(location.box_density, 1.0f);
}

/**
 * Test 13: Same input, same answer
 */
TEST_F(FaceRegionLocatorTest, Deterministic) {
    cv::Mat rgba = canvas(160, 120);
    fillRect(rgba, cv::Rect(50, 30, 60, 70), warmSkin());
    const auto image = toBuffer(rgba);

    const FaceLocation a = locator_->locate(image);
    const FaceLocation b = locator_->locate(image);

    ASSERT_TRUE(a.faceDetected());
    EXPECT_EQ(*a.region, *b.region);
    EXPECT_EQ(a.skin_pixels, b.skin_pixels);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
