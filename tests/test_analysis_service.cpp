/**
 * @file test_analysis_service.cpp
 * @brief End-to-end tests for AnalysisService
 *
 * Validates:
 * - Warm / cool / neutral uniform skin images
 * - Fallback for images without usable skin
 * - Consistency cache short-circuit and sharing between services
 * - detectFace report
 * - Configuration validation and concurrent analyses
 */

#include <gtest/gtest.h>
#include <skintone/analysis/AnalysisService.hpp>
#include <skintone/core/exception.h>
#include <skintone/core/Logger.hpp>
#include "SyntheticImages.hpp"
#include <thread>
#include <vector>

using namespace skintone::analysis;
using namespace skintone::synthetic;

class AnalysisServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        skintone::core::Logger::getInstance().setLevel(skintone::core::LogLevel::WARNING);
        cache_ = std::make_shared<ConsistencyCache>();
        service_ = std::make_unique<AnalysisService>(AnalysisConfig(), cache_);
    }

    void TearDown() override {
        service_.reset();
        cache_.reset();
    }

    std::shared_ptr<ConsistencyCache> cache_;
    std::unique_ptr<AnalysisService> service_;
};

/**
 * Test 1: Uniform warm skin
 */
TEST_F(AnalysisServiceTest, UniformWarmImage) {
    const auto image = toBuffer(canvas(100, 100, warmSkin()));

    const AnalysisResult result = service_->analyze(image);

    EXPECT_EQ(result.undertone, Undertone::WARM);
    EXPECT_EQ(result.skin_tone, "Warm / Golden");
    EXPECT_TRUE(result.palette == SeasonalPalette::SPRING || result.palette == SeasonalPalette::AUTUMN);
    EXPECT_EQ(result.best_colors.size(), 8u);
    EXPECT_EQ(result.neutral_colors.size(), 4u);
    EXPECT_EQ(result.avoid_colors.size(), 4u);
    EXPECT_EQ(cache_->size(), 1u);
}

/**
 * Test 2: Uniform cool and neutral skin
 */
TEST_F(AnalysisServiceTest, UniformCoolAndNeutralImages) {
    const AnalysisResult cool = service_->analyze(toBuffer(canvas(100, 100, rgb(160, 140, 150))));
    EXPECT_EQ(cool.undertone, Undertone::COOL);
    EXPECT_TRUE(cool.palette == SeasonalPalette::SUMMER || cool.palette == SeasonalPalette::WINTER);

    cache_->clear();
    const AnalysisResult neutral = service_->analyze(toBuffer(canvas(100, 100, rgb(170, 160, 145))));
    EXPECT_EQ(neutral.undertone, Undertone::NEUTRAL);
    EXPECT_EQ(neutral.skin_tone, "Neutral / Balanced");
}

/**
 * Test 3: Black image falls back to neutral / summer
 */
TEST_F(AnalysisServiceTest, BlackImageFallback) {
    const AnalysisResult result = service_->analyze(toBuffer(canvas(100, 100)));

    EXPECT_EQ(result.undertone, Undertone::NEUTRAL);
    EXPECT_EQ(result.palette, SeasonalPalette::SUMMER);
    EXPECT_TRUE(cache_->empty());
}

/**
 * Test 4: Degenerate inputs never throw
 */
TEST_F(AnalysisServiceTest, DegenerateInputs) {
    EXPECT_EQ(service_->analyze(PixelBuffer()).palette, SeasonalPalette::SUMMER);

    // Smaller than the signature grid
    const AnalysisResult tiny = service_->analyze(toBuffer(canvas(3, 3, warmSkin())));
    EXPECT_EQ(tiny.undertone, Undertone::NEUTRAL);
    EXPECT_EQ(tiny.palette, SeasonalPalette::SUMMER);
    EXPECT_TRUE(cache_->empty());
}

/**
 * Test 5: Same image, same result
 */
TEST_F(AnalysisServiceTest, Deterministic) {
    cv::Mat rgba = canvas(200, 200, rgb(30, 60, 90));
    fillRect(rgba, cv::Rect(60, 40, 80, 110), warmSkin());
    const auto image = toBuffer(rgba);

    const AnalysisResult first = service_->analyze(image);

    // A fresh service without history gives the same answer
    AnalysisService fresh;
    EXPECT_EQ(fresh.analyze(image), first);
    EXPECT_EQ(service_->analyze(image), first);
}

/**
 * Test 6: Slightly different photo of the same face reuses the cached result
 */
TEST_F(AnalysisServiceTest, SimilarImageHitsCache) {
    const AnalysisResult first = service_->analyze(toBuffer(canvas(100, 100, warmSkin())));
    ASSERT_EQ(cache_->size(), 1u);

    const AnalysisResult second = service_->analyze(toBuffer(canvas(100, 100, rgb(181, 141, 111))));
    EXPECT_EQ(second, first);
    EXPECT_EQ(cache_->size(), 1u);
}

/**
 * Test 7: Cached result is returned without reclassifying
 */
TEST_F(AnalysisServiceTest, CacheShortCircuits) {
    const auto image = toBuffer(canvas(100, 100, warmSkin()));
    const auto report = service_->detectFace(image);
    ASSERT_TRUE(report.signature.has_value());

    const AnalysisResult planted = PaletteMapper().buildResult(Undertone::COOL, SeasonalPalette::WINTER);
    cache_->record(*report.signature, planted);

    EXPECT_EQ(service_->analyze(image), planted);
}

/**
 * Test 8: Services sharing a cache stay consistent
 */
TEST_F(AnalysisServiceTest, SharedCache) {
    AnalysisService other(AnalysisConfig(), cache_);
    EXPECT_EQ(other.cache(), cache_);

    const AnalysisResult first = service_->analyze(toBuffer(canvas(100, 100, warmSkin())));
    const AnalysisResult second = other.analyze(toBuffer(canvas(100, 100, rgb(182, 139, 112))));
    EXPECT_EQ(second, first);

    AnalysisService isolated;
    EXPECT_NE(isolated.cache(), cache_);
}

/**
 * Test 9: detectFace report
 */
TEST_F(AnalysisServiceTest, DetectFace) {
    const auto face = service_->detectFace(toBuffer(canvas(100, 100, warmSkin())));
    EXPECT_TRUE(face.face_detected);
    ASSERT_TRUE(face.region.has_value());
    EXPECT_EQ(*face.region, cv::Rect(0, 0, 100, 100));
    ASSERT_TRUE(face.signature.has_value());
    EXPECT_EQ(face.signature->size(), 75u);

    const auto none = service_->detectFace(toBuffer(canvas(100, 100)));
    EXPECT_FALSE(none.face_detected);
    EXPECT_FALSE(none.region.has_value());
    EXPECT_FALSE(none.signature.has_value());
}

/**
 * Test 10: Invalid configuration is rejected at construction
 */
TEST_F(AnalysisServiceTest, InvalidConfigThrows) {
    AnalysisConfig config;
    config.signature.grid_size = 20;  // larger than the minimum region side
    EXPECT_THROW({ AnalysisService service(config); }, skintone::core::ConfigurationException);

    AnalysisConfig bands;
    bands.undertone.cool_red_blue_margin = 40;  // above the warm margin
    EXPECT_THROW({ AnalysisService service(bands); }, skintone::core::ConfigurationException);
}

/**
 * Test 11: Concurrent analyses of the same image agree
 */
TEST_F(AnalysisServiceTest, ConcurrentAnalyses) {
    const auto image = toBuffer(canvas(120, 120, warmSkin()));
    constexpr int NUM_THREADS = 6;

    std::vector<AnalysisResult> results(NUM_THREADS);
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([this, &image, &results, i]() {
            results[i] = service_->analyze(image);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& result : results) {
        EXPECT_EQ(result, results.front());
    }
    EXPECT_LE(cache_->size(), cache_->capacity());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
