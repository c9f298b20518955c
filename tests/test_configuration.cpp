/**
 * @file test_configuration.cpp
 * @brief Tests for YAML configuration loading and AnalysisConfig mapping
 */

#include <gtest/gtest.h>
#include <skintone/core/Configuration.hpp>
#include <skintone/core/Logger.hpp>
#include <skintone/analysis/AnalysisConfig.hpp>
#include <cstdio>
#include <fstream>

using namespace skintone;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }

    core::Configuration config_;
};

TEST_F(ConfigurationTest, DottedKeys) {
    config_.loadFromString(
        "cache:\n"
        "  capacity: 7\n"
        "locator:\n"
        "  candidate_region:\n"
        "    x: 0.25\n");

    EXPECT_TRUE(config_.has("cache.capacity"));
    EXPECT_TRUE(config_.has("locator.candidate_region.x"));
    EXPECT_FALSE(config_.has("cache.threshold"));
    EXPECT_FALSE(config_.has("nothing.here"));

    EXPECT_EQ(config_.get<int>("cache.capacity", 5), 7);
    EXPECT_FLOAT_EQ(config_.get<float>("locator.candidate_region.x", 0.0f), 0.25f);
    EXPECT_EQ(config_.get<int>("cache.missing", 42), 42);
}

TEST_F(ConfigurationTest, WrongTypeThrows) {
    config_.loadFromString("cache:\n  capacity: lots\n");
    EXPECT_THROW(config_.get<int>("cache.capacity", 5), core::ConfigurationException);
}

TEST_F(ConfigurationTest, MalformedYamlThrows) {
    EXPECT_THROW(config_.loadFromString("cache: [unterminated"), core::ConfigurationException);
}

TEST_F(ConfigurationTest, MissingFileThrows) {
    try {
        config_.load("/tmp/skintone_test_missing_config.yaml");
        FAIL() << "expected ConfigurationException";
    } catch (const core::ConfigurationException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_CONFIG_INVALID);
    }
}

TEST_F(ConfigurationTest, LoadFromFile) {
    const std::string path = "/tmp/skintone_test_config.yaml";
    {
        std::ofstream out(path);
        out << "undertone:\n  min_samples: 80\n";
    }

    config_.load(path);
    EXPECT_EQ(config_.getFilename(), path);
    EXPECT_EQ(config_.get<int>("undertone.min_samples", 50), 80);

    config_.clear();
    EXPECT_FALSE(config_.has("undertone.min_samples"));
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, EmptyDocumentKeepsDefaults) {
    config_.loadFromString("");
    const analysis::AnalysisConfig loaded = analysis::loadAnalysisConfig(config_);
    const analysis::AnalysisConfig defaults;

    EXPECT_EQ(loaded.toString(), defaults.toString());
    EXPECT_TRUE(loaded.validate());
}

TEST_F(ConfigurationTest, AnalysisConfigMapping) {
    config_.loadFromString(
        "skin:\n"
        "  min_channel_spread: 0\n"
        "locator:\n"
        "  scan_stride: 2\n"
        "  max_aspect_ratio: 1.8\n"
        "undertone:\n"
        "  min_samples: 80\n"
        "  median_weight: 0.5\n"
        "cache:\n"
        "  capacity: 3\n"
        "palette:\n"
        "  fallback_palette: Winter\n"
        "  hash_central_cells_only: true\n"
        "normalization:\n"
        "  enabled: false\n");

    const analysis::AnalysisConfig loaded = analysis::loadAnalysisConfig(config_);

    EXPECT_EQ(loaded.skin.min_channel_spread, 0);
    EXPECT_EQ(loaded.locator.scan_stride, 2);
    EXPECT_FLOAT_EQ(loaded.locator.max_aspect_ratio, 1.8f);
    EXPECT_EQ(loaded.undertone.min_samples, 80u);
    EXPECT_FLOAT_EQ(loaded.undertone.median_weight, 0.5f);
    EXPECT_EQ(loaded.cache.capacity, 3u);
    EXPECT_EQ(loaded.palette.fallback_palette, analysis::SeasonalPalette::WINTER);
    EXPECT_TRUE(loaded.palette.hash_central_cells_only);
    EXPECT_FALSE(loaded.normalization.enabled);

    // Untouched sections keep defaults
    EXPECT_EQ(loaded.signature.grid_size, 5);
    EXPECT_FLOAT_EQ(loaded.cache.similarity_threshold, 80.0f);
}

TEST_F(ConfigurationTest, UnknownFallbackPaletteThrows) {
    config_.loadFromString("palette:\n  fallback_palette: monsoon\n");
    EXPECT_THROW(analysis::loadAnalysisConfig(config_), core::ConfigurationException);
}

TEST_F(ConfigurationTest, InconsistentValuesThrow) {
    config_.loadFromString("undertone:\n  cool_red_blue_margin: 45\n");
    EXPECT_THROW(analysis::loadAnalysisConfig(config_), core::ConfigurationException);

    config_.loadFromString("signature:\n  grid_size: 12\n");
    EXPECT_THROW(analysis::loadAnalysisConfig(config_), core::ConfigurationException);
}

TEST_F(ConfigurationTest, ValidateDefaults) {
    analysis::AnalysisConfig config;
    EXPECT_TRUE(config.validate());
    EXPECT_FALSE(config.toString().empty());

    config.cache.similarity_threshold = 150.0f;
    EXPECT_FALSE(config.validate());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
