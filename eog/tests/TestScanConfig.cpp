/**
 * @file TestScanConfig.cpp
 * @brief Unit tests for ScanConfig::Builder.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/pipeline/ScanConfig.hpp"

namespace spk::eog {

using namespace eog::pipeline;

TEST_CASE("ScanConfig defaults follow the sample rate", "[pipeline][config]")
{
    SECTION("Reference rate")
    {
        auto cfg = ScanConfig::Builder{}.build();
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->sampleRate() == kReferenceSampleRate);
        REQUIRE(cfg->windowSize() == 500);
        REQUIRE(cfg->increment() == 50);
        REQUIRE(cfg->thresholdCrossings() == kDefaultThresholdCrossings);
        REQUIRE(cfg->mode() == ClassificationMode::kDirection);
        REQUIRE(cfg->ignoreUntil() < 0.0);
    }

    SECTION("SpikerBox rate")
    {
        auto cfg = ScanConfig::Builder{}.sampleRate(kSpikerSampleRate).build();
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->windowSize() == 10000);
        REQUIRE(cfg->increment() == 1000);
        REQUIRE(cfg->thresholdCrossings() == 4000);
    }

    SECTION("Threshold scales with an explicit window")
    {
        auto cfg = ScanConfig::Builder{}.windowSize(250).build();
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->increment() == 25);
        REQUIRE(cfg->thresholdCrossings() == 100);
    }
}

TEST_CASE("ScanConfig keeps explicit values", "[pipeline][config]")
{
    auto cfg = ScanConfig::Builder{}
                   .windowSize(400)
                   .increment(40)
                   .thresholdCrossings(120)
                   .sampleRate(1000.0f)
                   .mode(ClassificationMode::kModel)
                   .ignoreUntil(3.5)
                   .build();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->windowSize() == 400);
    REQUIRE(cfg->increment() == 40);
    REQUIRE(cfg->thresholdCrossings() == 120);
    REQUIRE(cfg->sampleRate() == 1000.0f);
    REQUIRE(cfg->mode() == ClassificationMode::kModel);
    REQUIRE(cfg->ignoreUntil() == 3.5);
    REQUIRE(classificationModeName(cfg->mode()) == "model");
}

TEST_CASE("ScanConfig rejects invalid values", "[pipeline][config]")
{
    REQUIRE(ScanConfig::Builder{}.sampleRate(0.0f).build().error().code == ErrorCode::kInvalidConfiguration);
    REQUIRE(ScanConfig::Builder{}.sampleRate(-5.0f).build().error().code == ErrorCode::kInvalidConfiguration);
    REQUIRE(ScanConfig::Builder{}.windowSize(100).increment(100).build().error().code ==
            ErrorCode::kInvalidConfiguration);
    REQUIRE(ScanConfig::Builder{}.windowSize(100).increment(150).build().error().code ==
            ErrorCode::kInvalidConfiguration);
}

TEST_CASE("ScanConfig rejects an explicit zero instead of defaulting it", "[pipeline][config]")
{
    SECTION("Window size")
    {
        auto cfg = ScanConfig::Builder{}.windowSize(0).build();
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::kInvalidConfiguration);
    }

    SECTION("Increment")
    {
        auto cfg = ScanConfig::Builder{}.windowSize(500).increment(0).build();
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::kInvalidConfiguration);
    }

    SECTION("Threshold")
    {
        auto cfg = ScanConfig::Builder{}.thresholdCrossings(0).build();
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::kInvalidConfiguration);
    }
}

TEST_CASE("ScanConfig bounds the threshold by the window length", "[pipeline][config]")
{
    SECTION("One below the maximum crossing count is accepted")
    {
        auto cfg = ScanConfig::Builder{}.windowSize(500).thresholdCrossings(499).build();
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->thresholdCrossings() == 499);
    }

    SECTION("A threshold every window falls under is rejected")
    {
        REQUIRE(ScanConfig::Builder{}.windowSize(500).thresholdCrossings(500).build().error().code ==
                ErrorCode::kInvalidConfiguration);
        REQUIRE(ScanConfig::Builder{}.windowSize(500).thresholdCrossings(100000).build().error().code ==
                ErrorCode::kInvalidConfiguration);
    }

    SECTION("An unset threshold scales to a valid value for short windows")
    {
        auto cfg = ScanConfig::Builder{}.windowSize(20).build();
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->thresholdCrossings() == 8);
        REQUIRE(cfg->increment() == 2);
    }
}

} // namespace spk::eog
