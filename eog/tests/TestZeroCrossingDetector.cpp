/**
 * @file TestZeroCrossingDetector.cpp
 * @brief Unit tests for detect::ZeroCrossingDetector.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/detect/ZeroCrossingDetector.hpp"

#include <cmath>
#include <numbers>
#include <vector>

namespace spk::eog {

using namespace eog::detect;

namespace {

std::vector<float> sine(double frequency, std::size_t n, double rate, double amplitude = 1.0)
{
    std::vector<float> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / rate;
        out[i] = static_cast<float>(amplitude * std::sin(2.0 * std::numbers::pi * frequency * t + 0.3));
    }
    return out;
}

} // namespace

TEST_CASE("ZeroCrossingDetector counts sign changes", "[detect][zerocrossing]")
{
    SECTION("Explicit sequence")
    {
        const std::vector<float> s = {1.0f, -1.0f, -2.0f, 3.0f, 4.0f, -0.5f};
        REQUIRE(ZeroCrossingDetector::countZeroCrossings(s) == 3);
    }

    SECTION("Pairs touching zero count")
    {
        const std::vector<float> s = {1.0f, 0.0f, 1.0f};
        REQUIRE(ZeroCrossingDetector::countZeroCrossings(s) == 2);
    }

    SECTION("Empty and single-sample windows have none")
    {
        REQUIRE(ZeroCrossingDetector::countZeroCrossings(std::vector<float>{}) == 0);
        REQUIRE(ZeroCrossingDetector::countZeroCrossings(std::vector<float>{3.0f}) == 0);
    }

    SECTION("Sine crosses twice per period")
    {
        for (double f : {2.0, 10.0, 60.0}) {
            const auto s = sine(f, 500, 500.0);
            const auto count = ZeroCrossingDetector::countZeroCrossings(s);
            REQUIRE(count + 1 >= static_cast<std::size_t>(2 * f));
            REQUIRE(count <= static_cast<std::size_t>(2 * f) + 1);
        }
    }
}

TEST_CASE("ZeroCrossingDetector is amplitude invariant", "[detect][zerocrossing]")
{
    const auto base = sine(37.0, 500, 500.0);
    std::vector<float> scaled(base.size());
    for (std::size_t i = 0; i < base.size(); ++i)
        scaled[i] = base[i] * 1234.5f;

    REQUIRE(ZeroCrossingDetector::countZeroCrossings(base) ==
            ZeroCrossingDetector::countZeroCrossings(scaled));

    const ZeroCrossingDetector detector(50);
    REQUIRE(detector.detect(base) == detector.detect(scaled));
}

TEST_CASE("ZeroCrossingDetector threshold", "[detect][zerocrossing]")
{
    const ZeroCrossingDetector detector(200);

    SECTION("Slow deflection is an event")
    {
        REQUIRE(detector.detect(sine(1.0, 500, 500.0)));
    }

    SECTION("High-frequency noise is not")
    {
        REQUIRE_FALSE(detector.detect(sine(120.0, 500, 500.0)));
    }

    SECTION("Count equal to the threshold is not an event")
    {
        std::vector<float> s(201);
        for (std::size_t i = 0; i < s.size(); ++i)
            s[i] = (i % 2 == 0) ? 1.0f : -1.0f;
        REQUIRE(ZeroCrossingDetector::countZeroCrossings(s) == 200);
        REQUIRE_FALSE(detector.detect(s));
    }
}

TEST_CASE("ZeroCrossingDetector factories", "[detect][zerocrossing]")
{
    SECTION("Zero threshold is rejected")
    {
        auto result = ZeroCrossingDetector::create(0);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::kInvalidConfiguration);
    }

    SECTION("Positive threshold is kept")
    {
        auto result = ZeroCrossingDetector::create(17);
        REQUIRE(result.has_value());
        REQUIRE(result->thresholdCrossings() == 17);
    }

    SECTION("scaledFor keeps the default at the reference window")
    {
        REQUIRE(ZeroCrossingDetector::scaledFor(500).thresholdCrossings() == kDefaultThresholdCrossings);
        REQUIRE(ZeroCrossingDetector::scaledFor(5000).thresholdCrossings() == 2000);
        REQUIRE(ZeroCrossingDetector::scaledFor(250).thresholdCrossings() == 100);
        REQUIRE(ZeroCrossingDetector::scaledFor(1).thresholdCrossings() == 1);
    }

    REQUIRE(ZeroCrossingDetector().name() == "ZeroCrossingDetector");
}

} // namespace spk::eog
