/**
 * @file TestStatistics.cpp
 * @brief Unit tests for math::Statistics.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "spk/eog/math/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace spk::eog {

using namespace eog::math;
using Catch::Matchers::WithinAbs;

TEST_CASE("Statistics::mean and sampleStdDev", "[math][statistics]")
{
    const std::vector<double> data = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    REQUIRE_THAT(Statistics::mean(data), WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(Statistics::sampleStdDev(data), WithinAbs(std::sqrt(32.0 / 7.0), 1e-12));

    REQUIRE(Statistics::mean(std::vector<double>{}) == 0.0);
    REQUIRE(Statistics::sampleStdDev(std::vector<double>{3.0}) == 0.0);
}

TEST_CASE("Statistics::zScore yields zero mean and unit sample stddev", "[math][statistics]")
{
    const std::vector<double> data = {1.0, 2.0, 3.0, 4.0, 10.0};
    auto z = Statistics::zScore(data);
    REQUIRE(z.has_value());
    REQUIRE_THAT(Statistics::mean(*z), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(Statistics::sampleStdDev(*z), WithinAbs(1.0, 1e-12));

    const std::vector<double> flat(10, 3.0);
    auto bad = Statistics::zScore(flat);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::kInvalidWindow);
}

TEST_CASE("Statistics::normaliseAmplitude centres and scales to unit peak", "[math][statistics]")
{
    const std::vector<float> data = {1.0f, 3.0f, 2.0f, 10.0f};
    auto out = Statistics::normaliseAmplitude(std::span<const float>(data));
    REQUIRE(out.has_value());

    double peak = 0.0;
    for (const double x : *out)
        peak = std::max(peak, std::abs(x));
    REQUIRE_THAT(peak, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(Statistics::mean(*out), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(out->back(), WithinAbs(1.0, 1e-12));

    SECTION("flat and empty input are invalid windows")
    {
        const std::vector<double> flat(4, 2.0);
        REQUIRE(Statistics::normaliseAmplitude(flat).error().code == ErrorCode::kInvalidWindow);
        REQUIRE(Statistics::normaliseAmplitude(std::span<const double>{}).error().code == ErrorCode::kInvalidWindow);
    }
}

TEST_CASE("Statistics::allFinite", "[math][statistics]")
{
    REQUIRE(Statistics::allFinite(std::vector<double>{1.0, -2.0}));
    REQUIRE_FALSE(Statistics::allFinite(std::vector<double>{1.0, std::numeric_limits<double>::quiet_NaN()}));
    REQUIRE_FALSE(Statistics::allFinite(std::vector<double>{std::numeric_limits<double>::infinity()}));
}

} // namespace spk::eog
