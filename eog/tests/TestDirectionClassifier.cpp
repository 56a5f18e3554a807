/**
 * @file TestDirectionClassifier.cpp
 * @brief Unit tests for detect::DirectionClassifier.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/detect/DirectionClassifier.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace spk::eog {

using namespace eog::detect;

namespace {

/// Positive bump followed by a negative one, or the reverse.
std::vector<float> deflection(bool peakFirst, float scale)
{
    std::vector<float> s(100, 0.0f);
    for (std::size_t i = 10; i < 40; ++i)
        s[i] = (peakFirst ? 1.0f : -1.0f) * scale * std::sin(static_cast<float>(i - 10) / 30.0f * 3.14159f);
    for (std::size_t i = 50; i < 80; ++i)
        s[i] = (peakFirst ? -1.0f : 1.0f) * scale * std::sin(static_cast<float>(i - 50) / 30.0f * 3.14159f);
    return s;
}

} // namespace

TEST_CASE("DirectionClassifier orders the extremes", "[detect][direction]")
{
    const DirectionClassifier classifier;

    for (float scale : {0.001f, 1.0f, 512.0f, 1.0e5f}) {
        auto left = classifier.classify(deflection(true, scale));
        REQUIRE(left.has_value());
        REQUIRE(*left == Direction::kLeft);

        auto right = classifier.classify(deflection(false, scale));
        REQUIRE(right.has_value());
        REQUIRE(*right == Direction::kRight);
    }
}

TEST_CASE("DirectionClassifier with a two-sample window", "[detect][direction]")
{
    const DirectionClassifier classifier;
    REQUIRE(*classifier.classify(std::vector<float>{2.0f, 1.0f}) == Direction::kLeft);
    REQUIRE(*classifier.classify(std::vector<float>{1.0f, 2.0f}) == Direction::kRight);
}

TEST_CASE("DirectionClassifier ties resolve to the first occurrence", "[detect][direction]")
{
    const DirectionClassifier classifier;
    // max first at 1, min first at 2
    const std::vector<float> s = {0.0f, 5.0f, -5.0f, 5.0f, -5.0f};
    REQUIRE(*classifier.classify(s) == Direction::kLeft);
}

TEST_CASE("DirectionClassifier rejects degenerate windows", "[detect][direction]")
{
    const DirectionClassifier classifier;

    SECTION("Constant")
    {
        auto r = classifier.classify(std::vector<float>(50, 3.0f));
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::kInvalidWindow);
    }

    SECTION("Too short")
    {
        REQUIRE(classifier.classify(std::vector<float>{1.0f}).error().code == ErrorCode::kInvalidWindow);
        REQUIRE(classifier.classify(std::vector<float>{}).error().code == ErrorCode::kInvalidWindow);
    }

    SECTION("NaN")
    {
        auto s = deflection(true, 1.0f);
        s[60] = std::numeric_limits<float>::quiet_NaN();
        REQUIRE(classifier.classify(s).error().code == ErrorCode::kInvalidWindow);
    }
}

TEST_CASE("Direction names", "[detect][direction]")
{
    REQUIRE(directionName(Direction::kLeft) == "left");
    REQUIRE(directionName(Direction::kRight) == "right");
}

} // namespace spk::eog
