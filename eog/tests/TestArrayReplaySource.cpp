/**
 * @file TestArrayReplaySource.cpp
 * @brief Unit tests for the in-memory replay source.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/source/ArrayReplaySource.hpp"

#include <array>
#include <vector>

namespace spk::eog {

using namespace eog::source;

TEST_CASE("ArrayReplaySource lifecycle", "[source][replay]")
{
    ArrayReplaySource source({1.0f, 2.0f, 3.0f, 4.0f, 5.0f}, 250.0f);
    REQUIRE(source.info().sampleRate == 250.0f);

    std::array<float, 8> buf{};
    REQUIRE(source.read(buf).error().code == ErrorCode::kNotInitialized);

    REQUIRE(source.start().has_value());
    REQUIRE(source.start().error().code == ErrorCode::kAlreadyRunning);
    REQUIRE_FALSE(source.exhausted());

    auto n = source.read(buf);
    REQUIRE(n.has_value());
    REQUIRE(*n == 5);
    REQUIRE(buf[4] == 5.0f);
    REQUIRE(source.exhausted());
    REQUIRE(*source.read(buf) == 0);

    source.stop();
    REQUIRE(source.start().has_value());
    REQUIRE_FALSE(source.exhausted());
}

TEST_CASE("ArrayReplaySource delivers in chunks", "[source][replay]")
{
    ArrayReplaySource source({1.0f, 2.0f, 3.0f, 4.0f, 5.0f}, 100.0f, {.chunkSize = 2});
    REQUIRE(source.start().has_value());

    std::array<float, 8> buf{};
    REQUIRE(*source.read(buf) == 2);
    REQUIRE(*source.read(buf) == 2);
    REQUIRE(buf[0] == 3.0f);
    REQUIRE(*source.read(buf) == 1);
    REQUIRE(buf[0] == 5.0f);
    REQUIRE(source.exhausted());

    SECTION("Caller buffer smaller than the chunk")
    {
        ArrayReplaySource other({1.0f, 2.0f, 3.0f}, 100.0f, {.chunkSize = 10});
        REQUIRE(other.start().has_value());
        std::array<float, 1> one{};
        REQUIRE(*other.read(one) == 1);
        REQUIRE(one[0] == 1.0f);
    }
}

TEST_CASE("ArrayReplaySource loops when asked", "[source][replay]")
{
    ArrayReplaySource source({1.0f, 2.0f, 3.0f}, 100.0f, {.chunkSize = 2, .loop = true});
    REQUIRE(source.start().has_value());

    std::vector<float> seen;
    std::array<float, 2> buf{};
    for (int i = 0; i < 4; ++i) {
        auto n = source.read(buf);
        REQUIRE(n.has_value());
        seen.insert(seen.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(*n));
        REQUIRE_FALSE(source.exhausted());
    }
    REQUIRE(seen == std::vector<float>{1.0f, 2.0f, 3.0f, 1.0f, 2.0f, 3.0f});
}

TEST_CASE("ArrayReplaySource refuses an empty recording", "[source][replay]")
{
    ArrayReplaySource source({}, 100.0f);
    REQUIRE(source.start().error().code == ErrorCode::kEmptyInput);
}

} // namespace spk::eog
