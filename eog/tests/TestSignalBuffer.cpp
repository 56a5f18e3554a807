/**
 * @file TestSignalBuffer.cpp
 * @brief Unit tests for signal::SignalBuffer and signal::Window.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "spk/eog/signal/SignalBuffer.hpp"

namespace spk::eog {

using namespace eog::signal;
using Catch::Matchers::WithinAbs;

TEST_CASE("SignalBuffer::create rejects a non-positive sample rate", "[signal][buffer]")
{
    REQUIRE_FALSE(SignalBuffer::create({1.0f, 2.0f}, 0.0f).has_value());
    REQUIRE_FALSE(SignalBuffer::create({1.0f, 2.0f}, -10.0f).has_value());

    auto ok = SignalBuffer::create({1.0f, 2.0f}, 500.0f);
    REQUIRE(ok.has_value());
    REQUIRE(ok->size() == 2);
}

TEST_CASE("SignalBuffer time axis and index lookup", "[signal][buffer]")
{
    const SignalBuffer buffer(std::vector<float>(1000, 0.0f), 500.0f);

    REQUIRE_THAT(buffer.duration(), WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(buffer.timeAt(250), WithinAbs(0.5, 1e-12));
    REQUIRE(buffer.indexAt(0.5) == 250);
    REQUIRE(buffer.indexAt(0.501) == 251);
    REQUIRE(buffer.indexAt(-1.0) == 0);
    REQUIRE(buffer.indexAt(100.0) == 1000);
}

TEST_CASE("SignalBuffer::window copies the range with a local time axis", "[signal][buffer]")
{
    const SignalBuffer buffer({0.0f, 1.0f, 2.0f, 3.0f, 4.0f, 5.0f}, 2.0f);

    auto window = buffer.window(2, 3);
    REQUIRE(window.has_value());
    REQUIRE(window->startIndex == 2);
    REQUIRE(window->samples == std::vector<float>{2.0f, 3.0f, 4.0f});
    REQUIRE_THAT(window->startTime(), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(window->duration(), WithinAbs(1.5, 1e-12));

    const auto t = window->localTime();
    REQUIRE(t.size() == 3);
    REQUIRE_THAT(t[0], WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(t[2], WithinAbs(1.0, 1e-12));
}

TEST_CASE("SignalBuffer::window rejects bad ranges", "[signal][buffer]")
{
    const SignalBuffer buffer({0.0f, 1.0f, 2.0f}, 1.0f);

    SECTION("empty window")
    {
        auto w = buffer.window(0, 0);
        REQUIRE_FALSE(w.has_value());
        REQUIRE(w.error().code == ErrorCode::kInvalidWindow);
    }

    SECTION("past the end")
    {
        auto w = buffer.window(1, 3);
        REQUIRE_FALSE(w.has_value());
        REQUIRE(w.error().code == ErrorCode::kOutOfRange);
    }

    SECTION("start beyond the signal")
    {
        REQUIRE(buffer.window(10, 1).error().code == ErrorCode::kOutOfRange);
    }
}

TEST_CASE("SignalBuffer::append keeps earlier samples unchanged", "[signal][buffer]")
{
    SignalBuffer buffer({1.0f, 2.0f}, 10.0f);
    auto before = buffer.window(0, 2);
    REQUIRE(before.has_value());

    const std::vector<float> more = {3.0f, 4.0f, 5.0f};
    buffer.append(more);

    REQUIRE(buffer.size() == 5);
    auto after = buffer.window(0, 2);
    REQUIRE(after.has_value());
    REQUIRE(after->samples == before->samples);
    REQUIRE(before->samples == std::vector<float>{1.0f, 2.0f});
}

} // namespace spk::eog
