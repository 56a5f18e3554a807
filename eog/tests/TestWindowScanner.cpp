/**
 * @file TestWindowScanner.cpp
 * @brief Unit tests for detect::WindowScanner.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/detect/WindowScanner.hpp"
#include "spk/eog/detect/ZeroCrossingDetector.hpp"

#include <numeric>
#include <set>
#include <vector>

namespace spk::eog {

using namespace eog::detect;
using signal::SignalBuffer;

namespace {

/// Fires when the first sample of the window is in the set. Samples hold their index.
class IndexDetector final : public IEventDetector {
public:
    explicit IndexDetector(std::set<std::size_t> starts) : _starts(std::move(starts)) {}

    using IEventDetector::detect;
    bool detect(std::span<const float> samples) const override
    {
        return !samples.empty() && _starts.contains(static_cast<std::size_t>(samples.front()));
    }
    std::string_view name() const noexcept override { return "IndexDetector"; }

private:
    std::set<std::size_t> _starts;
};

SignalBuffer ramp(std::size_t n)
{
    std::vector<float> s(n);
    std::iota(s.begin(), s.end(), 0.0f);
    return SignalBuffer(std::move(s), 100.0f);
}

} // namespace

TEST_CASE("WindowScanner parameter validation", "[detect][scanner]")
{
    const auto buffer = ramp(100);
    const ZeroCrossingDetector detector;

    REQUIRE(WindowScanner::create(buffer, detector, 0, 1).error().code == ErrorCode::kInvalidConfiguration);
    REQUIRE(WindowScanner::create(buffer, detector, 10, 0).error().code == ErrorCode::kInvalidConfiguration);
    REQUIRE(WindowScanner::create(buffer, detector, 10, 10).error().code == ErrorCode::kInvalidConfiguration);
    REQUIRE(WindowScanner::create(buffer, detector, 10, 9).has_value());
}

TEST_CASE("WindowScanner defaults", "[detect][scanner]")
{
    REQUIRE(WindowScanner::defaultWindowSize(500.0f) == 500);
    REQUIRE(WindowScanner::defaultWindowSize(10000.0f) == 10000);
    REQUIRE(WindowScanner::defaultWindowSize(0.0f) == 1);
    REQUIRE(WindowScanner::defaultIncrement(500) == 50);
    REQUIRE(WindowScanner::defaultIncrement(5) == 1);
}

TEST_CASE("WindowScanner stride without events", "[detect][scanner]")
{
    const auto buffer = ramp(100);
    const IndexDetector detector({});
    auto scanner = WindowScanner::create(buffer, detector, 20, 5);
    REQUIRE(scanner.has_value());

    const auto steps = scanner->scanAll();
    REQUIRE(steps.size() == 17);

    for (std::size_t i = 0; i < steps.size(); ++i) {
        REQUIRE(steps[i].window.startIndex == i * 5);
        REQUIRE(steps[i].window.length() == 20);
        REQUIRE(steps[i].window.startIndex + 20 <= buffer.size());
        REQUIRE_FALSE(steps[i].detected);
    }
}

TEST_CASE("WindowScanner jumps a full window after a detection", "[detect][scanner]")
{
    const auto buffer = ramp(100);
    const IndexDetector detector({10});
    auto scanner = WindowScanner::create(buffer, detector, 20, 5);
    REQUIRE(scanner.has_value());

    const auto steps = scanner->scanAll();

    std::vector<std::size_t> starts;
    for (const auto &step : steps)
        starts.push_back(step.window.startIndex);

    REQUIRE(starts == std::vector<std::size_t>{0, 5, 10, 30, 35, 40, 45, 50, 55, 60, 65, 70, 75, 80});
    REQUIRE(steps[2].detected);

    for (std::size_t i = 1; i < starts.size(); ++i)
        REQUIRE(starts[i] > starts[i - 1]);
}

TEST_CASE("WindowScanner on a signal shorter than the window", "[detect][scanner]")
{
    const auto buffer = ramp(19);
    const IndexDetector detector({0});
    auto scanner = WindowScanner::create(buffer, detector, 20, 5);
    REQUIRE(scanner.has_value());
    REQUIRE(scanner->scanAll().empty());
    REQUIRE(scanner->cursor() == 0);
}

TEST_CASE("WindowScanner resumes after append", "[detect][scanner]")
{
    auto buffer = ramp(30);
    const IndexDetector detector({});
    auto scanner = WindowScanner::create(buffer, detector, 20, 5);
    REQUIRE(scanner.has_value());

    REQUIRE(scanner->scanAll().size() == 3);
    REQUIRE_FALSE(scanner->next().has_value());

    std::vector<float> more(10);
    std::iota(more.begin(), more.end(), 30.0f);
    buffer.append(more);

    const auto steps = scanner->scanAll();
    REQUIRE(steps.size() == 2);
    REQUIRE(steps[0].window.startIndex == 15);
    REQUIRE(steps[1].window.startIndex == 20);

    scanner->reset();
    REQUIRE(scanner->cursor() == 0);
    REQUIRE(scanner->scanAll().size() == 5);
}

} // namespace spk::eog
