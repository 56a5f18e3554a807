/**
 * @file TestLog.cpp
 * @brief Unit tests for the core::Log facade.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/core/Log.hpp"

#include <string>
#include <vector>

namespace spk::eog {

namespace {

class CaptureLogger final : public core::ILogger {
public:
    struct Entry {
        core::LogLevel level;
        std::string tag;
        std::string message;
    };

    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }

    std::vector<Entry> entries;
};

} // namespace

TEST_CASE("Log routes to the installed logger above the minimum level", "[core][log]")
{
    CaptureLogger capture;
    const auto previous = core::Log::minLevel();
    core::Log::setLogger(&capture);
    core::Log::setMinLevel(core::LogLevel::kWarn);

    core::Log::info("scan", "hidden");
    core::Log::warn("scan", "shown");
    core::Log::error("fatal path");

    core::Log::setLogger(nullptr);
    core::Log::setMinLevel(previous);

    REQUIRE(capture.entries.size() == 2);
    REQUIRE(capture.entries[0].level == core::LogLevel::kWarn);
    REQUIRE(capture.entries[0].tag == "scan");
    REQUIRE(capture.entries[0].message == "shown");
    REQUIRE(capture.entries[1].tag == "spk");
}

TEST_CASE("Removing the installed logger detaches it", "[core][log]")
{
    CaptureLogger capture;
    const auto previous = core::Log::minLevel();
    core::Log::setMinLevel(core::LogLevel::kDebug);

    core::Log::setLogger(&capture);
    core::Log::debug("record", "captured");
    core::Log::setLogger(nullptr);
    core::Log::fatal("record", "to stderr");

    core::Log::setMinLevel(previous);

    REQUIRE(capture.entries.size() == 1);
    REQUIRE(capture.entries[0].level == core::LogLevel::kDebug);
    REQUIRE(capture.entries[0].tag == "record");
}

TEST_CASE("parseLogLevel", "[core][log]")
{
    core::LogLevel level = core::LogLevel::kInfo;
    REQUIRE(core::parseLogLevel("debug", level));
    REQUIRE(level == core::LogLevel::kDebug);
    REQUIRE(core::parseLogLevel("error", level));
    REQUIRE(level == core::LogLevel::kError);
    REQUIRE_FALSE(core::parseLogLevel("verbose", level));
    REQUIRE(level == core::LogLevel::kError);
}

} // namespace spk::eog
