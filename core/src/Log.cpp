/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * Lines are prefixed with the seconds elapsed since the logger was
 * created, which lines them up with event times during a live scan.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#include "spk/core/Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace spk::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        static constexpr const char *kLevelNames[] = {
            "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
        };
        const auto idx = static_cast<unsigned>(level);
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - _start;
        std::lock_guard lock(_mutex);
        std::fprintf(
            stderr,
            "[%9.3f][%s][%.*s] %.*s\n",
            elapsed.count(),
            kLevelNames[idx],
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }

private:
    const std::chrono::steady_clock::time_point _start = std::chrono::steady_clock::now();
    std::mutex _mutex;
};

StderrLogger           gDefaultLogger;
std::atomic<ILogger *> gActiveLogger{&gDefaultLogger};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

} // anonymous namespace

void Log::setLogger(ILogger *logger)  { gActiveLogger = logger ? logger : &gDefaultLogger; }
void Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel()              { return gMinLevel; }

static void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel.load())
        return;
    gActiveLogger.load()->write(level, tag, msg);
}

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

bool parseLogLevel(std::string_view text, LogLevel &out) noexcept
{
    if (text == "debug") { out = LogLevel::kDebug; return true; }
    if (text == "info")  { out = LogLevel::kInfo;  return true; }
    if (text == "warn")  { out = LogLevel::kWarn;  return true; }
    if (text == "error") { out = LogLevel::kError; return true; }
    if (text == "fatal") { out = LogLevel::kFatal; return true; }
    return false;
}

} // namespace spk::core
