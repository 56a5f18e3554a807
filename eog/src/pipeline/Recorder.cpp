/**
 * @file Recorder.cpp
 * @brief Implementation of the live capture loop.
 */

#include "spk/eog/pipeline/Recorder.hpp"

#include "spk/core/Log.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <limits>
#include <thread>
#include <vector>

namespace spk::eog::pipeline {

namespace {

constexpr std::size_t kRecordReadChunk = 4096;
constexpr auto kRecordIdleSleep = std::chrono::milliseconds(5);

} // anonymous namespace

Expected<std::size_t> samplesForDuration(double seconds, float sampleRate)
{
    if (!std::isfinite(seconds) || !(seconds > 0.0) || !std::isfinite(sampleRate) || !(sampleRate > 0.0f)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument,
                std::format("cannot record {} s at {} Hz", seconds, sampleRate)));
    }

    const double count = std::ceil(seconds * static_cast<double>(sampleRate));
    if (count >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument, std::format("{} s is too long to record", seconds)));
    }
    return static_cast<std::size_t>(count);
}

Expected<RecordReport> recordSource(source::ISource &source, std::size_t sampleCount, std::stop_token stopToken)
{
    if (sampleCount == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument, "nothing to record: sample count is 0"));
    }

    const auto info = source.info();
    auto buffer = signal::SignalBuffer::create({}, info.sampleRate);
    if (!buffer)
        return std::unexpected(buffer.error());

    if (auto started = source.start(); !started)
        return std::unexpected(started.error());
    core::Log::info("record", std::format("recording {} samples from {} at {} Hz",
        sampleCount, info.name, info.sampleRate));

    RecordReport report;
    std::vector<float> chunk(std::min(kRecordReadChunk, sampleCount));
    while (buffer->size() < sampleCount) {
        if (stopToken.stop_requested()) {
            report.cancelled = true;
            break;
        }

        const std::size_t wanted = std::min(chunk.size(), sampleCount - buffer->size());
        auto count = source.read(std::span<float>(chunk.data(), wanted));
        if (!count) {
            source.stop();
            return std::unexpected(count.error());
        }

        if (*count > 0) {
            buffer->append(std::span<const float>(chunk.data(), *count));
        } else if (source.exhausted()) {
            report.exhausted = true;
            break;
        } else {
            std::this_thread::sleep_for(kRecordIdleSleep);
        }
    }

    source.stop();
    core::Log::info("record", std::format("captured {} of {} samples{}", buffer->size(), sampleCount,
        report.cancelled ? " (interrupted)" : report.exhausted ? " (source ran dry)" : ""));

    report.signal = std::move(*buffer);
    return report;
}

} // namespace spk::eog::pipeline
