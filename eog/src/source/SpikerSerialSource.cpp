/**
 * @file SpikerSerialSource.cpp
 * @brief Implementation of the SpikerBox serial acquisition source.
 */

#include "spk/eog/source/SpikerSerialSource.hpp"

#include "spk/core/Log.hpp"

#include <array>
#include <format>
#include <vector>

namespace spk::eog::source {

SpikerSerialSource::SpikerSerialSource(SpikerSerialConfig config)
    : _config(std::move(config))
    , _decoder(_config.offset)
{
}

SpikerSerialSource::~SpikerSerialSource()
{
    stop();
}

ExpectedVoid SpikerSerialSource::start()
{
    if (_started) {
        return std::unexpected(
            Error::make(ErrorCode::kAlreadyRunning, "SpikerSerialSource already started"));
    }

    SerialConfig serialCfg{
        .portPath = _config.port,
        .baudRate = _config.baudRate,
        .vmin = 0,
        .vtime = 1
    };

    if (auto result = _serial.open(serialCfg); !result)
        return std::unexpected(result.error());

    _decoder.reset();
    {
        std::scoped_lock lock(_failureMutex);
        _failure.reset();
    }
    _started = true;
    _worker = std::jthread([this](std::stop_token st) { workerLoop(st); });

    core::Log::info("serial", std::format("streaming from {} at {} baud", _config.port, _config.baudRate));
    return {};
}

Expected<std::size_t> SpikerSerialSource::read(std::span<float> buffer)
{
    if (!_started) {
        return std::unexpected(
            Error::make(ErrorCode::kNotInitialized, "SpikerSerialSource not started"));
    }
    if (const std::size_t count = _ring.popBulk(buffer); count > 0)
        return count;

    std::scoped_lock lock(_failureMutex);
    if (!_failure)
        return std::size_t{0};
    // The worker has exited: whatever it pushed before failing is visible now.
    if (const std::size_t count = _ring.popBulk(buffer); count > 0)
        return count;
    return std::unexpected(*_failure);
}

void SpikerSerialSource::stop() noexcept
{
    if (!_started)
        return;

    _worker.request_stop();
    if (_worker.joinable())
        _worker.join();
    _serial.close();

    if (const auto lost = droppedSamples(); lost > 0)
        core::Log::warn("serial", std::format("{} samples dropped (ring full)", lost));

    _started = false;
}

SourceInfo SpikerSerialSource::info() const noexcept
{
    return SourceInfo{
        .name = "SpikerBox (" + _config.port + ")",
        .sampleRate = _config.sampleRate
    };
}

void SpikerSerialSource::workerLoop(std::stop_token stopToken)
{
    std::array<std::uint8_t, kSpikerReadChunk> bytes{};
    std::vector<float> samples;
    samples.reserve(kSpikerReadChunk / 2 + 1);

    while (!stopToken.stop_requested()) {
        auto result = _serial.read(bytes);
        if (!result) {
            core::Log::error("serial", std::format("{}: {}", _config.port, result.error().message));
            std::scoped_lock lock(_failureMutex);
            _failure = result.error();
            return;
        }
        if (*result == 0)
            continue;

        samples.clear();
        _decoder.decode(std::span<const std::uint8_t>(bytes.data(), *result), samples);

        const std::size_t pushed = _ring.pushBulk(samples);
        if (pushed < samples.size())
            _dropped.fetch_add(samples.size() - pushed, std::memory_order_relaxed);
    }
}

} // namespace spk::eog::source
