/**
 * @file ArrayReplaySource.cpp
 * @brief Implementation of the in-memory replay source.
 */

#include "spk/eog/source/ArrayReplaySource.hpp"

#include "spk/core/Log.hpp"

#include <algorithm>

namespace spk::eog::source {

ArrayReplaySource::ArrayReplaySource(std::vector<float> samples, float sampleRate, ArrayReplayConfig config)
    : _samples(std::move(samples))
    , _sampleRate(sampleRate)
    , _config(config)
{
}

ExpectedVoid ArrayReplaySource::start()
{
    if (_started) {
        return std::unexpected(
            Error::make(ErrorCode::kAlreadyRunning, "ArrayReplaySource already started"));
    }
    if (_samples.empty()) {
        return std::unexpected(
            Error::make(ErrorCode::kEmptyInput, "nothing to replay"));
    }
    _position = 0;
    _started = true;
    return {};
}

Expected<std::size_t> ArrayReplaySource::read(std::span<float> buffer)
{
    if (!_started) {
        return std::unexpected(
            Error::make(ErrorCode::kNotInitialized, "ArrayReplaySource not started"));
    }

    if (_position == _samples.size() && _config.loop) {
        core::Log::debug("source", "restarting replay");
        _position = 0;
    }

    std::size_t count = std::min(buffer.size(), _samples.size() - _position);
    if (_config.chunkSize > 0)
        count = std::min(count, _config.chunkSize);

    std::copy_n(_samples.begin() + static_cast<std::ptrdiff_t>(_position), count, buffer.begin());
    _position += count;
    return count;
}

void ArrayReplaySource::stop() noexcept
{
    _started = false;
}

SourceInfo ArrayReplaySource::info() const noexcept
{
    return SourceInfo{.name = "replay", .sampleRate = _sampleRate};
}

bool ArrayReplaySource::exhausted() const noexcept
{
    return !_config.loop && _position >= _samples.size();
}

} // namespace spk::eog::source
