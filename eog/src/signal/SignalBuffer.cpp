/**
 * @file SignalBuffer.cpp
 * @brief Implementation of SignalBuffer and Window.
 */

#include "spk/eog/signal/SignalBuffer.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace spk::eog::signal {

double Window::startTime() const noexcept
{
    return sampleRate > 0.0f ? static_cast<double>(startIndex) / sampleRate : 0.0;
}

double Window::duration() const noexcept
{
    return sampleRate > 0.0f ? static_cast<double>(samples.size()) / sampleRate : 0.0;
}

std::vector<double> Window::localTime() const
{
    std::vector<double> t(samples.size());
    for (std::size_t i = 0; i < t.size(); ++i)
        t[i] = sampleRate > 0.0f ? static_cast<double>(i) / sampleRate : 0.0;
    return t;
}

SignalBuffer::SignalBuffer(std::vector<float> samples, float sampleRate)
    : _samples(std::move(samples))
    , _sampleRate(sampleRate)
{
}

Expected<SignalBuffer> SignalBuffer::create(std::vector<float> samples, float sampleRate)
{
    if (!(sampleRate > 0.0f) || !std::isfinite(sampleRate)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument,
                std::format("sample rate must be positive, got {}", sampleRate)));
    }
    return SignalBuffer(std::move(samples), sampleRate);
}

double SignalBuffer::duration() const noexcept
{
    return timeAt(_samples.size());
}

double SignalBuffer::timeAt(std::size_t index) const noexcept
{
    return _sampleRate > 0.0f ? static_cast<double>(index) / _sampleRate : 0.0;
}

std::size_t SignalBuffer::indexAt(double seconds) const noexcept
{
    if (seconds <= 0.0 || _sampleRate <= 0.0f)
        return 0;
    const auto idx = static_cast<std::size_t>(std::ceil(seconds * _sampleRate - 1e-9));
    return std::min(idx, _samples.size());
}

Expected<std::span<const float>> SignalBuffer::view(std::size_t start, std::size_t length) const
{
    if (length == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidWindow, "window length must be at least one sample"));
    }
    if (start > _samples.size() || length > _samples.size() - start) {
        return std::unexpected(
            Error::make(ErrorCode::kOutOfRange,
                std::format("window [{}, {}) exceeds signal of {} samples",
                    start, start + length, _samples.size())));
    }
    return std::span<const float>(_samples).subspan(start, length);
}

Expected<Window> SignalBuffer::window(std::size_t start, std::size_t length) const
{
    auto range = view(start, length);
    if (!range)
        return std::unexpected(range.error());

    return Window{
        .startIndex = start,
        .samples = std::vector<float>(range->begin(), range->end()),
        .sampleRate = _sampleRate
    };
}

void SignalBuffer::append(std::span<const float> samples)
{
    _samples.insert(_samples.end(), samples.begin(), samples.end());
}

} // namespace spk::eog::signal
