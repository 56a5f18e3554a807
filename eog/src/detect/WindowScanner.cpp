/**
 * @file WindowScanner.cpp
 * @brief Implementation of the detection-driven sliding-window scan.
 */

#include "spk/eog/detect/WindowScanner.hpp"

#include "spk/eog/core/Constants.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace spk::eog::detect {

WindowScanner::WindowScanner(const signal::SignalBuffer &buffer, const IEventDetector &detector,
                             std::size_t windowSize, std::size_t increment) noexcept
    : _buffer(&buffer)
    , _detector(&detector)
    , _windowSize(windowSize)
    , _increment(increment)
{
}

ExpectedVoid WindowScanner::validate(std::size_t windowSize, std::size_t increment)
{
    if (windowSize == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration, "windowSize must be positive"));
    }
    if (increment == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration, "increment must be positive"));
    }
    if (increment >= windowSize) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration,
                std::format("increment ({}) must be smaller than windowSize ({})", increment, windowSize)));
    }
    return {};
}

Expected<WindowScanner> WindowScanner::create(
    const signal::SignalBuffer &buffer,
    const IEventDetector &detector,
    std::size_t windowSize,
    std::size_t increment)
{
    if (auto valid = validate(windowSize, increment); !valid)
        return std::unexpected(valid.error());

    return WindowScanner(buffer, detector, windowSize, increment);
}

std::size_t WindowScanner::defaultWindowSize(float sampleRate) noexcept
{
    if (!(sampleRate > 0.0f))
        return 1;
    return std::max<std::size_t>(1, static_cast<std::size_t>(std::lround(sampleRate)));
}

std::size_t WindowScanner::defaultIncrement(std::size_t windowSize) noexcept
{
    return std::max<std::size_t>(1, windowSize / kDefaultIncrementDivisor);
}

std::optional<ScanStep> WindowScanner::next()
{
    if (_cursor + _windowSize > _buffer->size())
        return std::nullopt;

    auto window = _buffer->window(_cursor, _windowSize);
    if (!window)
        return std::nullopt;

    ScanStep step{std::move(*window), false};
    step.detected = _detector->detect(step.window);
    _cursor += step.detected ? _windowSize : _increment;
    return step;
}

std::vector<ScanStep> WindowScanner::scanAll()
{
    std::vector<ScanStep> steps;
    while (auto step = next())
        steps.push_back(std::move(*step));
    return steps;
}

} // namespace spk::eog::detect
