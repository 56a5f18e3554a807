/**
 * @file ScanConfig.cpp
 * @brief ScanConfig::Builder implementation.
 */

#include "spk/eog/pipeline/ScanConfig.hpp"

#include "spk/eog/detect/WindowScanner.hpp"
#include "spk/eog/detect/ZeroCrossingDetector.hpp"

#include <cmath>
#include <format>

namespace spk::eog::pipeline {

ScanConfig::Builder &ScanConfig::Builder::windowSize(std::size_t samples) noexcept
{
    _windowSize = samples;
    return *this;
}

ScanConfig::Builder &ScanConfig::Builder::increment(std::size_t samples) noexcept
{
    _increment = samples;
    return *this;
}

ScanConfig::Builder &ScanConfig::Builder::thresholdCrossings(std::size_t crossings) noexcept
{
    _thresholdCrossings = crossings;
    return *this;
}

ScanConfig::Builder &ScanConfig::Builder::sampleRate(float hz) noexcept
{
    _sampleRate = hz;
    return *this;
}

ScanConfig::Builder &ScanConfig::Builder::mode(ClassificationMode mode) noexcept
{
    _mode = mode;
    return *this;
}

ScanConfig::Builder &ScanConfig::Builder::ignoreUntil(double seconds) noexcept
{
    _ignoreUntil = seconds;
    return *this;
}

Expected<ScanConfig> ScanConfig::Builder::build() const
{
    if (!(_sampleRate > 0.0f) || !std::isfinite(_sampleRate)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration,
                std::format("sample rate must be positive, got {}", _sampleRate)));
    }

    ScanConfig cfg;
    cfg._sampleRate = _sampleRate;
    cfg._mode = _mode;
    cfg._ignoreUntil = _ignoreUntil;
    cfg._windowSize = _windowSize.value_or(detect::WindowScanner::defaultWindowSize(_sampleRate));
    cfg._increment = _increment.value_or(detect::WindowScanner::defaultIncrement(cfg._windowSize));
    cfg._thresholdCrossings = _thresholdCrossings.value_or(
        detect::ZeroCrossingDetector::scaledFor(cfg._windowSize).thresholdCrossings());

    if (auto ok = cfg.validate(); !ok)
        return std::unexpected(ok.error());
    return cfg;
}

ExpectedVoid ScanConfig::validate() const
{
    if (auto ok = detect::WindowScanner::validate(_windowSize, _increment); !ok)
        return ok;
    if (_thresholdCrossings == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration, "thresholdCrossings must be positive"));
    }
    // A window of n samples has at most n - 1 crossings.
    if (_thresholdCrossings > _windowSize - 1) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration,
                std::format("thresholdCrossings {} exceeds the {} crossings a {}-sample window can hold",
                    _thresholdCrossings, _windowSize - 1, _windowSize)));
    }
    if (!(_sampleRate > 0.0f)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration, "sample rate must be positive"));
    }
    return {};
}

} // namespace spk::eog::pipeline
