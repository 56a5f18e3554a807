/**
 * @file ZeroCrossingDetector.cpp
 * @brief Implementation of the zero-crossing event detector.
 */

#include "spk/eog/detect/ZeroCrossingDetector.hpp"

#include <algorithm>
#include <cmath>

namespace spk::eog::detect {

ZeroCrossingDetector::ZeroCrossingDetector(std::size_t thresholdCrossings) noexcept
    : _thresholdCrossings(thresholdCrossings)
{
}

Expected<ZeroCrossingDetector> ZeroCrossingDetector::create(std::size_t thresholdCrossings)
{
    if (thresholdCrossings == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration, "thresholdCrossings must be positive"));
    }
    return ZeroCrossingDetector(thresholdCrossings);
}

ZeroCrossingDetector ZeroCrossingDetector::scaledFor(std::size_t windowSize) noexcept
{
    const auto reference = static_cast<double>(kReferenceSampleRate);
    const double scaled = static_cast<double>(kDefaultThresholdCrossings) *
                          static_cast<double>(windowSize) / reference;
    return ZeroCrossingDetector(std::max<std::size_t>(1, static_cast<std::size_t>(std::lround(scaled))));
}

std::size_t ZeroCrossingDetector::countZeroCrossings(std::span<const float> samples) noexcept
{
    std::size_t count = 0;
    for (std::size_t i = 1; i < samples.size(); ++i) {
        const float a = samples[i - 1];
        const float b = samples[i];
        if ((a <= 0.0f && b >= 0.0f) || (a >= 0.0f && b <= 0.0f))
            ++count;
    }
    return count;
}

bool ZeroCrossingDetector::detect(std::span<const float> samples) const
{
    return countZeroCrossings(samples) < _thresholdCrossings;
}

std::string_view ZeroCrossingDetector::name() const noexcept
{
    return "ZeroCrossingDetector";
}

} // namespace spk::eog::detect
