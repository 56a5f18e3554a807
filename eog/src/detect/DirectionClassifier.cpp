/**
 * @file DirectionClassifier.cpp
 * @brief Implementation of the argmax/argmin direction rule.
 */

#include "spk/eog/detect/DirectionClassifier.hpp"

#include <cmath>

namespace spk::eog::detect {

Expected<Direction> DirectionClassifier::classify(std::span<const float> samples) const
{
    if (samples.size() < 2) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidWindow, "direction needs at least two samples"));
    }

    std::size_t argMax = 0;
    std::size_t argMin = 0;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        if (std::isnan(samples[i])) {
            return std::unexpected(
                Error::make(ErrorCode::kInvalidWindow, "window contains NaN"));
        }
        if (samples[i] > samples[argMax])
            argMax = i;
        if (samples[i] < samples[argMin])
            argMin = i;
    }

    if (argMax == argMin) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidWindow, "window is constant"));
    }

    return argMax < argMin ? Direction::kLeft : Direction::kRight;
}

} // namespace spk::eog::detect
