/**
 * @file DirectionClassifier.hpp
 * @brief Rule-based left/right decision on a detected event window.
 *
 * A horizontal saccade to the left produces a positive deflection followed
 * by a negative one with the SpikerBox electrode montage; a saccade to the
 * right produces the opposite. The classifier compares the positions of
 * the global maximum and minimum: maximum first means left.
 */

#pragma once

#include "spk/eog/core/Error.hpp"
#include "spk/eog/core/Types.hpp"
#include "spk/eog/signal/SignalBuffer.hpp"

#include <span>

namespace spk::eog::detect {

class DirectionClassifier {
public:
    /**
     * @brief Classifies the window by the order of its extremes.
     *
     * Repeated extreme values resolve to their first occurrence.
     *
     * @return The direction, or kInvalidWindow for fewer than two samples,
     *         a constant window or a window containing NaN
     */
    [[nodiscard]] Expected<Direction> classify(std::span<const float> samples) const;

    [[nodiscard]] Expected<Direction> classify(const signal::Window &window) const
    {
        return classify(window.samples);
    }
};

} // namespace spk::eog::detect
