/**
 * @file ZeroCrossingDetector.hpp
 * @brief Event detector gated on the number of sign changes in a window.
 *
 * Background EEG/EOG noise oscillates around zero and crosses it often;
 * a slow eye movement swamps it and the crossing count drops. A window is
 * an event when it has fewer than thresholdCrossings crossings.
 *
 * The threshold depends on the electrode placement, the amplifier gain and
 * the noise floor of the session. It is configuration: recalibrate it per
 * recording session. Baseline drift pushes the whole window off zero and
 * will read as an event.
 */

#pragma once

#include "spk/eog/core/Constants.hpp"
#include "spk/eog/core/Error.hpp"
#include "spk/eog/detect/IEventDetector.hpp"

#include <cstddef>

namespace spk::eog::detect {

class ZeroCrossingDetector final : public IEventDetector {
public:
    explicit ZeroCrossingDetector(std::size_t thresholdCrossings = kDefaultThresholdCrossings) noexcept;

    /**
     * @brief Validating factory.
     *
     * @return The detector, or kInvalidConfiguration for a zero threshold
     */
    [[nodiscard]] static Expected<ZeroCrossingDetector> create(std::size_t thresholdCrossings);

    /**
     * @brief Detector whose threshold is the default one scaled from the
     *        reference window (one second at 500 Hz) to @p windowSize.
     */
    [[nodiscard]] static ZeroCrossingDetector scaledFor(std::size_t windowSize) noexcept;

    /**
     * @brief Counts adjacent pairs (s[i], s[i+1]) with s[i] * s[i+1] <= 0.
     *
     * Pairs touching zero count. Evaluated on signs so that the result does
     * not depend on the amplitude scale.
     */
    [[nodiscard]] static std::size_t countZeroCrossings(std::span<const float> samples) noexcept;

    using IEventDetector::detect;
    [[nodiscard]] bool detect(std::span<const float> samples) const override;
    [[nodiscard]] std::string_view name() const noexcept override;

    [[nodiscard]] std::size_t thresholdCrossings() const noexcept { return _thresholdCrossings; }

private:
    std::size_t _thresholdCrossings;
};

} // namespace spk::eog::detect
