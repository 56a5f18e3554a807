/**
 * @file Statistics.hpp
 * @brief Basic statistical utilities on sample sequences.
 *
 * Pure functions used by the snipper (amplitude normalisation) and the
 * feature extractor (finiteness check, z-scoring).
 */

#pragma once

#include "spk/eog/core/Error.hpp"

#include <span>
#include <vector>

namespace spk::eog::math {

/**
 * @brief Pure-function statistical utilities.
 */
class Statistics {
public:
    Statistics() = delete;

    [[nodiscard]] static double mean(std::span<const double> data) noexcept;

    /// Sample (n-1) standard deviation, 0 for fewer than two values.
    [[nodiscard]] static double sampleStdDev(std::span<const double> data) noexcept;

    /**
     * @brief Returns (x - mean) / stdDev (sample standard deviation).
     *
     * @return The scaled series, or kInvalidWindow for a constant input
     */
    [[nodiscard]] static Expected<std::vector<double>> zScore(std::span<const double> data);

    /**
     * @brief Centres on the mean and scales so that max |x| == 1.
     *
     * This is the normalisation applied to every stored snippet.
     *
     * @return The normalised series, or kInvalidWindow for empty/flat input
     */
    [[nodiscard]] static Expected<std::vector<double>> normaliseAmplitude(std::span<const double> data);

    /// Float overload of normaliseAmplitude().
    [[nodiscard]] static Expected<std::vector<double>> normaliseAmplitude(std::span<const float> data);

    /// True when every value is finite.
    [[nodiscard]] static bool allFinite(std::span<const double> data) noexcept;
};

} // namespace spk::eog::math
