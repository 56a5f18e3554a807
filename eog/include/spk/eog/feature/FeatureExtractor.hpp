/**
 * @file FeatureExtractor.hpp
 * @brief Maps a window to its catch22 feature vector.
 *
 * The window is z-scored before the features are computed, so the vector
 * does not depend on the amplitude scale or offset of the recording.
 *
 * @see Catch22.hpp
 */

#pragma once

#include "spk/eog/core/Constants.hpp"
#include "spk/eog/core/Error.hpp"
#include "spk/eog/core/Types.hpp"

#include <array>
#include <span>
#include <string_view>

namespace spk::eog::feature {

class FeatureExtractor {
public:
    /**
     * @brief Computes the 22 features in canonical catch22 order.
     *
     * @return The feature vector, or
     *         - kInsufficientData for fewer than kMinFeatureSamples samples
     *           or when a feature is undefined (NaN) for this window
     *         - kInvalidWindow for a constant window or a non-finite sample
     */
    [[nodiscard]] Expected<FeatureVector> extract(std::span<const double> samples) const;

    [[nodiscard]] Expected<FeatureVector> extract(std::span<const float> samples) const;

    /// Feature names in output order.
    [[nodiscard]] static const std::array<std::string_view, kFeatureCount> &featureNames() noexcept;

    [[nodiscard]] static constexpr std::size_t dimension() noexcept { return kFeatureCount; }
};

} // namespace spk::eog::feature
