/**
 * @file ScanConfig.hpp
 * @brief Immutable scan configuration (Builder pattern).
 *
 * Unset sizes resolve from the sample rate when built: one second of
 * samples per window, a tenth of the window per non-event stride, and the
 * default zero-crossing threshold scaled to the window length. A value set
 * explicitly is never replaced: zero fails validation, as does a threshold
 * above windowSize - 1 (every window would be an event).
 *
 * @code
 *   auto config = ScanConfig::Builder{}
 *       .sampleRate(500.0f)
 *       .windowSize(500)
 *       .increment(50)
 *       .build();
 * @endcode
 */

#pragma once

#include "spk/eog/core/Constants.hpp"
#include "spk/eog/core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace spk::eog::pipeline {

/**
 * @brief How a detected window is labelled.
 */
enum class ClassificationMode : std::uint8_t {
    /// Rule-based left/right from the order of the extremes.
    kDirection,
    /// catch22 features fed to a trained classifier.
    kModel
};

[[nodiscard]] constexpr std::string_view classificationModeName(ClassificationMode mode) noexcept
{
    switch (mode) {
        case ClassificationMode::kDirection: return "direction";
        case ClassificationMode::kModel:     return "model";
    }
    return "unknown";
}

class ScanConfig {
public:
    class Builder {
    public:
        Builder &windowSize(std::size_t samples) noexcept;
        Builder &increment(std::size_t samples) noexcept;
        Builder &thresholdCrossings(std::size_t crossings) noexcept;
        Builder &sampleRate(float hz) noexcept;
        Builder &mode(ClassificationMode mode) noexcept;
        /// Events starting at or before this time (s) are dropped; < 0 disables.
        Builder &ignoreUntil(double seconds) noexcept;

        /**
         * @brief Resolves the unset values and validates the result.
         *
         * @return The configuration, or kInvalidConfiguration
         */
        [[nodiscard]] Expected<ScanConfig> build() const;

    private:
        std::optional<std::size_t> _windowSize;
        std::optional<std::size_t> _increment;
        std::optional<std::size_t> _thresholdCrossings;
        float _sampleRate{kReferenceSampleRate};
        ClassificationMode _mode{ClassificationMode::kDirection};
        double _ignoreUntil{-1.0};
    };

    [[nodiscard]] std::size_t windowSize() const noexcept { return _windowSize; }
    [[nodiscard]] std::size_t increment() const noexcept { return _increment; }
    [[nodiscard]] std::size_t thresholdCrossings() const noexcept { return _thresholdCrossings; }
    [[nodiscard]] float sampleRate() const noexcept { return _sampleRate; }
    [[nodiscard]] ClassificationMode mode() const noexcept { return _mode; }
    [[nodiscard]] double ignoreUntil() const noexcept { return _ignoreUntil; }

    [[nodiscard]] ExpectedVoid validate() const;

private:
    ScanConfig() = default;

    std::size_t _windowSize{0};
    std::size_t _increment{0};
    std::size_t _thresholdCrossings{0};
    float _sampleRate{kReferenceSampleRate};
    ClassificationMode _mode{ClassificationMode::kDirection};
    double _ignoreUntil{-1.0};
};

} // namespace spk::eog::pipeline
