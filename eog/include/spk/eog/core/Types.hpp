/**
 * @file Types.hpp
 * @brief Vocabulary types for the EOG event pipeline.
 *
 * Labels are plain strings so that trainable classifiers can learn any
 * tag found in the snippet corpus. The baseline label set is exposed as
 * constants; the rule-based direction classifier works on its own closed
 * Direction enum.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace spk::eog {

// ─── Labels ──────────────────────────────────────────────────────────────────

using Label = std::string;

namespace label {

inline constexpr std::string_view kLeft  = "left";
inline constexpr std::string_view kRight = "right";
inline constexpr std::string_view kBlink = "blink";
inline constexpr std::string_view kNone  = "none";
/// Tag used by the snippet corpus for windows that hold no event.
inline constexpr std::string_view kNoise = "noise";

} // namespace label

// ─── Direction ───────────────────────────────────────────────────────────────

/**
 * @brief Output of the rule-based direction classifier.
 */
enum class Direction : std::uint8_t {
    kLeft,
    kRight
};

[[nodiscard]] constexpr std::string_view directionName(Direction dir) noexcept
{
    switch (dir) {
        case Direction::kLeft:  return label::kLeft;
        case Direction::kRight: return label::kRight;
    }
    return label::kNone;
}

// ─── Features ────────────────────────────────────────────────────────────────

/**
 * @brief Fixed-length numeric summary of a window (kFeatureCount entries).
 */
using FeatureVector = std::vector<double>;

} // namespace spk::eog
