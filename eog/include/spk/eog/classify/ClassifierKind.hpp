/**
 * @file ClassifierKind.hpp
 * @brief Enumeration of the trainable classifier families.
 */

#pragma once

#include "spk/eog/core/Error.hpp"

#include <cstdint>
#include <string_view>

namespace spk::eog::classify {

enum class ClassifierKind : std::uint8_t {
    kKnn = 0,
    kRandomForest = 1,
    kSvm = 2
};

[[nodiscard]] constexpr std::string_view classifierKindName(ClassifierKind kind) noexcept
{
    switch (kind) {
        case ClassifierKind::kKnn:          return "knn";
        case ClassifierKind::kRandomForest: return "rfc";
        case ClassifierKind::kSvm:          return "svm";
    }
    return "unknown";
}

/**
 * @brief Parses "knn", "rfc" (or "forest") and "svm", case-insensitive.
 *
 * @return The kind, or kInvalidArgument
 */
[[nodiscard]] Expected<ClassifierKind> parseClassifierKind(std::string_view text);

} // namespace spk::eog::classify
