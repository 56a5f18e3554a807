/**
 * @file ClassifierKind.cpp
 * @brief Parsing of classifier family names.
 */

#include "spk/eog/classify/ClassifierKind.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace spk::eog::classify {

Expected<ClassifierKind> parseClassifierKind(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "knn")
        return ClassifierKind::kKnn;
    if (lower == "rfc" || lower == "forest" || lower == "random_forest")
        return ClassifierKind::kRandomForest;
    if (lower == "svm" || lower == "svc")
        return ClassifierKind::kSvm;

    return std::unexpected(
        Error::make(ErrorCode::kInvalidArgument,
            "unknown classifier '" + std::string(text) + "' (expected knn, rfc or svm)"));
}

} // namespace spk::eog::classify
