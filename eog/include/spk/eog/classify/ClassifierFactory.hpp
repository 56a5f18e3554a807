/**
 * @file ClassifierFactory.hpp
 * @brief Creates untrained classifiers by kind.
 */

#pragma once

#include "spk/eog/classify/IEventClassifier.hpp"
#include "spk/eog/core/Constants.hpp"

#include <cstdint>
#include <memory>

namespace spk::eog::classify {

/**
 * @code
 *   auto model = ClassifierFactory::create(ClassifierKind::kRandomForest, 7);
 *   auto fitted = model->train(features, labels);
 * @endcode
 */
class ClassifierFactory {
public:
    ClassifierFactory() = delete;

    /**
     * @brief Builds an untrained classifier with default hyper-parameters.
     *
     * @param kind Classifier family
     * @param seed Seed for the randomised families (ignored by KNN)
     */
    [[nodiscard]] static std::unique_ptr<IEventClassifier> create(ClassifierKind kind,
                                                                  std::uint64_t seed = kDefaultSeed);
};

} // namespace spk::eog::classify
