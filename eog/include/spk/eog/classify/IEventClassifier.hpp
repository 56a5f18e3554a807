/**
 * @file IEventClassifier.hpp
 * @brief Abstract trainable classifier from feature vectors to labels.
 *
 * Contract:
 * 1. train() fits the model; training again replaces the previous model.
 * 2. predict()/predictOne() require a trained model and vectors of the
 *    trained dimension. A mismatch fails that call only.
 * 3. serialize() produces a self-describing archive (see ModelArchive)
 *    that deserialize() on an instance of the same kind restores exactly.
 *
 * @see ClassifierFactory, ModelArchive
 */

#pragma once

#include "spk/eog/classify/ClassifierKind.hpp"
#include "spk/eog/core/Error.hpp"
#include "spk/eog/core/Types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace spk::eog::classify {

class IEventClassifier {
public:
    virtual ~IEventClassifier() = default;

    IEventClassifier(const IEventClassifier &) = delete;
    IEventClassifier &operator=(const IEventClassifier &) = delete;

    /**
     * @brief Fits the model.
     *
     * @param features One vector per sample, all of the same length
     * @param labels   One label per sample
     * @return void, or kInvalidArgument for empty/inconsistent data
     */
    [[nodiscard]] virtual ExpectedVoid train(std::span<const FeatureVector> features,
                                             std::span<const Label> labels) = 0;

    /**
     * @brief Predicts the label of one vector.
     *
     * @return The label, kNotInitialized or kDimensionMismatch
     */
    [[nodiscard]] virtual Expected<Label> predictOne(std::span<const double> feature) const = 0;

    /**
     * @brief Predicts every vector; fails on the first failing one.
     */
    [[nodiscard]] Expected<std::vector<Label>> predict(std::span<const FeatureVector> features) const;

    [[nodiscard]] virtual Expected<std::vector<std::byte>> serialize() const = 0;
    [[nodiscard]] virtual ExpectedVoid deserialize(std::span<const std::byte> archive) = 0;

    [[nodiscard]] virtual ClassifierKind kind() const noexcept = 0;

    /// Trained feature dimension (0 before training).
    [[nodiscard]] virtual std::size_t dimension() const noexcept = 0;

    [[nodiscard]] virtual bool isTrained() const noexcept = 0;

    /// Sorted distinct training labels.
    [[nodiscard]] virtual const std::vector<Label> &classes() const noexcept = 0;

protected:
    IEventClassifier() = default;
};

} // namespace spk::eog::classify
