/**
 * @file ClassifierBase.hpp
 * @brief Shared validation, label encoding and archiving for classifiers.
 *
 * Concrete classifiers work on an Eigen design matrix and integer class
 * indices into classes(); this base turns the public label-based API into
 * that form and handles the common archive header.
 */

#pragma once

#include "spk/eog/classify/IEventClassifier.hpp"
#include "spk/eog/io/ByteStream.hpp"

#include <Eigen/Dense>

namespace spk::eog::classify {

class ClassifierBase : public IEventClassifier {
public:
    [[nodiscard]] ExpectedVoid train(std::span<const FeatureVector> features,
                                     std::span<const Label> labels) final;
    [[nodiscard]] Expected<Label> predictOne(std::span<const double> feature) const final;
    [[nodiscard]] Expected<std::vector<std::byte>> serialize() const final;
    [[nodiscard]] ExpectedVoid deserialize(std::span<const std::byte> archive) final;

    [[nodiscard]] std::size_t dimension() const noexcept final { return _dimension; }
    [[nodiscard]] bool isTrained() const noexcept final { return _trained; }
    [[nodiscard]] const std::vector<Label> &classes() const noexcept final { return _classes; }

protected:
    ClassifierBase() = default;

    /**
     * @brief Fits the model on validated data.
     *
     * @param X One row per sample
     * @param y Class index per sample, in [0, classes().size())
     */
    [[nodiscard]] virtual ExpectedVoid fit(const Eigen::MatrixXd &X, const std::vector<int> &y) = 0;

    /// Class index for a validated input row.
    [[nodiscard]] virtual int predictIndex(const Eigen::VectorXd &x) const = 0;

    virtual void writeParams(io::ByteWriter &writer) const = 0;

    /**
     * @brief Restores the parameters written by writeParams().
     *
     * Must leave the model untouched on failure.
     *
     * @param dimension Feature dimension recorded in the archive header
     */
    [[nodiscard]] virtual ExpectedVoid readParams(io::ByteReader &reader, std::size_t dimension) = 0;

    [[nodiscard]] std::size_t classCount() const noexcept { return _classes.size(); }

private:
    std::vector<Label> _classes;
    std::size_t _dimension = 0;
    bool _trained = false;
};

/// Writes rows, cols and the values of @p m in row-major order.
void writeMatrix(io::ByteWriter &writer, const Eigen::MatrixXd &m);

[[nodiscard]] Expected<Eigen::MatrixXd> readMatrix(io::ByteReader &reader);

} // namespace spk::eog::classify
