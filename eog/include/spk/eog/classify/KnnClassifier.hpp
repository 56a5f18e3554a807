/**
 * @file KnnClassifier.hpp
 * @brief k-nearest-neighbours classifier (Euclidean, majority vote).
 *
 * Ties in the vote go to the tied class whose member is nearest to the
 * query. With fewer than k training samples all of them vote.
 */

#pragma once

#include "spk/eog/classify/ClassifierBase.hpp"
#include "spk/eog/core/Constants.hpp"

namespace spk::eog::classify {

class KnnClassifier final : public ClassifierBase {
public:
    explicit KnnClassifier(std::size_t neighbours = kDefaultKnnNeighbours) noexcept;

    [[nodiscard]] ClassifierKind kind() const noexcept override { return ClassifierKind::kKnn; }
    [[nodiscard]] std::size_t neighbours() const noexcept { return _neighbours; }

protected:
    [[nodiscard]] ExpectedVoid fit(const Eigen::MatrixXd &X, const std::vector<int> &y) override;
    [[nodiscard]] int predictIndex(const Eigen::VectorXd &x) const override;
    void writeParams(io::ByteWriter &writer) const override;
    [[nodiscard]] ExpectedVoid readParams(io::ByteReader &reader, std::size_t dimension) override;

private:
    std::size_t _neighbours;
    Eigen::MatrixXd _samples;
    std::vector<int> _targets;
};

} // namespace spk::eog::classify
