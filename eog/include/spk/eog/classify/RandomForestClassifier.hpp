/**
 * @file RandomForestClassifier.hpp
 * @brief Bagged ensemble of fully grown CART trees.
 *
 * Each tree is fitted on a bootstrap resample and considers sqrt(K)
 * randomly drawn features per split (features constant within the node do
 * not count towards that draw). Splits minimise the weighted Gini
 * impurity; thresholds are midpoints between adjacent distinct values.
 * Prediction averages the leaf class distributions of all trees.
 *
 * Training is deterministic for a given seed.
 */

#pragma once

#include "spk/eog/classify/ClassifierBase.hpp"
#include "spk/eog/core/Constants.hpp"

#include <cstdint>
#include <random>

namespace spk::eog::classify {

class RandomForestClassifier final : public ClassifierBase {
public:
    explicit RandomForestClassifier(std::size_t treeCount = kDefaultForestTrees,
                                    std::uint64_t seed = kDefaultSeed) noexcept;

    [[nodiscard]] ClassifierKind kind() const noexcept override { return ClassifierKind::kRandomForest; }
    [[nodiscard]] std::size_t treeCount() const noexcept { return _treeCount; }

protected:
    [[nodiscard]] ExpectedVoid fit(const Eigen::MatrixXd &X, const std::vector<int> &y) override;
    [[nodiscard]] int predictIndex(const Eigen::VectorXd &x) const override;
    void writeParams(io::ByteWriter &writer) const override;
    [[nodiscard]] ExpectedVoid readParams(io::ByteReader &reader, std::size_t dimension) override;

private:
    /**
     * @brief Tree node; feature < 0 marks a leaf whose class distribution
     *        starts at Tree::values[valueOffset].
     */
    struct Node {
        std::int32_t feature = -1;
        double threshold = 0.0;
        std::int32_t left = -1;
        std::int32_t right = -1;
        std::uint32_t valueOffset = 0;
    };

    struct Tree {
        std::vector<Node> nodes;
        std::vector<double> values;
    };

    class TreeBuilder;

    std::size_t _treeCount;
    std::uint64_t _seed;
    std::vector<Tree> _trees;
};

} // namespace spk::eog::classify
