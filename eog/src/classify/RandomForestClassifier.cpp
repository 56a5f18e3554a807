/**
 * @file RandomForestClassifier.cpp
 * @brief Implementation of the CART random forest.
 */

#include "spk/eog/classify/RandomForestClassifier.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace spk::eog::classify {

/**
 * @brief Grows one tree on a bootstrap sample.
 */
class RandomForestClassifier::TreeBuilder {
public:
    TreeBuilder(const Eigen::MatrixXd &X, const std::vector<int> &y, std::size_t classCount,
                std::size_t maxFeatures, std::mt19937_64 &rng)
        : _X(X), _y(y), _classCount(classCount), _maxFeatures(maxFeatures), _rng(rng)
    {
    }

    Tree build(std::vector<std::size_t> samples)
    {
        _tree = Tree{};
        grow(samples);
        return std::move(_tree);
    }

private:
    struct Split {
        std::int32_t feature = -1;
        double threshold = 0.0;
        double impurity = 0.0;
    };

    std::vector<double> distribution(const std::vector<std::size_t> &samples) const
    {
        std::vector<double> counts(_classCount, 0.0);
        for (const auto s : samples)
            counts[static_cast<std::size_t>(_y[s])] += 1.0;
        return counts;
    }

    static double gini(const std::vector<double> &counts, double total)
    {
        if (total <= 0.0)
            return 0.0;
        double sum = 0.0;
        for (const double c : counts)
            sum += (c / total) * (c / total);
        return 1.0 - sum;
    }

    std::int32_t makeLeaf(const std::vector<double> &counts, double total)
    {
        Node node;
        node.valueOffset = static_cast<std::uint32_t>(_tree.values.size());
        for (const double c : counts)
            _tree.values.push_back(c / total);
        _tree.nodes.push_back(node);
        return static_cast<std::int32_t>(_tree.nodes.size() - 1);
    }

    Split bestSplit(const std::vector<std::size_t> &samples, double parentImpurity)
    {
        const auto featureCount = static_cast<std::size_t>(_X.cols());
        std::vector<std::size_t> features(featureCount);
        std::iota(features.begin(), features.end(), std::size_t{0});
        std::shuffle(features.begin(), features.end(), _rng);

        const auto total = static_cast<double>(samples.size());
        Split best;
        best.impurity = parentImpurity;

        std::vector<std::pair<double, int>> column(samples.size());
        std::size_t visited = 0;

        for (const auto f : features) {
            if (visited >= _maxFeatures && best.feature >= 0)
                break;

            for (std::size_t i = 0; i < samples.size(); ++i)
                column[i] = {_X(static_cast<Eigen::Index>(samples[i]), static_cast<Eigen::Index>(f)), _y[samples[i]]};
            std::sort(column.begin(), column.end());

            if (column.front().first == column.back().first)
                continue;
            ++visited;

            std::vector<double> left(_classCount, 0.0);
            std::vector<double> right = distribution(samples);

            for (std::size_t i = 0; i + 1 < column.size(); ++i) {
                const auto cls = static_cast<std::size_t>(column[i].second);
                left[cls] += 1.0;
                right[cls] -= 1.0;
                if (column[i].first == column[i + 1].first)
                    continue;

                const auto nLeft = static_cast<double>(i + 1);
                const double nRight = total - nLeft;
                const double impurity = (nLeft * gini(left, nLeft) + nRight * gini(right, nRight)) / total;
                if (impurity < best.impurity) {
                    best.impurity = impurity;
                    best.feature = static_cast<std::int32_t>(f);
                    best.threshold = 0.5 * (column[i].first + column[i + 1].first);
                }
            }
        }
        return best;
    }

    std::int32_t grow(const std::vector<std::size_t> &samples)
    {
        const auto counts = distribution(samples);
        const auto total = static_cast<double>(samples.size());
        const double impurity = gini(counts, total);

        if (samples.size() < 2 || impurity <= 0.0)
            return makeLeaf(counts, total);

        const Split split = bestSplit(samples, impurity);
        if (split.feature < 0)
            return makeLeaf(counts, total);

        std::vector<std::size_t> leftSamples;
        std::vector<std::size_t> rightSamples;
        for (const auto s : samples) {
            if (_X(static_cast<Eigen::Index>(s), split.feature) <= split.threshold)
                leftSamples.push_back(s);
            else
                rightSamples.push_back(s);
        }

        _tree.nodes.push_back(Node{split.feature, split.threshold, -1, -1, 0});
        const auto self = static_cast<std::int32_t>(_tree.nodes.size() - 1);
        const std::int32_t left = grow(leftSamples);
        const std::int32_t right = grow(rightSamples);
        _tree.nodes[static_cast<std::size_t>(self)].left = left;
        _tree.nodes[static_cast<std::size_t>(self)].right = right;
        return self;
    }

    const Eigen::MatrixXd &_X;
    const std::vector<int> &_y;
    std::size_t _classCount;
    std::size_t _maxFeatures;
    std::mt19937_64 &_rng;
    Tree _tree;
};

RandomForestClassifier::RandomForestClassifier(std::size_t treeCount, std::uint64_t seed) noexcept
    : _treeCount(std::max<std::size_t>(1, treeCount))
    , _seed(seed)
{
}

ExpectedVoid RandomForestClassifier::fit(const Eigen::MatrixXd &X, const std::vector<int> &y)
{
    const auto n = static_cast<std::size_t>(X.rows());
    const auto maxFeatures = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::sqrt(static_cast<double>(X.cols()))));

    std::mt19937_64 rng(_seed);
    std::uniform_int_distribution<std::size_t> pick(0, n - 1);
    TreeBuilder builder(X, y, classCount(), maxFeatures, rng);

    std::vector<Tree> trees;
    trees.reserve(_treeCount);
    for (std::size_t t = 0; t < _treeCount; ++t) {
        std::vector<std::size_t> bootstrap(n);
        for (auto &s : bootstrap)
            s = pick(rng);
        trees.push_back(builder.build(std::move(bootstrap)));
    }

    _trees = std::move(trees);
    return {};
}

int RandomForestClassifier::predictIndex(const Eigen::VectorXd &x) const
{
    std::vector<double> votes(classCount(), 0.0);
    for (const auto &tree : _trees) {
        std::size_t idx = 0;
        while (tree.nodes[idx].feature >= 0) {
            const Node &node = tree.nodes[idx];
            idx = static_cast<std::size_t>(x(node.feature) <= node.threshold ? node.left : node.right);
        }
        const auto offset = tree.nodes[idx].valueOffset;
        for (std::size_t c = 0; c < votes.size(); ++c)
            votes[c] += tree.values[offset + c];
    }
    return static_cast<int>(std::max_element(votes.begin(), votes.end()) - votes.begin());
}

void RandomForestClassifier::writeParams(io::ByteWriter &writer) const
{
    writer.writeU64(_seed);
    writer.writeU32(static_cast<std::uint32_t>(_trees.size()));
    for (const auto &tree : _trees) {
        writer.writeU32(static_cast<std::uint32_t>(tree.nodes.size()));
        for (const auto &node : tree.nodes) {
            writer.writeI32(node.feature);
            writer.writeF64(node.threshold);
            writer.writeI32(node.left);
            writer.writeI32(node.right);
            writer.writeU32(node.valueOffset);
        }
        writer.writeU32(static_cast<std::uint32_t>(tree.values.size()));
        writer.writeF64Array(tree.values);
    }
}

ExpectedVoid RandomForestClassifier::readParams(io::ByteReader &reader, std::size_t dimension)
{
    const auto corrupt = [](const char *what) {
        return std::unexpected(Error::make(ErrorCode::kFileParseError, what));
    };

    auto seed = reader.readU64();
    if (!seed)
        return std::unexpected(seed.error());
    auto treeCount = reader.readU32();
    if (!treeCount)
        return std::unexpected(treeCount.error());
    if (*treeCount == 0)
        return corrupt("forest archive holds no trees");

    std::vector<Tree> trees(*treeCount);
    for (auto &tree : trees) {
        auto nodeCount = reader.readU32();
        if (!nodeCount)
            return std::unexpected(nodeCount.error());
        if (*nodeCount == 0)
            return corrupt("empty tree in forest archive");

        tree.nodes.resize(*nodeCount);
        for (auto &node : tree.nodes) {
            auto feature = reader.readI32();
            if (!feature)
                return std::unexpected(feature.error());
            auto threshold = reader.readF64();
            if (!threshold)
                return std::unexpected(threshold.error());
            auto left = reader.readI32();
            if (!left)
                return std::unexpected(left.error());
            auto right = reader.readI32();
            if (!right)
                return std::unexpected(right.error());
            auto offset = reader.readU32();
            if (!offset)
                return std::unexpected(offset.error());
            node = Node{*feature, *threshold, *left, *right, *offset};
        }

        auto valueCount = reader.readU32();
        if (!valueCount)
            return std::unexpected(valueCount.error());
        auto values = reader.readF64Array(*valueCount);
        if (!values)
            return std::unexpected(values.error());
        tree.values = std::move(*values);

        // Children are stored after their parent, which also rules out cycles.
        const auto nodes = static_cast<std::int32_t>(tree.nodes.size());
        for (std::int32_t i = 0; i < nodes; ++i) {
            const Node &node = tree.nodes[static_cast<std::size_t>(i)];
            if (node.feature >= 0) {
                if (static_cast<std::size_t>(node.feature) >= dimension ||
                    node.left <= i || node.left >= nodes || node.right <= i || node.right >= nodes)
                    return corrupt("invalid split node in forest archive");
            } else if (static_cast<std::size_t>(node.valueOffset) + classCount() > tree.values.size()) {
                return corrupt("leaf distribution out of range in forest archive");
            }
        }
    }

    _seed = *seed;
    _treeCount = trees.size();
    _trees = std::move(trees);
    return {};
}

} // namespace spk::eog::classify
