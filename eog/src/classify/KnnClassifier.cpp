/**
 * @file KnnClassifier.cpp
 * @brief Implementation of the k-nearest-neighbours classifier.
 */

#include "spk/eog/classify/KnnClassifier.hpp"

#include <algorithm>
#include <numeric>

namespace spk::eog::classify {

KnnClassifier::KnnClassifier(std::size_t neighbours) noexcept
    : _neighbours(std::max<std::size_t>(1, neighbours))
{
}

ExpectedVoid KnnClassifier::fit(const Eigen::MatrixXd &X, const std::vector<int> &y)
{
    _samples = X;
    _targets = y;
    return {};
}

int KnnClassifier::predictIndex(const Eigen::VectorXd &x) const
{
    const auto n = static_cast<std::size_t>(_samples.rows());
    const Eigen::VectorXd distances = (_samples.rowwise() - x.transpose()).rowwise().squaredNorm();

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    const std::size_t k = std::min(_neighbours, n);
    std::partial_sort(order.begin(), order.begin() + static_cast<long>(k), order.end(),
        [&distances](std::size_t a, std::size_t b) {
            const auto da = distances(static_cast<Eigen::Index>(a));
            const auto db = distances(static_cast<Eigen::Index>(b));
            return da < db || (da == db && a < b);
        });

    std::vector<std::size_t> votes(classCount(), 0);
    for (std::size_t i = 0; i < k; ++i)
        ++votes[static_cast<std::size_t>(_targets[order[i]])];

    const std::size_t best = *std::max_element(votes.begin(), votes.end());
    // Neighbours are in distance order: the first with a winning class decides.
    for (std::size_t i = 0; i < k; ++i) {
        const int cls = _targets[order[i]];
        if (votes[static_cast<std::size_t>(cls)] == best)
            return cls;
    }
    return _targets[order[0]];
}

void KnnClassifier::writeParams(io::ByteWriter &writer) const
{
    writer.writeU32(static_cast<std::uint32_t>(_neighbours));
    writeMatrix(writer, _samples);
    for (const int t : _targets)
        writer.writeI32(t);
}

ExpectedVoid KnnClassifier::readParams(io::ByteReader &reader, std::size_t dimension)
{
    auto neighbours = reader.readU32();
    if (!neighbours)
        return std::unexpected(neighbours.error());

    auto samples = readMatrix(reader);
    if (!samples)
        return std::unexpected(samples.error());

    std::vector<int> targets(static_cast<std::size_t>(samples->rows()));
    for (auto &t : targets) {
        auto value = reader.readI32();
        if (!value)
            return std::unexpected(value.error());
        if (*value < 0 || static_cast<std::size_t>(*value) >= classCount()) {
            return std::unexpected(
                Error::make(ErrorCode::kFileParseError, "class index out of range in KNN archive"));
        }
        t = *value;
    }

    if (*neighbours == 0 || samples->rows() == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError, "empty KNN archive"));
    }
    if (static_cast<std::size_t>(samples->cols()) != dimension) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError, "KNN sample width does not match the header"));
    }

    _neighbours = *neighbours;
    _samples = std::move(*samples);
    _targets = std::move(targets);
    return {};
}

} // namespace spk::eog::classify
