/**
 * @file ClassifierBase.cpp
 * @brief Implementation of the shared classifier plumbing.
 */

#include "spk/eog/classify/ClassifierBase.hpp"

#include "spk/eog/classify/ModelArchive.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace spk::eog::classify {

Expected<std::vector<Label>> IEventClassifier::predict(std::span<const FeatureVector> features) const
{
    std::vector<Label> out;
    out.reserve(features.size());
    for (const auto &feature : features) {
        auto label = predictOne(feature);
        if (!label)
            return std::unexpected(label.error());
        out.push_back(std::move(*label));
    }
    return out;
}

ExpectedVoid ClassifierBase::train(std::span<const FeatureVector> features, std::span<const Label> labels)
{
    if (features.empty()) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument, "no training samples"));
    }
    if (features.size() != labels.size()) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument,
                std::format("{} feature vectors but {} labels", features.size(), labels.size())));
    }

    const std::size_t dim = features.front().size();
    if (dim == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument, "feature vectors are empty"));
    }

    Eigen::MatrixXd X(static_cast<Eigen::Index>(features.size()), static_cast<Eigen::Index>(dim));
    for (std::size_t i = 0; i < features.size(); ++i) {
        if (features[i].size() != dim) {
            return std::unexpected(
                Error::make(ErrorCode::kInvalidArgument,
                    std::format("sample {} has {} features, expected {}", i, features[i].size(), dim)));
        }
        for (std::size_t j = 0; j < dim; ++j) {
            if (!std::isfinite(features[i][j])) {
                return std::unexpected(
                    Error::make(ErrorCode::kInvalidArgument,
                        std::format("sample {} has a non-finite feature", i)));
            }
            X(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = features[i][j];
        }
    }

    std::vector<Label> classes(labels.begin(), labels.end());
    std::sort(classes.begin(), classes.end());
    classes.erase(std::unique(classes.begin(), classes.end()), classes.end());

    std::vector<int> y(labels.size());
    for (std::size_t i = 0; i < labels.size(); ++i) {
        const auto it = std::lower_bound(classes.begin(), classes.end(), labels[i]);
        y[i] = static_cast<int>(it - classes.begin());
    }

    const auto previousClasses = std::exchange(_classes, std::move(classes));
    if (auto fitted = fit(X, y); !fitted) {
        _classes = previousClasses;
        return fitted;
    }

    _dimension = dim;
    _trained = true;
    return {};
}

Expected<Label> ClassifierBase::predictOne(std::span<const double> feature) const
{
    if (!_trained) {
        return std::unexpected(
            Error::make(ErrorCode::kNotInitialized, "classifier has not been trained"));
    }
    if (feature.size() != _dimension) {
        return std::unexpected(
            Error::make(ErrorCode::kDimensionMismatch,
                std::format("expected {} features, got {}", _dimension, feature.size())));
    }

    const Eigen::VectorXd x = Eigen::Map<const Eigen::VectorXd>(feature.data(), static_cast<Eigen::Index>(feature.size()));
    const int index = predictIndex(x);
    return _classes[static_cast<std::size_t>(index)];
}

Expected<std::vector<std::byte>> ClassifierBase::serialize() const
{
    if (!_trained) {
        return std::unexpected(
            Error::make(ErrorCode::kNotInitialized, "cannot serialise an untrained classifier"));
    }

    io::ByteWriter writer;
    writeModelHeader(writer, ModelHeader{kind(), static_cast<std::uint32_t>(_dimension), _classes});
    writeParams(writer);
    return writer.take();
}

ExpectedVoid ClassifierBase::deserialize(std::span<const std::byte> archive)
{
    io::ByteReader reader(archive);
    auto header = readModelHeader(reader);
    if (!header)
        return std::unexpected(header.error());

    if (header->kind != kind()) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument,
                std::format("archive holds a {} model, not {}",
                    classifierKindName(header->kind), classifierKindName(kind()))));
    }

    const auto previousClasses = std::exchange(_classes, std::move(header->classes));
    if (auto params = readParams(reader, header->dimension); !params) {
        _classes = previousClasses;
        return params;
    }

    _dimension = header->dimension;
    _trained = true;
    return {};
}

void writeMatrix(io::ByteWriter &writer, const Eigen::MatrixXd &m)
{
    writer.writeU32(static_cast<std::uint32_t>(m.rows()));
    writer.writeU32(static_cast<std::uint32_t>(m.cols()));
    for (Eigen::Index r = 0; r < m.rows(); ++r)
        for (Eigen::Index c = 0; c < m.cols(); ++c)
            writer.writeF64(m(r, c));
}

Expected<Eigen::MatrixXd> readMatrix(io::ByteReader &reader)
{
    auto rows = reader.readU32();
    if (!rows)
        return std::unexpected(rows.error());
    auto cols = reader.readU32();
    if (!cols)
        return std::unexpected(cols.error());

    auto values = reader.readF64Array(static_cast<std::size_t>(*rows) * *cols);
    if (!values)
        return std::unexpected(values.error());

    Eigen::MatrixXd m(static_cast<Eigen::Index>(*rows), static_cast<Eigen::Index>(*cols));
    std::size_t k = 0;
    for (Eigen::Index r = 0; r < m.rows(); ++r)
        for (Eigen::Index c = 0; c < m.cols(); ++c)
            m(r, c) = (*values)[k++];
    return m;
}

} // namespace spk::eog::classify
