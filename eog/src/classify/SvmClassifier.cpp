/**
 * @file SvmClassifier.cpp
 * @brief Implementation of the RBF C-SVC and its SMO solver.
 */

#include "spk/eog/classify/SvmClassifier.hpp"

#include "spk/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace spk::eog::classify {

namespace {

constexpr double kTau = 1e-12;

struct SmoResult {
    std::vector<double> alpha;
    double rho = 0.0;
    std::size_t iterations = 0;
};

bool isUpper(double a, double c) { return a >= c; }
bool isLower(double a) { return a <= 0.0; }

/**
 * @brief Solves min 0.5 a'Qa - e'a s.t. y'a = 0, 0 <= a <= C with
 *        Q_ij = y_i y_j K_ij.
 */
SmoResult solveSmo(const Eigen::MatrixXd &K, const std::vector<double> &y, double c,
                   double eps, std::size_t maxIterations)
{
    const std::size_t n = y.size();
    SmoResult result;
    result.alpha.assign(n, 0.0);
    std::vector<double> G(n, -1.0);
    auto &alpha = result.alpha;

    const auto Q = [&K, &y](std::size_t i, std::size_t j) {
        return y[i] * y[j] * K(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
    };

    for (; result.iterations < maxIterations; ++result.iterations) {
        double gMax = -std::numeric_limits<double>::infinity();
        double gMax2 = -std::numeric_limits<double>::infinity();
        std::size_t i = n;
        std::size_t j = n;

        for (std::size_t t = 0; t < n; ++t) {
            if (y[t] > 0.0) {
                if (!isUpper(alpha[t], c) && -G[t] >= gMax) { gMax = -G[t]; i = t; }
                if (!isLower(alpha[t]) && G[t] >= gMax2) { gMax2 = G[t]; j = t; }
            } else {
                if (!isLower(alpha[t]) && G[t] >= gMax) { gMax = G[t]; i = t; }
                if (!isUpper(alpha[t], c) && -G[t] >= gMax2) { gMax2 = -G[t]; j = t; }
            }
        }

        if (i == n || j == n || gMax + gMax2 < eps)
            break;

        const double oldAi = alpha[i];
        const double oldAj = alpha[j];

        if (y[i] != y[j]) {
            double quad = Q(i, i) + Q(j, j) + 2.0 * Q(i, j);
            if (quad <= 0.0)
                quad = kTau;
            const double delta = (-G[i] - G[j]) / quad;
            const double diff = alpha[i] - alpha[j];
            alpha[i] += delta;
            alpha[j] += delta;

            if (diff > 0.0) {
                if (alpha[j] < 0.0) { alpha[j] = 0.0; alpha[i] = diff; }
            } else {
                if (alpha[i] < 0.0) { alpha[i] = 0.0; alpha[j] = -diff; }
            }
            if (diff > 0.0) {
                if (alpha[i] > c) { alpha[i] = c; alpha[j] = c - diff; }
            } else {
                if (alpha[j] > c) { alpha[j] = c; alpha[i] = c + diff; }
            }
        } else {
            double quad = Q(i, i) + Q(j, j) - 2.0 * Q(i, j);
            if (quad <= 0.0)
                quad = kTau;
            const double delta = (G[i] - G[j]) / quad;
            const double sum = alpha[i] + alpha[j];
            alpha[i] -= delta;
            alpha[j] += delta;

            if (sum > c) {
                if (alpha[i] > c) { alpha[i] = c; alpha[j] = sum - c; }
            } else {
                if (alpha[j] < 0.0) { alpha[j] = 0.0; alpha[i] = sum; }
            }
            if (sum > c) {
                if (alpha[j] > c) { alpha[j] = c; alpha[i] = sum - c; }
            } else {
                if (alpha[i] < 0.0) { alpha[i] = 0.0; alpha[j] = sum; }
            }
        }

        const double dAi = alpha[i] - oldAi;
        const double dAj = alpha[j] - oldAj;
        for (std::size_t t = 0; t < n; ++t)
            G[t] += Q(t, i) * dAi + Q(t, j) * dAj;
    }

    double ub = std::numeric_limits<double>::infinity();
    double lb = -std::numeric_limits<double>::infinity();
    double sumFree = 0.0;
    std::size_t nFree = 0;
    for (std::size_t t = 0; t < n; ++t) {
        const double yG = y[t] * G[t];
        if (isUpper(alpha[t], c)) {
            if (y[t] < 0.0) ub = std::min(ub, yG);
            else            lb = std::max(lb, yG);
        } else if (isLower(alpha[t])) {
            if (y[t] > 0.0) ub = std::min(ub, yG);
            else            lb = std::max(lb, yG);
        } else {
            ++nFree;
            sumFree += yG;
        }
    }
    result.rho = nFree > 0 ? sumFree / static_cast<double>(nFree) : (ub + lb) / 2.0;
    return result;
}

} // namespace

SvmClassifier::SvmClassifier(double c, double tolerance, std::size_t maxIterations) noexcept
    : _c(c > 0.0 ? c : kDefaultSvmC)
    , _tolerance(tolerance > 0.0 ? tolerance : 1e-3)
    , _maxIterations(std::max<std::size_t>(1, maxIterations))
{
}

double SvmClassifier::kernel(const Eigen::VectorXd &a, const Eigen::VectorXd &b) const
{
    return std::exp(-_gamma * (a - b).squaredNorm());
}

ExpectedVoid SvmClassifier::fit(const Eigen::MatrixXd &X, const std::vector<int> &y)
{
    const auto n = static_cast<double>(X.rows());
    const Eigen::VectorXd mean = X.colwise().mean().transpose();
    Eigen::VectorXd scale = ((X.rowwise() - mean.transpose()).array().square().colwise().sum() / n)
                                .sqrt().matrix().transpose();
    for (Eigen::Index k = 0; k < scale.size(); ++k) {
        if (!(scale(k) > 0.0))
            scale(k) = 1.0;
    }

    const Eigen::MatrixXd Xs =
        ((X.rowwise() - mean.transpose()).array().rowwise() / scale.transpose().array()).matrix();
    const double overallMean = Xs.mean();
    const double variance = (Xs.array() - overallMean).square().mean();
    _gamma = variance > 0.0 ? 1.0 / (static_cast<double>(X.cols()) * variance) : 1.0;

    std::vector<PairModel> models;
    const auto classes = static_cast<int>(classCount());
    for (int a = 0; a < classes; ++a) {
        for (int b = a + 1; b < classes; ++b) {
            std::vector<Eigen::Index> rows;
            std::vector<double> targets;
            for (std::size_t s = 0; s < y.size(); ++s) {
                if (y[s] == a || y[s] == b) {
                    rows.push_back(static_cast<Eigen::Index>(s));
                    targets.push_back(y[s] == a ? 1.0 : -1.0);
                }
            }

            const auto m = static_cast<Eigen::Index>(rows.size());
            Eigen::MatrixXd K(m, m);
            for (Eigen::Index r = 0; r < m; ++r) {
                for (Eigen::Index q = r; q < m; ++q) {
                    const double v = std::exp(-_gamma * (Xs.row(rows[static_cast<std::size_t>(r)]) -
                                                         Xs.row(rows[static_cast<std::size_t>(q)])).squaredNorm());
                    K(r, q) = v;
                    K(q, r) = v;
                }
            }

            const SmoResult smo = solveSmo(K, targets, _c, _tolerance, _maxIterations);
            if (smo.iterations >= _maxIterations) {
                core::Log::warn("train", std::format("SMO for classes {}/{} stopped after {} iterations",
                    a, b, smo.iterations));
            }

            std::vector<std::size_t> support;
            for (std::size_t s = 0; s < smo.alpha.size(); ++s) {
                if (smo.alpha[s] > 0.0)
                    support.push_back(s);
            }

            PairModel model;
            model.positive = a;
            model.negative = b;
            model.rho = smo.rho;
            model.supportVectors.resize(static_cast<Eigen::Index>(support.size()), X.cols());
            model.coefficients.resize(static_cast<Eigen::Index>(support.size()));
            for (std::size_t s = 0; s < support.size(); ++s) {
                const auto row = static_cast<Eigen::Index>(s);
                model.supportVectors.row(row) = Xs.row(rows[support[s]]);
                model.coefficients(row) = smo.alpha[support[s]] * targets[support[s]];
            }
            models.push_back(std::move(model));
        }
    }

    _mean = mean;
    _scale = scale;
    _models = std::move(models);
    return {};
}

int SvmClassifier::predictIndex(const Eigen::VectorXd &x) const
{
    if (_models.empty())
        return 0;

    const Eigen::VectorXd xs = ((x - _mean).array() / _scale.array()).matrix();
    std::vector<int> votes(classCount(), 0);

    for (const auto &model : _models) {
        double decision = -model.rho;
        for (Eigen::Index s = 0; s < model.supportVectors.rows(); ++s)
            decision += model.coefficients(s) * kernel(model.supportVectors.row(s).transpose(), xs);
        ++votes[static_cast<std::size_t>(decision > 0.0 ? model.positive : model.negative)];
    }
    return static_cast<int>(std::max_element(votes.begin(), votes.end()) - votes.begin());
}

void SvmClassifier::writeParams(io::ByteWriter &writer) const
{
    writer.writeF64(_c);
    writer.writeF64(_gamma);
    writer.writeF64Array(std::span<const double>(_mean.data(), static_cast<std::size_t>(_mean.size())));
    writer.writeF64Array(std::span<const double>(_scale.data(), static_cast<std::size_t>(_scale.size())));
    writer.writeU32(static_cast<std::uint32_t>(_models.size()));
    for (const auto &model : _models) {
        writer.writeI32(model.positive);
        writer.writeI32(model.negative);
        writer.writeF64(model.rho);
        writeMatrix(writer, model.supportVectors);
        writer.writeF64Array(std::span<const double>(model.coefficients.data(),
                                                     static_cast<std::size_t>(model.coefficients.size())));
    }
}

ExpectedVoid SvmClassifier::readParams(io::ByteReader &reader, std::size_t dimension)
{
    const auto corrupt = [](const char *what) {
        return std::unexpected(Error::make(ErrorCode::kFileParseError, what));
    };

    auto c = reader.readF64();
    if (!c)
        return std::unexpected(c.error());
    auto gamma = reader.readF64();
    if (!gamma)
        return std::unexpected(gamma.error());
    auto mean = reader.readF64Array(dimension);
    if (!mean)
        return std::unexpected(mean.error());
    auto scale = reader.readF64Array(dimension);
    if (!scale)
        return std::unexpected(scale.error());
    auto modelCount = reader.readU32();
    if (!modelCount)
        return std::unexpected(modelCount.error());

    const std::size_t expectedPairs = classCount() * (classCount() - 1) / 2;
    if (*modelCount != expectedPairs)
        return corrupt("SVM archive pair count does not match its label table");

    std::vector<PairModel> models(*modelCount);
    for (auto &model : models) {
        auto positive = reader.readI32();
        if (!positive)
            return std::unexpected(positive.error());
        auto negative = reader.readI32();
        if (!negative)
            return std::unexpected(negative.error());
        auto rho = reader.readF64();
        if (!rho)
            return std::unexpected(rho.error());
        auto vectors = readMatrix(reader);
        if (!vectors)
            return std::unexpected(vectors.error());
        auto coefficients = reader.readF64Array(static_cast<std::size_t>(vectors->rows()));
        if (!coefficients)
            return std::unexpected(coefficients.error());

        const auto classes = static_cast<std::int32_t>(classCount());
        if (*positive < 0 || *positive >= classes || *negative < 0 || *negative >= classes)
            return corrupt("SVM archive class index out of range");
        if (vectors->rows() > 0 && static_cast<std::size_t>(vectors->cols()) != dimension)
            return corrupt("SVM support vector width does not match the header");

        model.positive = *positive;
        model.negative = *negative;
        model.rho = *rho;
        model.supportVectors = std::move(*vectors);
        model.coefficients = Eigen::Map<const Eigen::VectorXd>(coefficients->data(),
                                                               static_cast<Eigen::Index>(coefficients->size()));
    }

    _c = *c;
    _gamma = *gamma;
    _mean = Eigen::Map<const Eigen::VectorXd>(mean->data(), static_cast<Eigen::Index>(mean->size()));
    _scale = Eigen::Map<const Eigen::VectorXd>(scale->data(), static_cast<Eigen::Index>(scale->size()));
    _models = std::move(models);
    return {};
}

} // namespace spk::eog::classify
