/**
 * @file SvmClassifier.hpp
 * @brief RBF-kernel C-SVC with one-vs-one multi-class voting.
 *
 * Features are standardised with the training mean and standard deviation.
 * gamma = 1 / (K * var(X)) on the standardised data ("scale" heuristic).
 * Each class pair is solved with SMO using maximal-violating-pair working
 * set selection; the class with most pairwise wins is predicted, ties
 * going to the lower class index.
 */

#pragma once

#include "spk/eog/classify/ClassifierBase.hpp"
#include "spk/eog/core/Constants.hpp"

namespace spk::eog::classify {

class SvmClassifier final : public ClassifierBase {
public:
    explicit SvmClassifier(double c = kDefaultSvmC, double tolerance = 1e-3,
                           std::size_t maxIterations = 100000) noexcept;

    [[nodiscard]] ClassifierKind kind() const noexcept override { return ClassifierKind::kSvm; }
    [[nodiscard]] double gamma() const noexcept { return _gamma; }

protected:
    [[nodiscard]] ExpectedVoid fit(const Eigen::MatrixXd &X, const std::vector<int> &y) override;
    [[nodiscard]] int predictIndex(const Eigen::VectorXd &x) const override;
    void writeParams(io::ByteWriter &writer) const override;
    [[nodiscard]] ExpectedVoid readParams(io::ByteReader &reader, std::size_t dimension) override;

private:
    /// Decision function for one class pair: sum(coef_i * k(sv_i, x)) - rho.
    struct PairModel {
        std::int32_t positive = 0;
        std::int32_t negative = 0;
        Eigen::MatrixXd supportVectors;
        Eigen::VectorXd coefficients;
        double rho = 0.0;
    };

    [[nodiscard]] double kernel(const Eigen::VectorXd &a, const Eigen::VectorXd &b) const;

    double _c;
    double _tolerance;
    std::size_t _maxIterations;
    double _gamma = 0.0;
    Eigen::VectorXd _mean;
    Eigen::VectorXd _scale;
    std::vector<PairModel> _models;
};

} // namespace spk::eog::classify
