/**
 * @file Catch22.cpp
 * @brief Implementation of the catch22 feature functions.
 *
 * Follows the reference C implementation (v0.4) including its quirks, so
 * that features computed here match the values the Python tool-chain
 * trained its models on.
 */

#include "spk/eog/feature/Catch22.hpp"

#include "spk/eog/dsp/Fft.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>
#include <vector>

namespace spk::eog::feature::catch22 {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double meanOf(std::span<const double> y)
{
    if (y.empty())
        return kNaN;
    return std::accumulate(y.begin(), y.end(), 0.0) / static_cast<double>(y.size());
}

double stdDevOf(std::span<const double> y)
{
    if (y.size() < 2)
        return 0.0;
    const double m = meanOf(y);
    double acc = 0.0;
    for (const double v : y)
        acc += (v - m) * (v - m);
    return std::sqrt(acc / static_cast<double>(y.size() - 1));
}

double medianOf(std::vector<double> values)
{
    if (values.empty())
        return kNaN;
    std::sort(values.begin(), values.end());
    const std::size_t n = values.size();
    if (n % 2 == 1)
        return values[n / 2];
    return 0.5 * (values[n / 2 - 1] + values[n / 2]);
}

/// Quantile with the catch22 convention (midpoint plotting positions).
double quantileOf(std::span<const double> y, double quant)
{
    std::vector<double> tmp(y.begin(), y.end());
    std::sort(tmp.begin(), tmp.end());

    const auto size = static_cast<double>(tmp.size());
    const double q = 0.5 / size;
    if (quant < q)
        return tmp.front();
    if (quant > 1.0 - q)
        return tmp.back();

    const double idx = size * quant - 0.5;
    const auto left = static_cast<std::size_t>(std::floor(idx));
    const auto right = static_cast<std::size_t>(std::ceil(idx));
    if (left == right)
        return tmp[left];
    return tmp[left] + (idx - static_cast<double>(left)) * (tmp[right] - tmp[left]) /
                           static_cast<double>(right - left);
}

/// Sample covariance of two equally long series.
double covOf(std::span<const double> x, std::span<const double> y)
{
    const double mx = meanOf(x);
    const double my = meanOf(y);
    double acc = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i)
        acc += (x[i] - mx) * (y[i] - my);
    return acc / static_cast<double>(x.size() - 1);
}

/// Pearson correlation of two equally long series.
double corrOf(std::span<const double> x, std::span<const double> y)
{
    const double mx = meanOf(x);
    const double my = meanOf(y);
    double nom = 0.0;
    double dx = 0.0;
    double dy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        nom += (x[i] - mx) * (y[i] - my);
        dx += (x[i] - mx) * (x[i] - mx);
        dy += (y[i] - my) * (y[i] - my);
    }
    return nom / std::sqrt(dx * dy);
}

double normOf(std::span<const double> y)
{
    double acc = 0.0;
    for (const double v : y)
        acc += v * v;
    return std::sqrt(acc);
}

/// Least-squares line y = m x + b; m = b = 0 for a degenerate x.
void linreg(std::span<const double> x, std::span<const double> y, double &m, double &b)
{
    const auto n = static_cast<double>(x.size());
    double sumx = 0.0, sumx2 = 0.0, sumxy = 0.0, sumy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        sumx += x[i];
        sumx2 += x[i] * x[i];
        sumxy += x[i] * y[i];
        sumy += y[i];
    }
    const double denom = n * sumx2 - sumx * sumx;
    if (denom == 0.0) {
        m = 0.0;
        b = 0.0;
        return;
    }
    m = (n * sumxy - sumx * sumy) / denom;
    b = (sumy * sumx2 - sumx * sumxy) / denom;
}

struct Histogram {
    std::vector<int> counts;
    std::vector<double> edges;
};

Histogram histCounts(std::span<const double> y, std::size_t nBins)
{
    const auto [minIt, maxIt] = std::minmax_element(y.begin(), y.end());
    const double minVal = *minIt;
    const double binStep = (*maxIt - minVal) / static_cast<double>(nBins);

    Histogram h;
    h.counts.assign(nBins, 0);
    for (const double v : y) {
        auto idx = static_cast<long>((v - minVal) / binStep);
        if (idx < 0)
            idx = 0;
        if (idx >= static_cast<long>(nBins))
            idx = static_cast<long>(nBins) - 1;
        ++h.counts[static_cast<std::size_t>(idx)];
    }

    h.edges.resize(nBins + 1);
    for (std::size_t i = 0; i <= nBins; ++i)
        h.edges[i] = static_cast<double>(i) * binStep + minVal;
    return h;
}

double histogramMode(std::span<const double> y, std::size_t nBins)
{
    const Histogram h = histCounts(y, nBins);

    int maxCount = 0;
    int numMaxs = 1;
    double out = 0.0;
    for (std::size_t i = 0; i < nBins; ++i) {
        const double centre = (h.edges[i] + h.edges[i + 1]) * 0.5;
        if (h.counts[i] > maxCount) {
            maxCount = h.counts[i];
            numMaxs = 1;
            out = centre;
        } else if (h.counts[i] == maxCount) {
            numMaxs += 1;
            out += centre;
        }
    }
    return out / numMaxs;
}

/// First lag at which the autocorrelation is no longer positive.
std::size_t firstZeroAutocorr(std::span<const double> y, std::size_t maxTau)
{
    const std::vector<double> ac = dsp::Fft::autocorrelation(y);
    std::size_t idx = 0;
    while (idx < maxTau && idx < ac.size() && ac[idx] > 0.0)
        ++idx;
    return idx;
}

/// Labels 1..groups by quantile bins.
std::vector<int> coarseGrainQuantile(std::span<const double> y, int groups)
{
    std::vector<double> th(static_cast<std::size_t>(groups) + 1);
    for (int i = 0; i <= groups; ++i)
        th[static_cast<std::size_t>(i)] = quantileOf(y, static_cast<double>(i) / groups);
    th[0] -= 1.0;

    std::vector<int> labels(y.size(), 0);
    for (int i = 0; i < groups; ++i) {
        for (std::size_t j = 0; j < y.size(); ++j) {
            if (y[j] > th[static_cast<std::size_t>(i)] && y[j] <= th[static_cast<std::size_t>(i) + 1])
                labels[j] = i + 1;
        }
    }
    return labels;
}

/// Residuals of predicting y[i + trainLength] by the mean of the previous trainLength values.
std::vector<double> localSimpleResiduals(std::span<const double> y, std::size_t trainLength)
{
    std::vector<double> res(y.size() - trainLength);
    for (std::size_t i = 0; i < res.size(); ++i) {
        double estimate = 0.0;
        for (std::size_t j = 0; j < trainLength; ++j)
            estimate += y[i + j];
        estimate /= static_cast<double>(trainLength);
        res[i] = y[i + trainLength] - estimate;
    }
    return res;
}

double outlierInclude(std::span<const double> y, double sign)
{
    constexpr double kInc = 0.01;
    constexpr double kTrimThreshold = 2.0;
    const std::size_t n = y.size();

    std::vector<double> work(n);
    bool constant = true;
    int total = 0;
    for (std::size_t i = 0; i < n; ++i) {
        if (y[i] != y[0])
            constant = false;
        work[i] = sign * y[i];
        if (work[i] >= 0.0)
            ++total;
    }
    if (constant)
        return 0.0;

    const double maxVal = *std::max_element(work.begin(), work.end());
    if (maxVal < kInc)
        return 0.0;

    const auto nThresh = static_cast<std::size_t>(maxVal / kInc + 1.0);
    std::vector<double> meanGap(nThresh);
    std::vector<double> proportion(nThresh);
    std::vector<double> medianPos(nThresh);

    std::vector<double> positions;
    positions.reserve(n);
    for (std::size_t i = 0; i < nThresh; ++i) {
        positions.clear();
        const double threshold = static_cast<double>(i) * kInc;
        for (std::size_t j = 0; j < n; ++j) {
            if (work[j] >= threshold)
                positions.push_back(static_cast<double>(j + 1));
        }

        if (positions.empty()) {
            meanGap[i] = kNaN;
            proportion[i] = 0.0;
            medianPos[i] = i > 0 ? medianPos[i - 1] : 0.0;
            continue;
        }

        std::vector<double> gaps(positions.size() - 1);
        for (std::size_t j = 0; j + 1 < positions.size(); ++j)
            gaps[j] = positions[j + 1] - positions[j];

        meanGap[i] = meanOf(gaps);
        proportion[i] = static_cast<double>(positions.size() - 1) * 100.0 / total;
        medianPos[i] = medianOf(positions) / (static_cast<double>(n) / 2.0) - 1.0;
    }

    std::size_t mj = 0;
    std::size_t fbi = nThresh - 1;
    for (std::size_t i = 0; i < nThresh; ++i) {
        if (proportion[i] > kTrimThreshold)
            mj = i;
        if (std::isnan(meanGap[nThresh - 1 - i]))
            fbi = nThresh - 1 - i;
    }

    const std::size_t trimLimit = std::min(mj, fbi);
    return medianOf(std::vector<double>(medianPos.begin(), medianPos.begin() + static_cast<long>(trimLimit) + 1));
}

double welchSummary(std::span<const double> y, bool centroid)
{
    const dsp::PowerSpectrum spectrum = dsp::Fft::welchRect(y, 1.0);
    const std::size_t nWelch = spectrum.size();
    if (nWelch < 2)
        return kNaN;

    constexpr double kTwoPi = 2.0 * std::numbers::pi;
    std::vector<double> w(nWelch);
    std::vector<double> sw(nWelch);
    for (std::size_t i = 0; i < nWelch; ++i) {
        w[i] = kTwoPi * spectrum.frequency[i];
        sw[i] = spectrum.power[i] / kTwoPi;
        if (std::isinf(sw[i]))
            return 0.0;
    }

    if (centroid) {
        std::vector<double> cumulative(nWelch);
        std::partial_sum(sw.begin(), sw.end(), cumulative.begin());
        const double half = cumulative.back() * 0.5;
        for (std::size_t i = 0; i < nWelch; ++i) {
            if (cumulative[i] > half)
                return w[i];
        }
        return 0.0;
    }

    const double dw = w[1] - w[0];
    double area = 0.0;
    for (std::size_t i = 0; i < nWelch / 5; ++i)
        area += sw[i];
    return area * dw;
}

/// Proportion of the log-log fluctuation curve before its best two-line breakpoint.
double fluctAnal(std::span<const double> y, std::size_t lag, bool dfa)
{
    constexpr int kTauSteps = 50;
    constexpr std::size_t kMinPoints = 6;
    const std::size_t size = y.size();

    const double linLow = std::log(5.0);
    const double linHigh = std::log(static_cast<double>(size / 2));
    const double tauStep = (linHigh - linLow) / (kTauSteps - 1);

    std::vector<std::size_t> tau(kTauSteps);
    for (int i = 0; i < kTauSteps; ++i)
        tau[static_cast<std::size_t>(i)] = static_cast<std::size_t>(std::lround(std::exp(linLow + i * tauStep)));
    tau.erase(std::unique(tau.begin(), tau.end()), tau.end());

    const std::size_t nTau = tau.size();
    if (nTau < 12)
        return 0.0;

    const std::size_t sizeCs = size / lag;
    std::vector<double> cs(sizeCs);
    cs[0] = y[0];
    for (std::size_t i = 0; i + 1 < sizeCs; ++i)
        cs[i + 1] = cs[i] + y[(i + 1) * lag];

    std::vector<double> xReg(tau.back());
    std::iota(xReg.begin(), xReg.end(), 1.0);

    std::vector<double> F(nTau, 0.0);
    std::vector<double> buffer;
    for (std::size_t i = 0; i < nTau; ++i) {
        const std::size_t t = tau[i];
        const std::size_t nBuffer = sizeCs / t;
        buffer.resize(t);

        for (std::size_t j = 0; j < nBuffer; ++j) {
            double m = 0.0;
            double b = 0.0;
            const std::span<const double> segment(cs.data() + j * t, t);
            linreg(std::span<const double>(xReg.data(), t), segment, m, b);
            for (std::size_t k = 0; k < t; ++k)
                buffer[k] = segment[k] - (m * static_cast<double>(k + 1) + b);

            if (dfa) {
                for (const double v : buffer)
                    F[i] += v * v;
            } else {
                const auto [lo, hi] = std::minmax_element(buffer.begin(), buffer.end());
                F[i] += (*hi - *lo) * (*hi - *lo);
            }
        }

        F[i] = dfa ? std::sqrt(F[i] / static_cast<double>(nBuffer * t))
                   : std::sqrt(F[i] / static_cast<double>(nBuffer));
    }

    std::vector<double> logtt(nTau);
    std::vector<double> logFF(nTau);
    for (std::size_t i = 0; i < nTau; ++i) {
        logtt[i] = std::log(static_cast<double>(tau[i]));
        logFF[i] = std::log(F[i]);
    }

    const std::size_t nSsErr = nTau - 2 * kMinPoints + 1;
    std::vector<double> ssErr(nSsErr, 0.0);
    std::vector<double> residual(nTau);
    for (std::size_t i = kMinPoints; i < nTau - kMinPoints + 1; ++i) {
        double m1 = 0.0, b1 = 0.0, m2 = 0.0, b2 = 0.0;
        linreg(std::span<const double>(logtt.data(), i), std::span<const double>(logFF.data(), i), m1, b1);
        const std::size_t tail = nTau - i + 1;
        linreg(std::span<const double>(logtt.data() + i - 1, tail),
               std::span<const double>(logFF.data() + i - 1, tail), m2, b2);

        for (std::size_t j = 0; j < i; ++j)
            residual[j] = logtt[j] * m1 + b1 - logFF[j];
        ssErr[i - kMinPoints] += normOf(std::span<const double>(residual.data(), i));

        for (std::size_t j = 0; j < tail; ++j)
            residual[j] = logtt[j + i - 1] * m2 + b2 - logFF[j + i - 1];
        ssErr[i - kMinPoints] += normOf(std::span<const double>(residual.data(), tail));
    }

    const double minimum = *std::min_element(ssErr.begin(), ssErr.end());
    double firstMinInd = 0.0;
    for (std::size_t i = 0; i < nSsErr; ++i) {
        if (ssErr[i] == minimum) {
            firstMinInd = static_cast<double>(i + kMinPoints - 1);
            break;
        }
    }
    return (firstMinInd + 1.0) / static_cast<double>(nTau);
}

/// Least-squares cubic spline with one interior knot, continuous to the second derivative.
std::vector<double> splineFit(std::span<const double> y)
{
    const std::size_t n = y.size();
    const double last = static_cast<double>(n - 1);
    const double knot = (std::floor(static_cast<double>(n) / 2.0) - 1.0) / last;

    Eigen::MatrixXd basis(static_cast<Eigen::Index>(n), 5);
    Eigen::VectorXd target(static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / last;
        const double over = std::max(t - knot, 0.0);
        const auto row = static_cast<Eigen::Index>(i);
        basis(row, 0) = 1.0;
        basis(row, 1) = t;
        basis(row, 2) = t * t;
        basis(row, 3) = t * t * t;
        basis(row, 4) = over * over * over;
        target(row) = y[i];
    }

    const Eigen::VectorXd coeffs = basis.colPivHouseholderQr().solve(target);
    const Eigen::VectorXd fitted = basis * coeffs;
    return std::vector<double>(fitted.data(), fitted.data() + fitted.size());
}

} // namespace

double histogramMode5(std::span<const double> y)
{
    return histogramMode(y, 5);
}

double histogramMode10(std::span<const double> y)
{
    return histogramMode(y, 10);
}

double firstOneOverEAutocorr(std::span<const double> y)
{
    const std::vector<double> ac = dsp::Fft::autocorrelation(y);
    const double thresh = 1.0 / std::numbers::e;

    for (std::size_t i = 0; i + 2 < y.size(); ++i) {
        if (ac[i + 1] < thresh) {
            const double m = ac[i + 1] - ac[i];
            const double dy = thresh - ac[i];
            return static_cast<double>(i) + dy / m;
        }
    }
    return static_cast<double>(y.size());
}

double firstMinAutocorr(std::span<const double> y)
{
    const std::vector<double> ac = dsp::Fft::autocorrelation(y);
    for (std::size_t i = 1; i + 1 < y.size(); ++i) {
        if (ac[i] < ac[i - 1] && ac[i] < ac[i + 1])
            return static_cast<double>(i);
    }
    return static_cast<double>(y.size());
}

double histogramAmiEven2x5(std::span<const double> y)
{
    constexpr std::size_t kTau = 2;
    constexpr std::size_t kBins = 5;
    const std::size_t n = y.size() - kTau;

    const auto [minIt, maxIt] = std::minmax_element(y.begin(), y.end());
    const double binStep = (*maxIt - *minIt + 0.2) / static_cast<double>(kBins);
    std::array<double, kBins + 1> edges{};
    for (std::size_t i = 0; i <= kBins; ++i)
        edges[i] = *minIt + binStep * static_cast<double>(i) - 0.1;

    const auto binOf = [&edges](double v) {
        for (std::size_t j = 0; j <= kBins; ++j) {
            if (v < edges[j])
                return j;
        }
        return std::size_t{0};
    };

    std::array<std::array<double, kBins>, kBins> pij{};
    double total = 0.0;
    for (std::size_t t = 0; t < n; ++t) {
        const std::size_t b1 = binOf(y[t]);
        const std::size_t b2 = binOf(y[t + kTau]);
        if (b1 == 0 || b2 == 0)
            continue;
        pij[b1 - 1][b2 - 1] += 1.0;
        total += 1.0;
    }

    std::array<double, kBins> pi{};
    std::array<double, kBins> pj{};
    for (std::size_t i = 0; i < kBins; ++i) {
        for (std::size_t j = 0; j < kBins; ++j) {
            pij[i][j] /= total;
            pi[i] += pij[i][j];
            pj[j] += pij[i][j];
        }
    }

    double ami = 0.0;
    for (std::size_t i = 0; i < kBins; ++i) {
        for (std::size_t j = 0; j < kBins; ++j) {
            if (pij[i][j] > 0.0)
                ami += pij[i][j] * std::log(pij[i][j] / (pi[i] * pj[j]));
        }
    }
    return ami;
}

double timeReversibility(std::span<const double> y)
{
    double acc = 0.0;
    for (std::size_t i = 0; i + 1 < y.size(); ++i) {
        const double d = y[i + 1] - y[i];
        acc += d * d * d;
    }
    return acc / static_cast<double>(y.size() - 1);
}

double hrvClassicPnn40(std::span<const double> y)
{
    constexpr double kPnnX = 40.0;
    double count = 0.0;
    for (std::size_t i = 0; i + 1 < y.size(); ++i) {
        if (std::fabs(y[i + 1] - y[i]) * 1000.0 > kPnnX)
            count += 1.0;
    }
    return count / static_cast<double>(y.size() - 1);
}

double binaryStatsMeanLongStretch1(std::span<const double> y)
{
    const double m = meanOf(y);
    const std::size_t n = y.size() - 1;

    std::size_t maxStretch = 0;
    std::size_t last = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const bool below = y[i] - m <= 0.0;
        if (below || i == n - 1) {
            maxStretch = std::max(maxStretch, i - last);
            last = i;
        }
    }
    return static_cast<double>(maxStretch);
}

double transitionMatrix3acSumDiagCov(std::span<const double> y)
{
    constexpr int kGroups = 3;
    std::size_t tau = firstZeroAutocorr(y, y.size());
    if (tau == 0)
        tau = 1;

    const std::size_t nDown = (y.size() - 1) / tau + 1;
    std::vector<double> down(nDown);
    for (std::size_t i = 0; i < nDown; ++i)
        down[i] = y[i * tau];

    const std::vector<int> labels = coarseGrainQuantile(down, kGroups);

    std::array<std::array<double, kGroups>, kGroups> T{};
    for (std::size_t j = 0; j + 1 < nDown; ++j) {
        if (labels[j] == 0 || labels[j + 1] == 0)
            continue;
        T[static_cast<std::size_t>(labels[j] - 1)][static_cast<std::size_t>(labels[j + 1] - 1)] += 1.0;
    }
    for (auto &row : T)
        for (auto &v : row)
            v /= static_cast<double>(nDown - 1);

    double sumDiagCov = 0.0;
    for (std::size_t c = 0; c < kGroups; ++c) {
        const std::array<double, kGroups> column{T[0][c], T[1][c], T[2][c]};
        sumDiagCov += covOf(column, column);
    }
    return sumDiagCov;
}

double periodicityWang(std::span<const double> y)
{
    constexpr double kThreshold = 0.01;
    const std::size_t n = y.size();

    const std::vector<double> spline = splineFit(y);
    std::vector<double> detrended(n);
    for (std::size_t i = 0; i < n; ++i)
        detrended[i] = y[i] - spline[i];

    const auto acMax = static_cast<std::size_t>(std::ceil(static_cast<double>(n) / 3.0));
    std::vector<double> acf(acMax);
    for (std::size_t tau = 1; tau <= acMax; ++tau) {
        const std::span<const double> all(detrended);
        acf[tau - 1] = covOf(all.subspan(0, n - tau), all.subspan(tau, n - tau));
    }

    std::vector<std::size_t> troughs;
    std::vector<std::size_t> peaks;
    for (std::size_t i = 1; i + 1 < acMax; ++i) {
        const double slopeIn = acf[i] - acf[i - 1];
        const double slopeOut = acf[i + 1] - acf[i];
        if (slopeIn < 0.0 && slopeOut > 0.0)
            troughs.push_back(i);
        else if (slopeIn > 0.0 && slopeOut < 0.0)
            peaks.push_back(i);
    }

    for (const std::size_t iPeak : peaks) {
        const double thePeak = acf[iPeak];

        std::size_t j = 0;
        bool found = false;
        while (j < troughs.size() && troughs[j] < iPeak) {
            found = true;
            ++j;
        }
        if (!found)
            continue;

        const double theTrough = acf[troughs[j - 1]];
        if (thePeak - theTrough < kThreshold)
            continue;
        if (thePeak < 0.0)
            continue;

        return static_cast<double>(iPeak);
    }
    return 0.0;
}

double embed2DistExpFitMeanDiff(std::span<const double> y)
{
    const std::size_t size = y.size();
    auto tau = firstZeroAutocorr(y, size);
    if (static_cast<double>(tau) > static_cast<double>(size) / 10.0)
        tau = static_cast<std::size_t>(std::floor(static_cast<double>(size) / 10.0));

    const std::size_t nd = size - tau - 1;
    std::vector<double> d(nd);
    for (std::size_t i = 0; i < nd; ++i) {
        const double a = y[i + 1] - y[i];
        const double b = y[i + tau] - y[i + tau + 1];
        d[i] = std::sqrt(a * a + b * b);
        if (std::isnan(d[i]))
            return kNaN;
    }

    const double l = meanOf(d);
    const double sd = stdDevOf(d);
    if (sd < 0.001)
        return 0.0;

    const auto [minIt, maxIt] = std::minmax_element(d.begin(), d.end());
    const auto nBins = static_cast<std::size_t>(
        std::ceil((*maxIt - *minIt) / (3.5 * sd / std::pow(static_cast<double>(nd), 1.0 / 3.0))));
    if (nBins == 0)
        return 0.0;

    const Histogram h = histCounts(d, nBins);
    std::vector<double> diff(nBins);
    for (std::size_t i = 0; i < nBins; ++i) {
        const double p = static_cast<double>(h.counts[i]) / static_cast<double>(nd);
        double expf = std::exp(-(h.edges[i] + h.edges[i + 1]) * 0.5 / l) / l;
        if (expf < 0.0)
            expf = 0.0;
        diff[i] = std::fabs(p - expf);
    }
    return meanOf(diff);
}

double autoMutualInfoFirstMin(std::span<const double> y)
{
    const std::size_t size = y.size();
    std::size_t tau = 40;
    const auto half = static_cast<std::size_t>(std::ceil(static_cast<double>(size) / 2.0));
    if (tau > half)
        tau = half;

    std::vector<double> ami(tau);
    for (std::size_t i = 0; i < tau; ++i) {
        const std::size_t lag = i + 1;
        const double ac = corrOf(y.subspan(0, size - lag), y.subspan(lag, size - lag));
        ami[i] = -0.5 * std::log(1.0 - ac * ac);
    }

    for (std::size_t i = 1; i + 1 < tau; ++i) {
        if (ami[i] < ami[i - 1] && ami[i] < ami[i + 1])
            return static_cast<double>(i);
    }
    return static_cast<double>(tau);
}

double localSimpleMean1TauResRat(std::span<const double> y)
{
    const std::vector<double> res = localSimpleResiduals(y, 1);
    const auto resZero = static_cast<double>(firstZeroAutocorr(res, res.size()));
    const auto yZero = static_cast<double>(firstZeroAutocorr(y, y.size()));
    return resZero / yZero;
}

double outlierIncludePositive(std::span<const double> y)
{
    return outlierInclude(y, 1.0);
}

double outlierIncludeNegative(std::span<const double> y)
{
    return outlierInclude(y, -1.0);
}

double welchRectArea5x1(std::span<const double> y)
{
    return welchSummary(y, false);
}

double binaryStatsDiffLongStretch0(std::span<const double> y)
{
    const std::size_t n = y.size() - 1;

    std::size_t maxStretch = 0;
    std::size_t last = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const bool rising = y[i + 1] - y[i] >= 0.0;
        if (rising || i == n - 1) {
            maxStretch = std::max(maxStretch, i - last);
            last = i;
        }
    }
    return static_cast<double>(maxStretch);
}

double motifThreeQuantileHh(std::span<const double> y)
{
    constexpr int kAlphabet = 3;
    const std::vector<int> letters = coarseGrainQuantile(y, kAlphabet);

    std::array<std::array<double, kAlphabet>, kAlphabet> words{};
    for (std::size_t j = 0; j + 1 < letters.size(); ++j) {
        if (letters[j] == 0 || letters[j + 1] == 0)
            continue;
        words[static_cast<std::size_t>(letters[j] - 1)][static_cast<std::size_t>(letters[j + 1] - 1)] += 1.0;
    }

    double hh = 0.0;
    const double denom = static_cast<double>(y.size()) - 1.0;
    for (const auto &row : words) {
        for (const double count : row) {
            const double p = count / denom;
            if (p > 0.0)
                hh -= p * std::log(p);
        }
    }
    return hh;
}

double fluctAnalRsRangeFit(std::span<const double> y)
{
    return fluctAnal(y, 1, false);
}

double fluctAnalDfa(std::span<const double> y)
{
    return fluctAnal(y, 2, true);
}

double welchRectCentroid(std::span<const double> y)
{
    return welchSummary(y, true);
}

double localSimpleMean3StdErr(std::span<const double> y)
{
    const std::vector<double> res = localSimpleResiduals(y, 3);
    return stdDevOf(res);
}

} // namespace spk::eog::feature::catch22
