/**
 * @file Catch22.hpp
 * @brief The 22 catch22 time-series features as individual functions.
 *
 * Lubba et al., "catch22: CAnonical Time-series CHaracteristics",
 * Data Min Knowl Disc 33, 1821 (2019).
 *
 * Every function expects a z-scored, finite, non-constant series of at
 * least kMinFeatureSamples values (FeatureExtractor checks that) and may
 * return NaN when a statistic is undefined for the given input.
 */

#pragma once

#include <span>

namespace spk::eog::feature::catch22 {

[[nodiscard]] double histogramMode5(std::span<const double> y);
[[nodiscard]] double histogramMode10(std::span<const double> y);

/// First lag at which the autocorrelation drops below 1/e (interpolated).
[[nodiscard]] double firstOneOverEAutocorr(std::span<const double> y);

/// First local minimum of the autocorrelation function.
[[nodiscard]] double firstMinAutocorr(std::span<const double> y);

/// Automutual information at lag 2 on 5 equal-width bins.
[[nodiscard]] double histogramAmiEven2x5(std::span<const double> y);

/// Time-reversibility statistic mean((y[t+1] - y[t])^3).
[[nodiscard]] double timeReversibility(std::span<const double> y);

/// Proportion of successive differences exceeding 0.04 sigma.
[[nodiscard]] double hrvClassicPnn40(std::span<const double> y);

/// Longest stretch of consecutive values above the mean.
[[nodiscard]] double binaryStatsMeanLongStretch1(std::span<const double> y);

/// Trace of the covariance of the 3-letter transition matrix columns.
[[nodiscard]] double transitionMatrix3acSumDiagCov(std::span<const double> y);

/// Periodicity measure of Wang et al. (2007), threshold 0.01.
[[nodiscard]] double periodicityWang(std::span<const double> y);

/// Mean error of an exponential fit to 2-D embedding distances.
[[nodiscard]] double embed2DistExpFitMeanDiff(std::span<const double> y);

/// First minimum of the Gaussian automutual information (lags up to 40).
[[nodiscard]] double autoMutualInfoFirstMin(std::span<const double> y);

/// Ratio of autocorrelation decay of mean-1 forecast residuals to the input.
[[nodiscard]] double localSimpleMean1TauResRat(std::span<const double> y);

[[nodiscard]] double outlierIncludePositive(std::span<const double> y);
[[nodiscard]] double outlierIncludeNegative(std::span<const double> y);

/// Power in the lowest fifth of the frequencies (rectangular Welch).
[[nodiscard]] double welchRectArea5x1(std::span<const double> y);

/// Longest stretch of consecutive decreases.
[[nodiscard]] double binaryStatsDiffLongStretch0(std::span<const double> y);

/// Entropy of two-letter words on a 3-letter quantile alphabet.
[[nodiscard]] double motifThreeQuantileHh(std::span<const double> y);

/// Rescaled-range fluctuation analysis, scaling breakpoint proportion.
[[nodiscard]] double fluctAnalRsRangeFit(std::span<const double> y);

/// Detrended fluctuation analysis, scaling breakpoint proportion.
[[nodiscard]] double fluctAnalDfa(std::span<const double> y);

/// Frequency at which the cumulative Welch power reaches one half.
[[nodiscard]] double welchRectCentroid(std::span<const double> y);

/// Standard deviation of mean-3 rolling forecast residuals.
[[nodiscard]] double localSimpleMean3StdErr(std::span<const double> y);

} // namespace spk::eog::feature::catch22
