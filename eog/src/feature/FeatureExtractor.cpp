/**
 * @file FeatureExtractor.cpp
 * @brief Validation, z-scoring and dispatch to the catch22 functions.
 */

#include "spk/eog/feature/FeatureExtractor.hpp"

#include "spk/eog/feature/Catch22.hpp"
#include "spk/eog/math/Statistics.hpp"

#include <cmath>
#include <format>
#include <vector>

namespace spk::eog::feature {

namespace {

using FeatureFn = double (*)(std::span<const double>);

constexpr std::array<FeatureFn, kFeatureCount> kFeatures = {
    &catch22::histogramMode5,
    &catch22::histogramMode10,
    &catch22::firstOneOverEAutocorr,
    &catch22::firstMinAutocorr,
    &catch22::histogramAmiEven2x5,
    &catch22::timeReversibility,
    &catch22::hrvClassicPnn40,
    &catch22::binaryStatsMeanLongStretch1,
    &catch22::transitionMatrix3acSumDiagCov,
    &catch22::periodicityWang,
    &catch22::embed2DistExpFitMeanDiff,
    &catch22::autoMutualInfoFirstMin,
    &catch22::localSimpleMean1TauResRat,
    &catch22::outlierIncludePositive,
    &catch22::outlierIncludeNegative,
    &catch22::welchRectArea5x1,
    &catch22::binaryStatsDiffLongStretch0,
    &catch22::motifThreeQuantileHh,
    &catch22::fluctAnalRsRangeFit,
    &catch22::fluctAnalDfa,
    &catch22::welchRectCentroid,
    &catch22::localSimpleMean3StdErr,
};

constexpr std::array<std::string_view, kFeatureCount> kNames = {
    "DN_HistogramMode_5",
    "DN_HistogramMode_10",
    "CO_f1ecac",
    "CO_FirstMin_ac",
    "CO_HistogramAMI_even_2_5",
    "CO_trev_1_num",
    "MD_hrv_classic_pnn40",
    "SB_BinaryStats_mean_longstretch1",
    "SB_TransitionMatrix_3ac_sumdiagcov",
    "PD_PeriodicityWang_th0_01",
    "CO_Embed2_Dist_tau_d_expfit_meandiff",
    "IN_AutoMutualInfoStats_40_gaussian_fmmi",
    "FC_LocalSimple_mean1_tauresrat",
    "DN_OutlierInclude_p_001_mdrmd",
    "DN_OutlierInclude_n_001_mdrmd",
    "SP_Summaries_welch_rect_area_5_1",
    "SB_BinaryStats_diff_longstretch0",
    "SB_MotifThree_quantile_hh",
    "SC_FluctAnal_2_rsrangefit_50_1_logi_prop_r1",
    "SC_FluctAnal_2_dfa_50_1_2_logi_prop_r1",
    "SP_Summaries_welch_rect_centroid",
    "FC_LocalSimple_mean3_stderr",
};

} // namespace

Expected<FeatureVector> FeatureExtractor::extract(std::span<const double> samples) const
{
    if (samples.size() < kMinFeatureSamples) {
        return std::unexpected(
            Error::make(ErrorCode::kInsufficientData,
                std::format("features need at least {} samples, got {}", kMinFeatureSamples, samples.size())));
    }
    if (!math::Statistics::allFinite(samples)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidWindow, "window contains a non-finite sample"));
    }

    auto z = math::Statistics::zScore(samples);
    if (!z)
        return std::unexpected(z.error());

    FeatureVector features(kFeatureCount);
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        features[i] = kFeatures[i](*z);
        if (!std::isfinite(features[i])) {
            return std::unexpected(
                Error::make(ErrorCode::kInsufficientData,
                    std::format("{} is undefined for this window", kNames[i])));
        }
    }
    return features;
}

Expected<FeatureVector> FeatureExtractor::extract(std::span<const float> samples) const
{
    const std::vector<double> widened(samples.begin(), samples.end());
    return extract(std::span<const double>(widened));
}

const std::array<std::string_view, kFeatureCount> &FeatureExtractor::featureNames() noexcept
{
    return kNames;
}

} // namespace spk::eog::feature
