/**
 * @file Statistics.cpp
 * @brief Implementation of basic statistical utilities.
 */

#include "spk/eog/math/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace spk::eog::math {

double Statistics::mean(std::span<const double> data) noexcept
{
    if (data.empty())
        return 0.0;
    return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double Statistics::sampleStdDev(std::span<const double> data) noexcept
{
    if (data.size() < 2)
        return 0.0;

    const double m = mean(data);
    double varianceSum = 0.0;
    for (const double x : data)
        varianceSum += (x - m) * (x - m);
    return std::sqrt(varianceSum / static_cast<double>(data.size() - 1));
}

Expected<std::vector<double>> Statistics::zScore(std::span<const double> data)
{
    const double sd = sampleStdDev(data);
    if (!(sd > 0.0) || !std::isfinite(sd)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidWindow, "cannot z-score a constant or non-finite series"));
    }

    const double m = mean(data);
    std::vector<double> out(data.size());
    std::transform(data.begin(), data.end(), out.begin(),
        [m, sd](double x) { return (x - m) / sd; });
    return out;
}

Expected<std::vector<double>> Statistics::normaliseAmplitude(std::span<const double> data)
{
    if (data.empty()) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidWindow, "cannot normalise an empty series"));
    }

    const double m = mean(data);
    double peak = 0.0;
    for (const double x : data)
        peak = std::max(peak, std::abs(x - m));

    if (!(peak > 0.0) || !std::isfinite(peak)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidWindow, "cannot normalise a flat or non-finite series"));
    }

    std::vector<double> out(data.size());
    std::transform(data.begin(), data.end(), out.begin(),
        [m, peak](double x) { return (x - m) / peak; });
    return out;
}

Expected<std::vector<double>> Statistics::normaliseAmplitude(std::span<const float> data)
{
    const std::vector<double> widened(data.begin(), data.end());
    return normaliseAmplitude(std::span<const double>(widened));
}

bool Statistics::allFinite(std::span<const double> data) noexcept
{
    return std::all_of(data.begin(), data.end(), [](double x) { return std::isfinite(x); });
}

} // namespace spk::eog::math
