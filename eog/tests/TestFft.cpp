/**
 * @file TestFft.cpp
 * @brief Unit tests for dsp::Fft.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "spk/eog/dsp/Fft.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace spk::eog {

using namespace eog::dsp;
using Catch::Matchers::WithinAbs;

TEST_CASE("Fft::nextPow2", "[dsp][fft]")
{
    REQUIRE(Fft::nextPow2(0) == 1);
    REQUIRE(Fft::nextPow2(1) == 1);
    REQUIRE(Fft::nextPow2(5) == 8);
    REQUIRE(Fft::nextPow2(64) == 64);
    REQUIRE(Fft::nextPow2(65) == 128);
}

TEST_CASE("Fft::transform of an impulse is flat", "[dsp][fft]")
{
    std::vector<Fft::Complex> x(8, {0.0, 0.0});
    x[0] = {1.0, 0.0};
    Fft::transform(x);

    for (const auto &c : x) {
        REQUIRE_THAT(c.real(), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(c.imag(), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("Fft::transform puts a cosine in its bin", "[dsp][fft]")
{
    constexpr std::size_t n = 64;
    constexpr std::size_t k = 5;
    std::vector<Fft::Complex> x(n);
    for (std::size_t i = 0; i < n; ++i)
        x[i] = {std::cos(2.0 * std::numbers::pi * k * i / n), 0.0};

    Fft::transform(x);

    REQUIRE_THAT(std::abs(x[k]), WithinAbs(n / 2.0, 1e-9));
    REQUIRE_THAT(std::abs(x[n - k]), WithinAbs(n / 2.0, 1e-9));
    REQUIRE_THAT(std::abs(x[k + 1]), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Fft::autocorrelation is normalised at lag zero", "[dsp][fft]")
{
    const std::vector<double> data = {1.0, 3.0, 2.0, 5.0, 4.0, 1.0, 0.0};
    const auto ac = Fft::autocorrelation(data);
    REQUIRE(ac.size() == 16);
    REQUIRE_THAT(ac[0], WithinAbs(1.0, 1e-12));

    const double mean = 16.0 / 7.0;
    double num = 0.0;
    double den = 0.0;
    for (std::size_t i = 0; i < data.size(); ++i) {
        den += (data[i] - mean) * (data[i] - mean);
        if (i + 1 < data.size())
            num += (data[i] - mean) * (data[i + 1] - mean);
    }
    REQUIRE_THAT(ac[1], WithinAbs(num / den, 1e-12));
}

TEST_CASE("Fft::welchRect peaks at the sine frequency", "[dsp][fft]")
{
    constexpr double fs = 512.0;
    std::vector<double> data(512);
    for (std::size_t i = 0; i < data.size(); ++i)
        data[i] = std::sin(2.0 * std::numbers::pi * 50.0 * static_cast<double>(i) / fs);

    const auto spectrum = Fft::welchRect(data, fs);
    REQUIRE(spectrum.size() == 257);

    const auto peak = std::max_element(spectrum.power.begin(), spectrum.power.end()) - spectrum.power.begin();
    REQUIRE_THAT(spectrum.frequency[static_cast<std::size_t>(peak)], WithinAbs(50.0, 1e-9));
}

} // namespace spk::eog
