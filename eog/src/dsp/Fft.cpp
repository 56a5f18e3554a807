/**
 * @file Fft.cpp
 * @brief Implementation of the radix-2 FFT and its spectral helpers.
 */

#include "spk/eog/dsp/Fft.hpp"

#include <bit>
#include <cmath>
#include <numbers>
#include <numeric>

namespace spk::eog::dsp {

std::size_t Fft::nextPow2(std::size_t n) noexcept
{
    return n <= 1 ? 1 : std::bit_ceil(n);
}

void Fft::bitReversalPermutation(std::vector<Complex> &x)
{
    const std::size_t N = x.size();
    std::size_t j = 0;

    for (std::size_t i = 1; i < N; ++i) {
        std::size_t bit = N >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(x[i], x[j]);
        }
    }
}

void Fft::butterflyPass(std::vector<Complex> &x)
{
    const std::size_t N = x.size();

    for (std::size_t len = 2; len <= N; len <<= 1) {
        const double angle = -2.0 * std::numbers::pi / static_cast<double>(len);
        const Complex wlen(std::cos(angle), std::sin(angle));

        for (std::size_t i = 0; i < N; i += len) {
            Complex w(1.0, 0.0);
            const std::size_t halfLen = len / 2;

            for (std::size_t k = 0; k < halfLen; ++k) {
                Complex u = x[i + k];
                Complex v = x[i + k + halfLen] * w;
                x[i + k] = u + v;
                x[i + k + halfLen] = u - v;
                w *= wlen;
            }
        }
    }
}

void Fft::transform(std::vector<Complex> &x)
{
    if (x.size() < 2)
        return;
    if (!std::has_single_bit(x.size()))
        x.resize(std::bit_ceil(x.size()), Complex(0.0, 0.0));

    bitReversalPermutation(x);
    butterflyPass(x);
}

std::vector<double> Fft::autocorrelation(std::span<const double> data)
{
    if (data.empty())
        return {};

    const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
    const std::size_t nFft = nextPow2(data.size()) << 1;

    std::vector<Complex> F(nFft, Complex(0.0, 0.0));
    for (std::size_t i = 0; i < data.size(); ++i)
        F[i] = Complex(data[i] - mean, 0.0);

    transform(F);
    for (auto &c : F)
        c *= std::conj(c);
    // |F|^2 is real and even, so a second forward pass equals nFft * inverse.
    transform(F);

    const double divisor = F[0].real();
    std::vector<double> out(nFft);
    for (std::size_t i = 0; i < nFft; ++i)
        out[i] = F[i].real() / divisor;
    return out;
}

PowerSpectrum Fft::welchRect(std::span<const double> data, double sampleRate)
{
    PowerSpectrum spectrum;
    if (data.empty() || sampleRate <= 0.0)
        return spectrum;

    const std::size_t n = data.size();
    const std::size_t nFft = nextPow2(n);
    const double dt = 1.0 / sampleRate;
    const double df = 1.0 / static_cast<double>(nFft) / dt;
    const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
    // One segment; the rectangular window has squared norm n.
    const double scale = static_cast<double>(n);

    std::vector<Complex> F(nFft, Complex(0.0, 0.0));
    for (std::size_t i = 0; i < n; ++i)
        F[i] = Complex(data[i] - mean, 0.0);
    transform(F);

    const std::size_t nOut = nFft / 2 + 1;
    spectrum.power.resize(nOut);
    spectrum.frequency.resize(nOut);
    for (std::size_t i = 0; i < nOut; ++i) {
        double p = std::norm(F[i]) / scale * dt;
        if (i > 0 && i < nOut - 1)
            p *= 2.0;
        spectrum.power[i] = p;
        spectrum.frequency[i] = static_cast<double>(i) * df;
    }
    return spectrum;
}

} // namespace spk::eog::dsp
