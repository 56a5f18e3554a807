/**
 * @file Fft.hpp
 * @brief Radix-2 Cooley-Tukey FFT and the spectral helpers built on it.
 *
 * The feature extractor needs two spectral quantities on short windows:
 * the normalised autocorrelation (computed as |FFT|^2 transformed again)
 * and a single-segment Welch periodogram with a rectangular window.
 * Inputs are zero-padded to the next power of two.
 */

#pragma once

#include <complex>
#include <cstddef>
#include <span>
#include <vector>

namespace spk::eog::dsp {

/**
 * @brief One-sided power spectral density estimate.
 */
struct PowerSpectrum {
    std::vector<double> power;
    std::vector<double> frequency;

    [[nodiscard]] std::size_t size() const noexcept { return power.size(); }
};

/**
 * @brief Stateless radix-2 FFT utilities.
 */
class Fft {
public:
    using Complex = std::complex<double>;

    Fft() = delete;

    /// Smallest power of two >= n (1 for n == 0).
    [[nodiscard]] static std::size_t nextPow2(std::size_t n) noexcept;

    /**
     * @brief In-place forward transform.
     *
     * @param x Data whose length is a power of two (zero-padded otherwise)
     */
    static void transform(std::vector<Complex> &x);

    /**
     * @brief Autocorrelation of the mean-removed signal normalised so that
     *        lag 0 equals 1.
     *
     * @return One value per lag, for lags 0 .. 2 * nextPow2(size) - 1
     *         (lags >= size are zero up to rounding)
     */
    [[nodiscard]] static std::vector<double> autocorrelation(std::span<const double> data);

    /**
     * @brief Welch PSD with a single rectangular segment covering @p data.
     *
     * @param data       Input signal
     * @param sampleRate Sampling rate (Hz)
     */
    [[nodiscard]] static PowerSpectrum welchRect(std::span<const double> data, double sampleRate);

private:
    static void bitReversalPermutation(std::vector<Complex> &x);
    static void butterflyPass(std::vector<Complex> &x);
};

} // namespace spk::eog::dsp
