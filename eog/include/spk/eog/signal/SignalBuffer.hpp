/**
 * @file SignalBuffer.hpp
 * @brief Single-channel amplitude buffer and the windows cut from it.
 *
 * A SignalBuffer loaded from a recording is never modified. For a live
 * SpikerBox stream the buffer is append-only: one producer appends, and
 * samples already in the buffer never change, so a reader holding an
 * index range can always re-read the same values.
 *
 * @see WindowScanner
 */

#pragma once

#include "spk/eog/core/Error.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace spk::eog::signal {

/**
 * @brief Contiguous slice of a signal with its own local time axis.
 *
 * Samples are copied out of the buffer so a Window stays valid while the
 * live buffer keeps growing.
 */
struct Window {
    std::size_t startIndex = 0;
    std::vector<float> samples;
    float sampleRate = 0.0f;

    [[nodiscard]] std::size_t length() const noexcept { return samples.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples.empty(); }

    /// Start time in seconds on the parent signal's time axis.
    [[nodiscard]] double startTime() const noexcept;

    /// Duration in seconds (length / sampleRate).
    [[nodiscard]] double duration() const noexcept;

    /// Local time axis beginning at 0: t[i] = i / sampleRate.
    [[nodiscard]] std::vector<double> localTime() const;
};

/**
 * @brief Decoded 1-D amplitude sequence plus its sample rate.
 */
class SignalBuffer {
public:
    SignalBuffer() = default;

    /**
     * @brief Wraps already decoded samples.
     *
     * @param samples    Amplitude values
     * @param sampleRate Sampling rate in Hz (must be > 0, checked by create())
     */
    SignalBuffer(std::vector<float> samples, float sampleRate);

    /**
     * @brief Validating factory: rejects a non-positive sample rate.
     */
    [[nodiscard]] static Expected<SignalBuffer> create(std::vector<float> samples, float sampleRate);

    [[nodiscard]] std::size_t size() const noexcept { return _samples.size(); }
    [[nodiscard]] bool empty() const noexcept { return _samples.empty(); }
    [[nodiscard]] float sampleRate() const noexcept { return _sampleRate; }

    /// Duration of the whole buffer in seconds.
    [[nodiscard]] double duration() const noexcept;

    /// t[i] = i / sampleRate.
    [[nodiscard]] double timeAt(std::size_t index) const noexcept;

    /// Index of the first sample at or after @p seconds (clamped to size()).
    [[nodiscard]] std::size_t indexAt(double seconds) const noexcept;

    [[nodiscard]] std::span<const float> samples() const noexcept { return _samples; }

    /**
     * @brief Read-only view of [start, start + length).
     *
     * The view is invalidated by append().
     *
     * @return The view, or kOutOfRange / kInvalidWindow for a bad range
     */
    [[nodiscard]] Expected<std::span<const float>> view(std::size_t start, std::size_t length) const;

    /**
     * @brief Copies [start, start + length) into a Window.
     */
    [[nodiscard]] Expected<Window> window(std::size_t start, std::size_t length) const;

    /**
     * @brief Appends freshly acquired samples (live mode, single producer).
     */
    void append(std::span<const float> samples);

private:
    std::vector<float> _samples;
    float _sampleRate = 0.0f;
};

} // namespace spk::eog::signal
