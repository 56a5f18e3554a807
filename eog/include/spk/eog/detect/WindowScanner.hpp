/**
 * @file WindowScanner.hpp
 * @brief Sliding-window scan whose stride depends on the detector's answer.
 *
 * The scanner walks a SignalBuffer with a cursor:
 *
 *   1. cursor = 0; stop when cursor + windowSize > size()
 *   2. window = signal[cursor, cursor + windowSize)
 *   3. detected  -> emit, cursor += windowSize (skip past the event)
 *      otherwise -> emit as a non-event step, cursor += increment
 *
 * Jumping a full window after a detection means two events closer together
 * than windowSize are reported once.
 *
 * In live mode the buffer grows between calls; next() returning nullopt
 * only means "not enough samples yet" and a later call resumes from the
 * same cursor. The cursor belongs to the scanner alone.
 *
 * Lifetime: the scanner keeps non-owning pointers to the buffer and the
 * detector; both must outlive it.
 */

#pragma once

#include "spk/eog/core/Error.hpp"
#include "spk/eog/detect/IEventDetector.hpp"
#include "spk/eog/signal/SignalBuffer.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace spk::eog::detect {

/**
 * @brief One visited window and the detector's verdict on it.
 */
struct ScanStep {
    signal::Window window;
    bool detected = false;
};

class WindowScanner {
public:
    /**
     * @brief Validates the stride parameters and builds a scanner.
     *
     * @param buffer     Signal to scan
     * @param detector   Event detector
     * @param windowSize Window length in samples (> 0)
     * @param increment  Stride after a non-event (0 < increment < windowSize)
     * @return The scanner, or kInvalidConfiguration
     */
    [[nodiscard]] static Expected<WindowScanner> create(
        const signal::SignalBuffer &buffer,
        const IEventDetector &detector,
        std::size_t windowSize,
        std::size_t increment);

    /**
     * @brief Checks windowSize / increment without building anything.
     */
    [[nodiscard]] static ExpectedVoid validate(std::size_t windowSize, std::size_t increment);

    /// One second of samples at @p sampleRate (at least 1).
    [[nodiscard]] static std::size_t defaultWindowSize(float sampleRate) noexcept;

    /// windowSize / 10 (at least 1).
    [[nodiscard]] static std::size_t defaultIncrement(std::size_t windowSize) noexcept;

    /**
     * @brief Evaluates the window at the cursor and advances.
     *
     * @return The step, or nullopt when the buffer holds no full window at
     *         the cursor
     */
    [[nodiscard]] std::optional<ScanStep> next();

    /// Restarts the scan from sample 0.
    void reset() noexcept { _cursor = 0; }

    /// Runs next() to exhaustion.
    [[nodiscard]] std::vector<ScanStep> scanAll();

    [[nodiscard]] std::size_t cursor() const noexcept { return _cursor; }
    [[nodiscard]] std::size_t windowSize() const noexcept { return _windowSize; }
    [[nodiscard]] std::size_t increment() const noexcept { return _increment; }

private:
    WindowScanner(const signal::SignalBuffer &buffer, const IEventDetector &detector,
                  std::size_t windowSize, std::size_t increment) noexcept;

    const signal::SignalBuffer *_buffer;
    const IEventDetector *_detector;
    std::size_t _windowSize;
    std::size_t _increment;
    std::size_t _cursor = 0;
};

} // namespace spk::eog::detect
