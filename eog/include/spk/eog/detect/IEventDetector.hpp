/**
 * @file IEventDetector.hpp
 * @brief Abstract yes/no decision on whether a window holds an event.
 *
 * The WindowScanner asks a detector about every window it visits and
 * picks its stride from the answer. Detectors are stateless with respect
 * to the scan; the scanner owns the cursor.
 *
 * @see ZeroCrossingDetector, WindowScanner
 */

#pragma once

#include "spk/eog/signal/SignalBuffer.hpp"

#include <span>
#include <string_view>

namespace spk::eog::detect {

class IEventDetector {
public:
    virtual ~IEventDetector() = default;

    /**
     * @brief Returns true when @p samples contain a candidate event.
     */
    [[nodiscard]] virtual bool detect(std::span<const float> samples) const = 0;

    [[nodiscard]] bool detect(const signal::Window &window) const { return detect(window.samples); }

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace spk::eog::detect
