/**
 * @file ISource.hpp
 * @brief Abstract interface for single-channel sample acquisition.
 *
 * Implemented by the live SpikerBox serial link and by the replay source
 * used for offline runs and tests. Sources only deliver raw amplitudes;
 * windowing and classification happen in the EventPipeline.
 *
 * @see EventPipeline
 */

#pragma once

#include "spk/eog/core/Error.hpp"

#include <span>
#include <string>

namespace spk::eog::source {

/**
 * @brief Metadata describing a source.
 */
struct SourceInfo {
    std::string name;
    float sampleRate = 0.0f;
};

/**
 * @brief Abstract acquisition source.
 *
 * Contract:
 * 1. start() opens the backend. Must be called before read().
 * 2. read() copies the samples available now (non-blocking).
 * 3. stop() releases all resources (also called by the destructor).
 * 4. exhausted() tells a finite source has nothing left to deliver.
 */
class ISource {
public:
    virtual ~ISource() = default;

    ISource(const ISource &) = delete;
    ISource &operator=(const ISource &) = delete;

    [[nodiscard]] virtual ExpectedVoid start() = 0;

    /**
     * @brief Reads available samples into @p buffer.
     *
     * @return Number of samples written, or an Error
     */
    [[nodiscard]] virtual Expected<std::size_t> read(std::span<float> buffer) = 0;

    virtual void stop() noexcept = 0;

    [[nodiscard]] virtual SourceInfo info() const noexcept = 0;

    /// True once a finite source has delivered everything.
    [[nodiscard]] virtual bool exhausted() const noexcept { return false; }

protected:
    ISource() = default;
};

} // namespace spk::eog::source
