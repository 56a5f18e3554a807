/**
 * @file Recorder.hpp
 * @brief Captures a fixed stretch of a live source into a SignalBuffer.
 *
 * Used by spk_record to save SpikerBox sessions that spk_snipper and
 * spk_scan later read back as .npy recordings.
 *
 * @see ISource, saveRecording
 */

#pragma once

#include "spk/eog/core/Error.hpp"
#include "spk/eog/signal/SignalBuffer.hpp"
#include "spk/eog/source/ISource.hpp"

#include <cstddef>
#include <stop_token>

namespace spk::eog::pipeline {

struct RecordReport {
    signal::SignalBuffer signal;
    /// Stopped early by the stop token.
    bool cancelled = false;
    /// Stopped early because a finite source ran dry.
    bool exhausted = false;
};

/**
 * @brief Samples needed to cover @p seconds at @p sampleRate (rounded up).
 *
 * @return The count, or kInvalidArgument for a non-positive or non-finite
 *         duration or rate
 */
[[nodiscard]] Expected<std::size_t> samplesForDuration(double seconds, float sampleRate);

/**
 * @brief Starts @p source and appends its samples until @p sampleCount
 *        are held, the source is exhausted or a stop is requested.
 *
 * The result never holds more than @p sampleCount samples. The source is
 * stopped before returning.
 *
 * @return What was captured, kInvalidArgument for a zero @p sampleCount,
 *         or the source's start/read error
 */
[[nodiscard]] Expected<RecordReport> recordSource(source::ISource &source,
                                                  std::size_t sampleCount,
                                                  std::stop_token stopToken = {});

} // namespace spk::eog::pipeline
