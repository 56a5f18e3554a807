/**
 * @file Recording.hpp
 * @brief Loads a recording from disk by file extension, and saves
 *        captured streams as .npy.
 *
 * .wav files carry their own sample rate. .npy arrays (as saved by
 * spk_record) do not, so the rate comes from the options.
 */

#pragma once

#include "spk/eog/core/Constants.hpp"
#include "spk/eog/core/Error.hpp"
#include "spk/eog/signal/SignalBuffer.hpp"

#include <cstddef>
#include <filesystem>

namespace spk::eog::io {

struct RecordingOptions {
    /// Sample rate assumed for .npy input (Hz).
    float npySampleRate = kSpikerSampleRate;
    /// WAV channel, or row of a 2-D .npy array.
    std::size_t channel = 0;
};

/**
 * @brief Reads a .wav or .npy recording.
 *
 * @return The signal, kFileNotFound, kFileParseError, kOutOfRange for a
 *         missing channel, or kInvalidArgument for another extension
 */
[[nodiscard]] Expected<signal::SignalBuffer> loadRecording(const std::filesystem::path &path,
                                                           const RecordingOptions &options = {});

/**
 * @brief Writes @p signal as a 1-D float64 .npy array (overwrites).
 *
 * The sample rate is not stored; loadRecording() takes it from
 * RecordingOptions::npySampleRate.
 *
 * @return kInvalidArgument unless @p path ends in .npy, kEmptyInput for
 *         an empty signal, or the writer's kIoError
 */
[[nodiscard]] ExpectedVoid saveRecording(const std::filesystem::path &path, const signal::SignalBuffer &signal);

} // namespace spk::eog::io
