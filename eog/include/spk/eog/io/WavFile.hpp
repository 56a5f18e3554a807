/**
 * @file WavFile.hpp
 * @brief PCM WAV loader producing a SignalBuffer.
 *
 * SpikerBox recordings saved by the Backyard Brains apps are 16-bit PCM.
 * Multi-channel files are reduced to the requested channel. 8-bit,
 * 24-bit and 32-bit integer PCM as well as 32-bit IEEE float are also
 * accepted. Samples are scaled to [-1, 1).
 */

#pragma once

#include "spk/eog/core/Error.hpp"
#include "spk/eog/signal/SignalBuffer.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace spk::eog::io {

/**
 * @brief Format chunk fields relevant to decoding.
 */
struct WavFormat {
    std::uint16_t audioFormat = 0;
    std::uint16_t channelCount = 0;
    std::uint32_t sampleRate = 0;
    std::uint16_t bitsPerSample = 0;
};

/**
 * @brief Decodes an in-memory RIFF/WAVE image.
 *
 * @param bytes   Whole file contents
 * @param channel Channel to keep (0-based)
 * @param origin  Name used in error messages
 */
[[nodiscard]] Expected<signal::SignalBuffer> decodeWav(
    std::span<const std::byte> bytes, std::size_t channel = 0, const std::string &origin = "<memory>");

/**
 * @brief Reads a WAV file from disk.
 *
 * @return The decoded signal, kFileNotFound, or kFileParseError
 */
[[nodiscard]] Expected<signal::SignalBuffer> readWav(const std::filesystem::path &path, std::size_t channel = 0);

} // namespace spk::eog::io
