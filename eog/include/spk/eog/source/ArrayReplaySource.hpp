/**
 * @file ArrayReplaySource.hpp
 * @brief Replays an in-memory recording in fixed-size chunks.
 *
 * Stands in for the serial link when running the live pipeline against a
 * WAV or .npy recording, and in tests.
 */

#pragma once

#include "spk/eog/source/ISource.hpp"

#include <cstddef>
#include <vector>

namespace spk::eog::source {

struct ArrayReplayConfig {
    /// Samples delivered per read() call (0 = everything at once).
    std::size_t chunkSize = 0;
    /// Restart from the beginning instead of running dry.
    bool loop = false;
};

class ArrayReplaySource final : public ISource {
public:
    ArrayReplaySource(std::vector<float> samples, float sampleRate, ArrayReplayConfig config = {});

    [[nodiscard]] ExpectedVoid start() override;
    [[nodiscard]] Expected<std::size_t> read(std::span<float> buffer) override;
    void stop() noexcept override;
    [[nodiscard]] SourceInfo info() const noexcept override;
    [[nodiscard]] bool exhausted() const noexcept override;

private:
    std::vector<float> _samples;
    float _sampleRate;
    ArrayReplayConfig _config;
    std::size_t _position = 0;
    bool _started = false;
};

} // namespace spk::eog::source
