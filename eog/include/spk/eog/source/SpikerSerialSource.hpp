/**
 * @file SpikerSerialSource.hpp
 * @brief Live acquisition from a Backyard Brains SpikerBox over USB serial.
 *
 * A worker thread (std::jthread) reads raw bytes, decodes the 2-byte
 * frames and pushes samples into a lock-free SPSC ring buffer. read()
 * drains the ring from the consumer thread.
 *
 * A serial read error ends the worker. The error is kept and returned by
 * every read() once the samples captured before it are drained, until
 * the source is restarted.
 *
 * @see ISource, SerialPort, SpikerDecoder, RingBuffer
 */

#pragma once

#include "spk/eog/core/Constants.hpp"
#include "spk/eog/dsp/RingBuffer.hpp"
#include "spk/eog/source/ISource.hpp"
#include "spk/eog/source/SpikerDecoder.hpp"
#include "spk/eog/source/serial/SerialPort.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace spk::eog::source {

struct SpikerSerialConfig {
    std::string port = "/dev/ttyACM0";
    std::uint32_t baudRate = kSpikerBaudRate;
    float sampleRate = kSpikerSampleRate;
    float offset = kSpikerAdcMidpoint;
};

class SpikerSerialSource final : public ISource {
public:
    explicit SpikerSerialSource(SpikerSerialConfig config = {});
    ~SpikerSerialSource() override;

    [[nodiscard]] ExpectedVoid start() override;
    [[nodiscard]] Expected<std::size_t> read(std::span<float> buffer) override;
    void stop() noexcept override;
    [[nodiscard]] SourceInfo info() const noexcept override;

    /// Samples lost because the ring was full.
    [[nodiscard]] std::size_t droppedSamples() const noexcept { return _dropped.load(std::memory_order_relaxed); }

private:
    void workerLoop(std::stop_token stopToken);

    SpikerSerialConfig _config;
    SerialPort _serial;
    SpikerDecoder _decoder;
    dsp::RingBuffer<float, kSpikerRingSlots> _ring;
    std::atomic<std::size_t> _dropped{0};
    mutable std::mutex _failureMutex;
    std::optional<Error> _failure;
    std::jthread _worker;
    bool _started = false;
};

} // namespace spk::eog::source
