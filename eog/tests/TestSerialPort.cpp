/**
 * @file TestSerialPort.cpp
 * @brief SerialPort and SpikerSerialSource over a pseudo-terminal.
 */

#ifdef __unix__
#include <catch2/catch_test_macros.hpp>

#include "spk/eog/pipeline/EventPipeline.hpp"
#include "spk/eog/source/SpikerSerialSource.hpp"
#include "spk/eog/source/serial/SerialPort.hpp"

#include <pty.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace spk::eog {

using namespace eog::source;

namespace {

/// Master/slave pty pair closed on scope exit.
struct Pty {
    int master = -1;
    int slave = -1;
    char name[100] = {};

    Pty() { REQUIRE(openpty(&master, &slave, name, nullptr, nullptr) == 0); }

    /// Closing the master hangs up every open slave, like a USB unplug.
    void hangUp()
    {
        ::close(master);
        master = -1;
    }

    ~Pty()
    {
        ::close(master);
        ::close(slave);
    }
};

} // namespace

TEST_CASE("SerialPort open/read/write/close", "[source][serial]")
{
    Pty pty;

    SerialPort port;
    SerialConfig cfg{.portPath = pty.name, .baudRate = 115200};
    REQUIRE(port.open(cfg).has_value());
    REQUIRE(port.isOpen());

    SECTION("Second open is refused")
    {
        REQUIRE(port.open(cfg).error().code == ErrorCode::kAlreadyRunning);
    }

    const std::string msg = "hello";
    auto w = port.write(std::span(reinterpret_cast<const std::uint8_t *>(msg.data()), msg.size()));
    REQUIRE(w.has_value());
    REQUIRE(*w == msg.size());

    std::array<char, 10> buf{};
    const auto n = ::read(pty.master, buf.data(), buf.size());
    REQUIRE(n == static_cast<ssize_t>(msg.size()));
    REQUIRE(std::string(buf.data(), static_cast<std::size_t>(n)) == msg);

    const std::array<std::uint8_t, 4> frame = {0x84, 0x00, 0x87, 0x7F};
    REQUIRE(::write(pty.master, frame.data(), frame.size()) == static_cast<ssize_t>(frame.size()));
    std::array<std::uint8_t, 10> in{};
    auto r = port.read(in);
    REQUIRE(r.has_value());
    REQUIRE(*r == frame.size());
    REQUIRE(in[0] == 0x84);
    REQUIRE(in[3] == 0x7F);

    port.close();
    REQUIRE_FALSE(port.isOpen());
    port.close();
}

TEST_CASE("SerialPort reports a hung-up device", "[source][serial]")
{
    Pty pty;

    SerialPort port;
    REQUIRE(port.open({.portPath = pty.name}).has_value());

    std::array<std::uint8_t, 4> buf{};
    REQUIRE(port.read(buf).has_value());

    pty.hangUp();
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto r = port.read(buf);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::kSerialReadFailed);
    }
}

TEST_CASE("SerialPort open failures", "[source][serial]")
{
    SerialPort port;

    SECTION("Missing device")
    {
        SerialConfig cfg{.portPath = "/nonexistent"};
        REQUIRE(port.open(cfg).error().code == ErrorCode::kSerialPortNotFound);
    }

    SECTION("Unsupported baud rate")
    {
        Pty pty;
        SerialConfig cfg{.portPath = pty.name, .baudRate = 12345};
        REQUIRE(port.open(cfg).error().code == ErrorCode::kSerialPortConfigFailed);
        REQUIRE_FALSE(port.isOpen());
    }

    SECTION("Read and write on a closed port")
    {
        std::array<std::uint8_t, 4> buf{};
        REQUIRE_FALSE(port.read(buf).has_value());
        REQUIRE_FALSE(port.write(buf).has_value());
    }
}

TEST_CASE("SpikerSerialSource streams decoded samples", "[source][serial]")
{
    Pty pty;

    SpikerSerialSource source({.port = pty.name});
    REQUIRE(source.info().sampleRate == kSpikerSampleRate);

    std::array<float, 8> early{};
    REQUIRE(source.read(early).error().code == ErrorCode::kNotInitialized);

    REQUIRE(source.start().has_value());
    REQUIRE(source.start().error().code == ErrorCode::kAlreadyRunning);

    // 512 -> 0, 1023 -> 511, 0 -> -512
    const std::array<std::uint8_t, 6> frames = {0x84, 0x00, 0x87, 0x7F, 0x80, 0x00};
    REQUIRE(::write(pty.master, frames.data(), frames.size()) == static_cast<ssize_t>(frames.size()));

    std::vector<float> received;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (received.size() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::array<float, 8> chunk{};
        auto n = source.read(chunk);
        REQUIRE(n.has_value());
        received.insert(received.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*n));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    source.stop();
    REQUIRE(received == std::vector<float>{0.0f, 511.0f, -512.0f});
    REQUIRE(source.droppedSamples() == 0);
}

namespace {

/// Reads until @p count samples arrived or two seconds passed.
std::vector<float> drain(SpikerSerialSource &source, std::size_t count)
{
    std::vector<float> received;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (received.size() < count && std::chrono::steady_clock::now() < deadline) {
        std::array<float, 8> chunk{};
        auto n = source.read(chunk);
        REQUIRE(n.has_value());
        received.insert(received.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*n));
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return received;
}

/// Polls read() until it fails or two seconds passed.
Expected<std::size_t> readUntilFailure(SpikerSerialSource &source)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    std::array<float, 8> chunk{};
    auto n = source.read(chunk);
    while (n.has_value() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        n = source.read(chunk);
    }
    return n;
}

} // namespace

TEST_CASE("SpikerSerialSource keeps a serial failure until restarted", "[source][serial]")
{
    Pty pty;

    SpikerSerialSource source({.port = pty.name});
    REQUIRE(source.start().has_value());

    const std::array<std::uint8_t, 4> frames = {0x84, 0x00, 0x87, 0x7F};
    REQUIRE(::write(pty.master, frames.data(), frames.size()) == static_cast<ssize_t>(frames.size()));
    REQUIRE(drain(source, 2) == std::vector<float>{0.0f, 511.0f});

    pty.hangUp();

    auto failed = readUntilFailure(source);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code == ErrorCode::kSerialReadFailed);

    // Sticky: every later read reports the same failure.
    std::array<float, 8> chunk{};
    auto again = source.read(chunk);
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ErrorCode::kSerialReadFailed);

    source.stop();
    REQUIRE(source.read(chunk).error().code == ErrorCode::kNotInitialized);
}

TEST_CASE("A live scan ends with the serial failure", "[source][serial][pipeline]")
{
    Pty pty;

    auto cfg = pipeline::ScanConfig::Builder{}
                   .sampleRate(kSpikerSampleRate)
                   .windowSize(500)
                   .increment(50)
                   .thresholdCrossings(200)
                   .build();
    REQUIRE(cfg.has_value());
    auto scan = pipeline::EventPipeline::create(*cfg);
    REQUIRE(scan.has_value());

    SpikerSerialSource source({.port = pty.name});
    std::stop_source stopSource;

    std::jthread unplug([&pty, &stopSource](std::stop_token st) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        pty.hangUp();
        // Ends the scan if the failure never surfaces.
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if (!st.stop_requested())
            stopSource.request_stop();
    });

    auto report = scan->runLive(source, stopSource.get_token());
    const bool stoppedByFailure = !stopSource.stop_requested();
    unplug.request_stop();

    REQUIRE(stoppedByFailure);
    REQUIRE_FALSE(report.has_value());
    REQUIRE(report.error().code == ErrorCode::kSerialReadFailed);
}

} // namespace spk::eog
#endif
