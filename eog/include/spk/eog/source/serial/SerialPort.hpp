/**
 * @file SerialPort.hpp
 * @brief RAII serial port handle (POSIX termios).
 *
 * All operations return Expected<> for structured error handling.
 *
 * @see SpikerSerialSource
 */

#pragma once

#include "spk/eog/core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace spk::eog::source {

/**
 * @brief Configuration parameters for opening a serial port.
 */
struct SerialConfig {
    std::string portPath;
    std::uint32_t baudRate = 230400;
    std::uint8_t vmin = 0;
    /// Read timeout in tenths of a second.
    std::uint8_t vtime = 1;
};

/**
 * @brief RAII serial port handle, 8N1 raw mode.
 *
 * The destructor closes the port. Move-only.
 *
 * @code
 *   SerialPort port;
 *   if (auto ok = port.open({.portPath = "/dev/ttyACM0"}); ok) {
 *       std::array<std::uint8_t, 256> buf;
 *       auto bytesRead = port.read(buf);
 *   }
 * @endcode
 */
class SerialPort {
public:
    SerialPort();
    ~SerialPort();

    SerialPort(const SerialPort &) = delete;
    SerialPort &operator=(const SerialPort &) = delete;
    SerialPort(SerialPort &&other) noexcept;
    SerialPort &operator=(SerialPort &&other) noexcept;

    /**
     * @brief Opens the port with exclusive access and configures it.
     *
     * @return void, kAlreadyRunning, kSerialPortNotFound,
     *         kSerialPortConfigFailed (also for an unsupported baud rate)
     */
    [[nodiscard]] ExpectedVoid open(const SerialConfig &config);

    /**
     * @brief Reads up to buffer.size() bytes (may return 0 on timeout).
     *
     * @return The byte count, or kSerialReadFailed for a read error or a
     *         device that hung up (unplugged, or the pty master closed)
     */
    [[nodiscard]] Expected<std::size_t> read(std::span<std::uint8_t> buffer);

    [[nodiscard]] Expected<std::size_t> write(std::span<const std::uint8_t> data);

    /// Closes the port (idempotent).
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept;

private:
    struct Impl;
    Impl *_impl;
};

} // namespace spk::eog::source
