/**
 * @file SerialPortPosix.cpp
 * @brief termios backend for the SpikerBox USB-serial link.
 *
 * The port is claimed with TIOCEXCL and switched to raw 8N1 so the
 * 2-byte sample frames reach the decoder untouched.
 */

#include "spk/eog/source/serial/SerialPort.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <optional>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace spk::eog::source {

namespace {

std::optional<speed_t> toSpeed(std::uint32_t baudRate) noexcept
{
    switch (baudRate) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default:     return std::nullopt;
    }
}

} // anonymous namespace

struct SerialPort::Impl {
    int fd = -1;

    void closeFd() noexcept
    {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

SerialPort::SerialPort()
    : _impl(new Impl)
{
}

SerialPort::~SerialPort()
{
    close();
    delete _impl;
}

SerialPort::SerialPort(SerialPort &&other) noexcept
    : _impl(other._impl)
{
    other._impl = new Impl;
}

SerialPort &SerialPort::operator=(SerialPort &&other) noexcept
{
    if (this == &other)
        return *this;
    close();
    delete _impl;
    _impl = other._impl;
    other._impl = new Impl;
    return *this;
}

ExpectedVoid SerialPort::open(const SerialConfig &config)
{
    if (_impl->fd >= 0) {
        return std::unexpected(
            Error::make(ErrorCode::kAlreadyRunning, "serial port is already open"));
    }

    const auto speed = toSpeed(config.baudRate);
    if (!speed) {
        return std::unexpected(
            Error::make(ErrorCode::kSerialPortConfigFailed,
                std::format("unsupported baud rate {}", config.baudRate)));
    }

    _impl->fd = ::open(config.portPath.c_str(), O_RDWR | O_NOCTTY);
    if (_impl->fd < 0) {
        return std::unexpected(
            Error::make(ErrorCode::kSerialPortNotFound,
                config.portPath + ": " + std::strerror(errno)));
    }

    if (::ioctl(_impl->fd, TIOCEXCL, nullptr) < 0) {
        _impl->closeFd();
        return std::unexpected(
            Error::make(ErrorCode::kSerialPortConfigFailed,
                config.portPath + " is in use by another process"));
    }

    struct termios tty{};
    if (::tcgetattr(_impl->fd, &tty) != 0) {
        const int err = errno;
        _impl->closeFd();
        return std::unexpected(
            Error::make(ErrorCode::kSerialPortConfigFailed,
                std::string("tcgetattr: ") + std::strerror(err)));
    }

    ::cfmakeraw(&tty);
    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tty.c_cflag |= CS8 | CREAD | CLOCAL;
    tty.c_cc[VMIN] = config.vmin;
    tty.c_cc[VTIME] = config.vtime;

    ::cfsetispeed(&tty, *speed);
    ::cfsetospeed(&tty, *speed);

    if (::tcsetattr(_impl->fd, TCSANOW, &tty) != 0) {
        const int err = errno;
        _impl->closeFd();
        return std::unexpected(
            Error::make(ErrorCode::kSerialPortConfigFailed,
                std::string("tcsetattr: ") + std::strerror(err)));
    }

    ::tcflush(_impl->fd, TCIOFLUSH);
    return {};
}

Expected<std::size_t> SerialPort::read(std::span<std::uint8_t> buffer)
{
    if (_impl->fd < 0) {
        return std::unexpected(
            Error::make(ErrorCode::kNotInitialized, "serial port is closed"));
    }

    const auto bytesRead = ::read(_impl->fd, buffer.data(), buffer.size());
    if (bytesRead < 0) {
        if (errno == EAGAIN || errno == EINTR)
            return std::size_t{0};
        return std::unexpected(
            Error::make(ErrorCode::kSerialReadFailed,
                std::string("read: ") + std::strerror(errno)));
    }

    // A hung-up tty reads as EOF forever, which VMIN=0 makes look like a timeout.
    if (bytesRead == 0) {
        pollfd pfd{.fd = _impl->fd, .events = POLLIN, .revents = 0};
        if (::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLHUP | POLLERR)) != 0) {
            return std::unexpected(
                Error::make(ErrorCode::kSerialReadFailed, "read: device hung up"));
        }
    }

    return static_cast<std::size_t>(bytesRead);
}

Expected<std::size_t> SerialPort::write(std::span<const std::uint8_t> data)
{
    if (_impl->fd < 0) {
        return std::unexpected(
            Error::make(ErrorCode::kNotInitialized, "serial port is closed"));
    }

    const auto bytesWritten = ::write(_impl->fd, data.data(), data.size());
    if (bytesWritten < 0) {
        return std::unexpected(
            Error::make(ErrorCode::kSerialWriteFailed,
                std::string("write: ") + std::strerror(errno)));
    }

    return static_cast<std::size_t>(bytesWritten);
}

void SerialPort::close() noexcept
{
    _impl->closeFd();
}

bool SerialPort::isOpen() const noexcept
{
    return _impl->fd >= 0;
}

} // namespace spk::eog::source
