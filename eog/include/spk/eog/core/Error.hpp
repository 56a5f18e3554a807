/**
 * @file Error.hpp
 * @brief Structured error handling via std::expected for the EOG pipeline.
 *
 * Every fallible operation in the pipeline returns an Expected<T> instead
 * of throwing exceptions or returning boolean success flags. Per-window
 * errors (kInsufficientData, kInvalidWindow, kDimensionMismatch) are
 * recoverable: the scanner records them and moves on. Configuration and
 * I/O errors are reported before any scanning starts.
 *
 * @see https://en.cppreference.com/w/cpp/utility/expected
 */

#pragma once

#include <cstdint>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace spk::eog {

/**
 * @brief Exhaustive catalog of error conditions in the EOG pipeline.
 */
enum class ErrorCode : std::uint8_t {
    kInvalidConfiguration,
    kInsufficientData,
    kInvalidWindow,
    kDimensionMismatch,
    kFileNotFound,
    kFileParseError,
    kIoError,
    kInvalidArgument,
    kOutOfRange,
    kEmptyInput,
    kNotInitialized,
    kAlreadyRunning,
    kSerialPortNotFound,
    kSerialPortConfigFailed,
    kSerialReadFailed,
    kSerialWriteFailed,
    kUnknown
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kInvalidConfiguration:   return "InvalidConfiguration";
        case ErrorCode::kInsufficientData:       return "InsufficientData";
        case ErrorCode::kInvalidWindow:          return "InvalidWindow";
        case ErrorCode::kDimensionMismatch:      return "DimensionMismatch";
        case ErrorCode::kFileNotFound:           return "FileNotFound";
        case ErrorCode::kFileParseError:         return "FileParseError";
        case ErrorCode::kIoError:                return "IoError";
        case ErrorCode::kInvalidArgument:        return "InvalidArgument";
        case ErrorCode::kOutOfRange:             return "OutOfRange";
        case ErrorCode::kEmptyInput:             return "EmptyInput";
        case ErrorCode::kNotInitialized:         return "NotInitialized";
        case ErrorCode::kAlreadyRunning:         return "AlreadyRunning";
        case ErrorCode::kSerialPortNotFound:     return "SerialPortNotFound";
        case ErrorCode::kSerialPortConfigFailed: return "SerialPortConfigFailed";
        case ErrorCode::kSerialReadFailed:       return "SerialReadFailed";
        case ErrorCode::kSerialWriteFailed:      return "SerialWriteFailed";
        case ErrorCode::kUnknown:                return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Structured error with code, message, and source location.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::source_location location;

    /**
     * @brief Factory method for constructing an Error at the call site.
     *
     * @param code    The error code identifying the failure category
     * @param message A descriptive message (may include runtime context)
     * @param loc     Automatically captured source location
     * @return A fully constructed Error value
     *
     * @code
     *   return std::unexpected(Error::make(ErrorCode::kFileNotFound, "rec01.wav"));
     * @endcode
     */
    [[nodiscard]] static Error make(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current())
    {
        return Error{code, std::move(message), loc};
    }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;
};

/**
 * @brief Alias for std::expected<T, Error> used throughout the pipeline.
 *
 * @tparam T The success value type
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Convenience alias for operations that produce no value on success.
 */
using ExpectedVoid = Expected<void>;

} // namespace spk::eog
