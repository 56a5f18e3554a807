/**
 * @file Log.hpp
 * @brief Process-wide diagnostics for the SpikerControl library and tools.
 *
 * Everything below the tools reports through Log rather than printing:
 * stdout stays reserved for results (detected events, confusion matrices).
 * Messages carry a subsystem tag and are dropped below the level the
 * tools set from --log-level (info by default).
 *
 * Output goes to stderr as "[elapsed s][LEVEL][tag] message" unless a
 * sink is installed with Log::setLogger(); the unit tests install one to
 * check which failures get reported.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SPK_CORE_LOG_HPP
    #define SPK_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace spk::core {

/// Ordered: a message is kept when its level is >= Log::minLevel().
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Destination for messages that passed the level filter.
 *
 * write() may be called from the serial worker thread and the scanning
 * thread at once, so an implementation must serialise its output.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @param tag     Subsystem: "scan", "train", "serial", "record", a tool name...
     * @param message Already formatted, without trailing newline
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static entry point; never instantiated.
 *
 * The sink pointer and the level are atomics, so both can be changed
 * while other threads log. Messages without a tag are filed under "spk".
 */
class Log final {
public:
    Log() = delete;

    /// Installs @p logger (not owned); nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("spk", msg); }
    static void info (std::string_view msg) { info ("spk", msg); }
    static void warn (std::string_view msg) { warn ("spk", msg); }
    static void error(std::string_view msg) { error("spk", msg); }
    static void fatal(std::string_view msg) { fatal("spk", msg); }
};

/**
 * @brief Maps a --log-level value ("debug", "info", "warn", "error",
 *        "fatal") to its level.
 * @return false, leaving @p out untouched, for anything else
 */
[[nodiscard]] bool parseLogLevel(std::string_view text, LogLevel &out) noexcept;

} // namespace spk::core

#endif // SPK_CORE_LOG_HPP
