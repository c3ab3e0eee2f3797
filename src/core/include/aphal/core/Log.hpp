/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  The host process installs
 * its own sink via Log::setLogger() during bootstrap.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef APHAL_CORE_LOG_HPP
    #define APHAL_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace aphal::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Component tag (e.g. "HostapdHal", "DeathMonitor").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the HAL.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 * Async callbacks log from the event loop thread concurrently with callers.
 */
class Log final {
public:
    Log() = delete;

    static void     setLogger(ILogger *logger);
    static void     setMinLevel(LogLevel level);
    static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("aphal", msg); }
    static void info (std::string_view msg) { info ("aphal", msg); }
    static void warn (std::string_view msg) { warn ("aphal", msg); }
    static void error(std::string_view msg) { error("aphal", msg); }
    static void fatal(std::string_view msg) { fatal("aphal", msg); }
};

} // namespace aphal::core

#endif // APHAL_CORE_LOG_HPP
