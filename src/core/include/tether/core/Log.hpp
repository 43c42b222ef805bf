/**
 * @file Log.hpp
 * @brief Process-wide logger with a pluggable sink.
 *
 * Every subsystem logs through the static Log functions with a short tag
 * ("net", "session", "server", "client", "prediction", "perf", "worker").
 * Messages below the minimum level are dropped before the sink is called.
 * Out of the box the sink prints
 *
 *     [  12.345][INFO ][session] player 3 connected
 *
 * to stderr, the first field being seconds since the first log call.
 * Tests swap the sink with Log::setLogger() to capture output.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_LOG_HPP
    #define TETHER_CORE_LOG_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace tether::core {

enum class LogLevel : u8 {
    kDebug,
    kInfo,
    kWarn,
    kError,
    kFatal
};

[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

/// Accepts "debug", "info", "warn", "error" and "fatal" in any case.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept;

/// Receives every message that passed the level filter.  May be called from
/// several threads at once.
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

class Log final {
public:
    Log() = delete;

    /// The sink is not owned; nullptr restores the stderr sink.
    static void setLogger(ILogger *logger) noexcept;
    static void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel minLevel() noexcept;

    /// Lets callers skip building a message that would be dropped.
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void write(LogLevel level, std::string_view tag, std::string_view msg);

    static void debug(std::string_view tag, std::string_view msg) { write(LogLevel::kDebug, tag, msg); }
    static void info (std::string_view tag, std::string_view msg) { write(LogLevel::kInfo,  tag, msg); }
    static void warn (std::string_view tag, std::string_view msg) { write(LogLevel::kWarn,  tag, msg); }
    static void error(std::string_view tag, std::string_view msg) { write(LogLevel::kError, tag, msg); }
    static void fatal(std::string_view tag, std::string_view msg) { write(LogLevel::kFatal, tag, msg); }

    // Untagged messages belong to the executable itself.
    static void info (std::string_view msg) { info ("tether", msg); }
    static void warn (std::string_view msg) { warn ("tether", msg); }
    static void error(std::string_view msg) { error("tether", msg); }
};

} // namespace tether::core

#endif // TETHER_CORE_LOG_HPP
