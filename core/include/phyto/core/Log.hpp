/**
 * @file Log.hpp
 * @brief Tagged logging with a process-wide minimum level.
 *
 * Messages go through the static Log class to the installed ILogger
 * (stderr by default, one "[LEVEL][tag] message" line each). Tags name
 * the emitting layer: "dsp", "feature", "data" or "app".
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_CORE_LOG_HPP
    #define PHYTO_CORE_LOG_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace phyto::core {

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

[[nodiscard]] constexpr std::string_view logLevelName(LogLevel level) noexcept
{
    switch (level) {
        case LogLevel::kDebug: return "debug";
        case LogLevel::kInfo:  return "info";
        case LogLevel::kWarn:  return "warn";
        case LogLevel::kError: return "error";
        case LogLevel::kFatal: return "fatal";
    }
    return "unknown";
}

/**
 * @brief Inverse of logLevelName(); nullopt for an unknown name.
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "dsp", "data", "feature").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging entry point.
 *
 * Batch workers log concurrently; the default logger serialises writes.
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    /// True when a message at @p level would reach the logger.
    [[nodiscard]] static bool enabled(LogLevel level);
};

} // namespace phyto::core

#endif // PHYTO_CORE_LOG_HPP
