/**
 * @file Log.hpp
 * @brief Tagged logging facade with a swappable sink.
 *
 * Engine stages log under their own tag ("PeriodAligner",
 * "StatisticsReport"...). Messages below the minimum level are dropped
 * before reaching the sink. The default sink prints to stderr; the
 * command-line driver raises or lowers the level, tests install a
 * capturing sink through ScopedLogSink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_CORE_LOG_HPP
    #define MTS_CORE_LOG_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace mts::core {

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
 * @brief Inverse of logLevelName(); empty for an unknown name.
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

/**
 * @brief Destination of log entries.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger; nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    [[nodiscard]] static ILogger *logger();

    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("mts", msg); }
    static void info (std::string_view msg) { info ("mts", msg); }
    static void warn (std::string_view msg) { warn ("mts", msg); }
    static void error(std::string_view msg) { error("mts", msg); }
    static void fatal(std::string_view msg) { fatal("mts", msg); }
};

/**
 * @brief Installs a sink and minimum level for the lifetime of the scope,
 *        then puts the previous ones back.
 */
class ScopedLogSink final {
public:
    ScopedLogSink(ILogger *logger, LogLevel minLevel)
        : _previousLogger(Log::logger()), _previousLevel(Log::minLevel())
    {
        Log::setLogger(logger);
        Log::setMinLevel(minLevel);
    }

    ~ScopedLogSink()
    {
        Log::setLogger(_previousLogger);
        Log::setMinLevel(_previousLevel);
    }

    ScopedLogSink(const ScopedLogSink &) = delete;
    ScopedLogSink &operator=(const ScopedLogSink &) = delete;

private:
    ILogger *_previousLogger;
    LogLevel _previousLevel;
};

} // namespace mts::core

#endif // MTS_CORE_LOG_HPP
