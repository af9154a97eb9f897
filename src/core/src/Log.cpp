/**
 * @file Log.cpp
 * @brief Level filtering and the stderr sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "mts/core/Log.hpp"

#include <cstdio>

namespace mts::core {

namespace {

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const std::string_view name = logLevelName(level);
        std::fprintf(
            stderr,
            "mts %-5.*s %.*s: %.*s\n",
            static_cast<int>(name.size()), name.data(),
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }
};

StderrLogger gStderrLogger;
ILogger     *gLogger   = &gStderrLogger;
LogLevel     gMinLevel = LogLevel::kInfo;

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel)
        return;
    gLogger->write(level, tag, msg);
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept
{
    for (const LogLevel level : {LogLevel::kDebug, LogLevel::kInfo, LogLevel::kWarn,
                                 LogLevel::kError, LogLevel::kFatal}) {
        if (logLevelName(level) == name)
            return level;
    }
    return std::nullopt;
}

void Log::setLogger(ILogger *logger)   { gLogger = logger ? logger : &gStderrLogger; }
ILogger *Log::logger()                 { return gLogger; }
void Log::setMinLevel(LogLevel level)  { gMinLevel = level; }
LogLevel Log::minLevel()               { return gMinLevel; }
bool Log::enabled(LogLevel level)      { return level >= gMinLevel; }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace mts::core
