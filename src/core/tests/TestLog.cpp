/**
 * @file TestLog.cpp
 * @brief Unit tests for the mts::core::Log façade.
 */

#include <catch2/catch_test_macros.hpp>

#include "mts/core/Log.hpp"

#include <string>
#include <vector>

using namespace mts::core;

namespace {

class CapturingLogger final : public ILogger {
public:
    struct Entry {
        LogLevel level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }

    std::vector<Entry> entries;
};

} // namespace

TEST_CASE("Log forwards tagged messages to the installed logger", "[core][log]")
{
    CapturingLogger sink;
    ScopedLogSink scope(&sink, LogLevel::kDebug);

    Log::warn("PeriodAligner", "dropped 2 samples");
    Log::info("plain message");

    REQUIRE(sink.entries.size() == 2);
    REQUIRE(sink.entries[0].level == LogLevel::kWarn);
    REQUIRE(sink.entries[0].tag == "PeriodAligner");
    REQUIRE(sink.entries[0].message == "dropped 2 samples");
    REQUIRE(sink.entries[1].tag == "mts");
}

TEST_CASE("Log filters messages below the minimum level", "[core][log]")
{
    CapturingLogger sink;
    ScopedLogSink scope(&sink, LogLevel::kWarn);

    Log::debug("x", "hidden");
    Log::info("x", "hidden");
    Log::error("x", "shown");

    REQUIRE(sink.entries.size() == 1);
    REQUIRE(sink.entries[0].level == LogLevel::kError);
}

TEST_CASE("ScopedLogSink restores the previous sink and level", "[core][log]")
{
    CapturingLogger outer;
    ScopedLogSink outerScope(&outer, LogLevel::kInfo);
    {
        CapturingLogger inner;
        ScopedLogSink innerScope(&inner, LogLevel::kError);
        REQUIRE(Log::logger() == &inner);
        REQUIRE_FALSE(Log::enabled(LogLevel::kWarn));
        Log::error("x", "inner");
        REQUIRE(inner.entries.size() == 1);
    }
    REQUIRE(Log::logger() == &outer);
    REQUIRE(Log::minLevel() == LogLevel::kInfo);

    Log::info("x", "outer");
    REQUIRE(outer.entries.size() == 1);
}

TEST_CASE("Log level names round-trip", "[core][log]")
{
    REQUIRE(logLevelName(LogLevel::kWarn) == "warn");
    REQUIRE(parseLogLevel("debug") == LogLevel::kDebug);
    REQUIRE(parseLogLevel("fatal") == LogLevel::kFatal);
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());
}
