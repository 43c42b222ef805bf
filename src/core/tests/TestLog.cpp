/**
 * @file TestLog.cpp
 * @brief Unit tests for core::Log routing and filtering.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/core/Log.hpp"

#include <string>
#include <vector>

namespace tether::core {

namespace {

struct Entry
{
    LogLevel    level;
    std::string tag;
    std::string message;
};

class CapturingLogger final : public ILogger
{
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back(Entry{level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

/// Installs a capturing sink for the lifetime of a test case.
struct ScopedCapture
{
    ScopedCapture()
    {
        Log::setLogger(&logger);
        Log::setMinLevel(LogLevel::kDebug);
    }

    ~ScopedCapture()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(LogLevel::kInfo);
    }

    CapturingLogger logger;
};

} // anonymous namespace

TEST_CASE("Log routes messages to the installed sink", "[core][log]")
{
    ScopedCapture capture;

    Log::info("session", "player joined");
    Log::warn("oversized");

    REQUIRE(capture.logger.entries.size() == 2);
    REQUIRE(capture.logger.entries[0].level == LogLevel::kInfo);
    REQUIRE(capture.logger.entries[0].tag == "session");
    REQUIRE(capture.logger.entries[0].message == "player joined");
    REQUIRE(capture.logger.entries[1].tag == "tether");
}

TEST_CASE("Log drops messages below the minimum level", "[core][log]")
{
    ScopedCapture capture;
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("net", "noise");
    Log::info("net", "noise");
    Log::error("net", "boom");

    REQUIRE(capture.logger.entries.size() == 1);
    REQUIRE(capture.logger.entries[0].level == LogLevel::kError);
    REQUIRE_FALSE(Log::enabled(LogLevel::kInfo));
    REQUIRE(Log::enabled(LogLevel::kFatal));
}

TEST_CASE("parseLogLevel accepts level names in any case", "[core][log]")
{
    REQUIRE(parseLogLevel("debug") == LogLevel::kDebug);
    REQUIRE(parseLogLevel("WARN") == LogLevel::kWarn);
    REQUIRE(parseLogLevel("Error") == LogLevel::kError);
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());
    REQUIRE_FALSE(parseLogLevel("").has_value());
    REQUIRE(toString(LogLevel::kFatal) == "fatal");
}

} // namespace tether::core
