// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Tether dedicated server entry-point.
///
/// Usage: tether_server [port] [latencyMs] [packetLossPercent]
/// TETHER_LOG_LEVEL (debug, info, warn, error) overrides the log level.
/// Runs until SIGINT or SIGTERM.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/engine/Config.hpp>
#include <tether/engine/GameServer.hpp>
#include <tether/core/Log.hpp>
#include <tether/core/Types.hpp>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> gStopRequested{false};

void onSignal(int)
{
    gStopRequested = true;
}

std::optional<tether::core::u32> parseUnsigned(std::string_view text)
{
    tether::core::u32 value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    using tether::core::Log;

    Log::info("=== Tether Server ===");

    auto builder = tether::engine::Config::Builder{};
    const std::string_view names[] = {"port", "latencyMs", "packetLossPercent"};

    for (int i = 1; i < argc && i <= 3; ++i)
    {
        const auto value = parseUnsigned(argv[i]);
        if (!value || (i == 1 && *value > 0xFFFF))
        {
            Log::error("server", std::string{"invalid "} + std::string{names[i - 1]} + ": " + argv[i]);
            return 1;
        }
        switch (i)
        {
            case 1: builder.port(static_cast<tether::core::u16>(*value)); break;
            case 2: builder.latencyMs(*value); break;
            case 3: builder.packetLossPercent(*value); break;
        }
    }

    if (const char* level = std::getenv("TETHER_LOG_LEVEL"))
    {
        const auto parsed = tether::core::parseLogLevel(level);
        if (!parsed)
        {
            Log::warn(std::string{"ignoring TETHER_LOG_LEVEL="} + level);
        }
        else
        {
            builder.logLevel(*parsed);
        }
    }

    const auto config = builder.build();
    Log::setMinLevel(config.logLevel());

    tether::engine::GameServer server{config};

    auto result = server.start();
    if (!result)
    {
        Log::error("server", "startup failed: " + result.error().describe());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    while (!gStopRequested)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }

    server.stop();
    Log::info("Server exited cleanly");
    return 0;
}
