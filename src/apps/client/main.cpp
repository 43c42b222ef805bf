// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Headless Tether client: a random-walk bot.
///
/// Usage: tether_client [host:port] [latencyMs] [packetLossPercent] [--perf]
/// TETHER_LOG_LEVEL overrides the log level as for the server.
///
/// Drives GameClient::step at 60 Hz with a random direction every few
/// frames and logs the prediction error once per second.  With --perf it
/// cycles through the analyzer's network conditions and logs the
/// aggregated results before exiting.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/engine/Config.hpp>
#include <tether/engine/GameClient.hpp>
#include <tether/net/transport/Endpoint.hpp>
#include <tether/core/Log.hpp>
#include <tether/core/Types.hpp>

#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstdio>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

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

std::string formatResult(const tether::engine::ConditionResult& r)
{
    char line[160];
    std::snprintf(line, sizeof(line),
                  "%-10s %4ums %3u%%  avg %6.2f  max %6.2f  samples %llu  rtt %6.1fms",
                  r.condition.name.c_str(),
                  r.condition.latencyMs,
                  r.condition.packetLossPercent,
                  static_cast<double>(r.avgError),
                  static_cast<double>(r.maxError),
                  static_cast<unsigned long long>(r.sampleCount),
                  static_cast<double>(r.avgRoundTripMs));
    return line;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    using tether::core::Log;
    namespace protocol = tether::net::protocol;

    Log::info("=== Tether Client ===");

    std::string_view serverText = "127.0.0.1:9000";
    std::vector<std::string_view> numbers;
    bool perfRun = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--perf")
        {
            perfRun = true;
        }
        else if (arg.find(':') != std::string_view::npos)
        {
            serverText = arg;
        }
        else
        {
            numbers.push_back(arg);
        }
    }

    auto server = tether::net::transport::Endpoint::parse(serverText);
    if (!server)
    {
        Log::error("client", server.error().describe());
        return 1;
    }

    auto builder = tether::engine::Config::Builder{};
    for (std::size_t i = 0; i < numbers.size() && i < 2; ++i)
    {
        const auto value = parseUnsigned(numbers[i]);
        if (!value)
        {
            Log::error("client", "invalid number: " + std::string{numbers[i]});
            return 1;
        }
        if (i == 0)
            builder.latencyMs(*value);
        else
            builder.packetLossPercent(*value);
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

    tether::engine::GameClient client{config, *server};

    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    const auto elapsed = [start] {
        return std::chrono::duration<tether::core::f64>(Clock::now() - start).count();
    };

    auto result = client.init(elapsed());
    if (!result)
    {
        Log::error("client", "init failed: " + result.error().describe());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pickDirection{0, 3};
    constexpr int kFramesPerMove = 6;
    constexpr auto kFrame = std::chrono::microseconds{16'667};

    bool perfStarted = false;
    tether::core::f64 lastReport = 0.0;
    int frame = 0;
    auto nextFrame = Clock::now();

    while (!gStopRequested)
    {
        const auto now = elapsed();

        std::array<protocol::Direction, 1> pressed{};
        std::span<const protocol::Direction> input{};
        if (++frame % kFramesPerMove == 0)
        {
            pressed[0] = static_cast<protocol::Direction>(pickDirection(rng));
            input = pressed;
        }

        client.step(input, now);

        const auto view = client.view(now);
        if (perfRun && !perfStarted && view.connected)
        {
            client.startPerformanceRun(now);
            perfStarted = true;
        }
        if (perfStarted && !client.analyzer().running())
        {
            for (const auto& r : client.analyzer().results())
            {
                Log::info("perf", formatResult(r));
            }
            break;
        }

        if (now - lastReport >= 1.0)
        {
            lastReport = now;
            Log::info("client", "pos " + protocol::toString(view.localPosition) +
                                " players " + std::to_string(view.remotes.size() + (view.localId ? 1 : 0)) +
                                " error " + std::to_string(view.predictionError) +
                                " rtt " + std::to_string(view.roundTripMs) + "ms");
        }

        nextFrame += kFrame;
        std::this_thread::sleep_until(nextFrame);
    }

    client.shutdown(elapsed());
    Log::info("Client exited cleanly");
    return 0;
}
