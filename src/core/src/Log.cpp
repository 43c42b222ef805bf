/**
 * @file Log.cpp
 * @brief Level filtering, level names and the stderr sink.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "tether/core/Log.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <mutex>

namespace tether::core {

namespace {

constexpr std::array<std::string_view, 5> kLevelNames{"debug", "info", "warn", "error", "fatal"};

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const f64 uptime = std::chrono::duration<f64>(Clock::now() - start_).count();

        // Level names are padded and upper-cased so columns line up.
        char levelField[6] = "     ";
        const std::string_view name = toString(level);
        for (usize i = 0; i < name.size() && i < 5; ++i)
            levelField[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[i])));

        const std::lock_guard lock{mutex_};
        std::fprintf(stderr, "[%8.3f][%s][%.*s] %.*s\n",
                     uptime, levelField,
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    }

private:
    const TimePoint start_ = Clock::now();
    std::mutex      mutex_;
};

StderrLogger           gStderr;
std::atomic<ILogger *> gSink{&gStderr};
std::atomic<LogLevel>  gThreshold{LogLevel::kInfo};

} // anonymous namespace

std::string_view toString(LogLevel level) noexcept
{
    const auto index = static_cast<usize>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : "?";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept
{
    for (usize i = 0; i < kLevelNames.size(); ++i)
    {
        const std::string_view name = kLevelNames[i];
        if (name.size() != text.size())
            continue;

        bool same = true;
        for (usize c = 0; c < name.size() && same; ++c)
            same = std::tolower(static_cast<unsigned char>(text[c])) == name[c];
        if (same)
            return static_cast<LogLevel>(i);
    }
    return std::nullopt;
}

void Log::setLogger(ILogger *logger) noexcept { gSink = logger != nullptr ? logger : &gStderr; }
void Log::setMinLevel(LogLevel level) noexcept { gThreshold = level; }
LogLevel Log::minLevel() noexcept { return gThreshold.load(); }

bool Log::enabled(LogLevel level) noexcept
{
    return level >= gThreshold.load(std::memory_order_relaxed);
}

void Log::write(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!enabled(level))
        return;
    gSink.load()->write(level, tag, msg);
}

} // namespace tether::core
