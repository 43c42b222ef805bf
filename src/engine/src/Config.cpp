// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/engine/Config.hpp>

#include <algorithm>

namespace tether::engine {

namespace {

core::Duration toDuration(core::f64 seconds) noexcept
{
    return std::chrono::duration_cast<core::Duration>(std::chrono::duration<core::f64>(seconds));
}

} // anonymous namespace

Config::Builder& Config::Builder::port(core::u16 port) noexcept
{
    port_ = port;
    return *this;
}

Config::Builder& Config::Builder::broadcastIntervalMs(core::u32 ms) noexcept
{
    broadcastIntervalMs_ = std::max<core::u32>(ms, 1);
    return *this;
}

Config::Builder& Config::Builder::cleanupIntervalMs(core::u32 ms) noexcept
{
    cleanupIntervalMs_ = std::max<core::u32>(ms, 1);
    return *this;
}

Config::Builder& Config::Builder::pingIntervalMs(core::u32 ms) noexcept
{
    pingIntervalMs_ = std::max<core::u32>(ms, 1);
    return *this;
}

Config::Builder& Config::Builder::sessionTimeoutSec(core::f64 seconds) noexcept
{
    sessionTimeoutSec_ = std::max(seconds, 0.0);
    return *this;
}

Config::Builder& Config::Builder::gracePeriodSec(core::f64 seconds) noexcept
{
    gracePeriodSec_ = std::max(seconds, 0.0);
    return *this;
}

Config::Builder& Config::Builder::latencyMs(core::u32 ms) noexcept
{
    latencyMs_ = std::min(ms, core::kMaxLatencyMs);
    return *this;
}

Config::Builder& Config::Builder::packetLossPercent(core::u32 percent) noexcept
{
    packetLossPercent_ = std::min(percent, core::kMaxPacketLossPercent);
    return *this;
}

Config::Builder& Config::Builder::reconcileGapThreshold(core::u32 sequences) noexcept
{
    reconcileGapThreshold_ = sequences;
    return *this;
}

Config::Builder& Config::Builder::reconcileWindowSec(core::f64 seconds) noexcept
{
    reconcileWindowSec_ = std::max(seconds, 0.0);
    return *this;
}

Config::Builder& Config::Builder::interpolationDelaySec(core::f64 seconds) noexcept
{
    interpolationDelaySec_ = std::max(seconds, 0.0);
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    logLevel_ = level;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg.port_                  = port_;
    cfg.broadcastIntervalMs_   = broadcastIntervalMs_;
    cfg.cleanupIntervalMs_     = cleanupIntervalMs_;
    cfg.pingIntervalMs_        = pingIntervalMs_;
    cfg.sessionTimeoutSec_     = sessionTimeoutSec_;
    cfg.gracePeriodSec_        = gracePeriodSec_;
    cfg.latencyMs_             = latencyMs_;
    cfg.packetLossPercent_     = packetLossPercent_;
    cfg.reconcileGapThreshold_ = reconcileGapThreshold_;
    cfg.reconcileWindowSec_    = reconcileWindowSec_;
    cfg.interpolationDelaySec_ = interpolationDelaySec_;
    cfg.logLevel_              = logLevel_;
    return cfg;
}

core::Duration Config::sessionTimeout() const noexcept { return toDuration(sessionTimeoutSec_); }
core::Duration Config::gracePeriod() const noexcept    { return toDuration(gracePeriodSec_); }

} // namespace tether::engine
