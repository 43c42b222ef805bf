// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Runtime configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises every tunable of the server and the client.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <tether/core/Types.hpp>
#include <tether/core/Constants.hpp>
#include <tether/core/Log.hpp>

#include <chrono>

namespace tether::engine {

/// @brief Immutable runtime configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& port(core::u16 port) noexcept;
        Builder& broadcastIntervalMs(core::u32 ms) noexcept;
        Builder& cleanupIntervalMs(core::u32 ms) noexcept;
        Builder& pingIntervalMs(core::u32 ms) noexcept;
        Builder& sessionTimeoutSec(core::f64 seconds) noexcept;
        Builder& gracePeriodSec(core::f64 seconds) noexcept;
        Builder& latencyMs(core::u32 ms) noexcept;
        Builder& packetLossPercent(core::u32 percent) noexcept;
        Builder& reconcileGapThreshold(core::u32 sequences) noexcept;
        Builder& reconcileWindowSec(core::f64 seconds) noexcept;
        Builder& interpolationDelaySec(core::f64 seconds) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::u16      port_{core::kDefaultPort};
        core::u32      broadcastIntervalMs_{core::kBroadcastIntervalMs};
        core::u32      cleanupIntervalMs_{core::kCleanupIntervalMs};
        core::u32      pingIntervalMs_{core::kPingIntervalMs};
        core::f64      sessionTimeoutSec_{core::kSessionTimeoutSec};
        core::f64      gracePeriodSec_{core::kGracePeriodSec};
        core::u32      latencyMs_{0};
        core::u32      packetLossPercent_{0};
        core::u32      reconcileGapThreshold_{core::kReconcileGapThreshold};
        core::f64      reconcileWindowSec_{core::kReconcileWindowSec};
        core::f64      interpolationDelaySec_{core::kInterpolationDelaySec};
        core::LogLevel logLevel_{core::LogLevel::kInfo};
    };

    [[nodiscard]] core::u16      port()                  const noexcept { return port_; }
    [[nodiscard]] core::u32      broadcastIntervalMs()   const noexcept { return broadcastIntervalMs_; }
    [[nodiscard]] core::u32      cleanupIntervalMs()     const noexcept { return cleanupIntervalMs_; }
    [[nodiscard]] core::u32      pingIntervalMs()        const noexcept { return pingIntervalMs_; }
    [[nodiscard]] core::f64      sessionTimeoutSec()     const noexcept { return sessionTimeoutSec_; }
    [[nodiscard]] core::f64      gracePeriodSec()        const noexcept { return gracePeriodSec_; }
    [[nodiscard]] core::u32      latencyMs()             const noexcept { return latencyMs_; }
    [[nodiscard]] core::u32      packetLossPercent()     const noexcept { return packetLossPercent_; }
    [[nodiscard]] core::u32      reconcileGapThreshold() const noexcept { return reconcileGapThreshold_; }
    [[nodiscard]] core::f64      reconcileWindowSec()    const noexcept { return reconcileWindowSec_; }
    [[nodiscard]] core::f64      interpolationDelaySec() const noexcept { return interpolationDelaySec_; }
    [[nodiscard]] core::LogLevel logLevel()              const noexcept { return logLevel_; }

    /// @brief Session timeout as a clock duration.
    [[nodiscard]] core::Duration sessionTimeout() const noexcept;

    /// @brief Reconnect grace period as a clock duration.
    [[nodiscard]] core::Duration gracePeriod() const noexcept;

private:
    friend class Builder;

    core::u16      port_{core::kDefaultPort};
    core::u32      broadcastIntervalMs_{core::kBroadcastIntervalMs};
    core::u32      cleanupIntervalMs_{core::kCleanupIntervalMs};
    core::u32      pingIntervalMs_{core::kPingIntervalMs};
    core::f64      sessionTimeoutSec_{core::kSessionTimeoutSec};
    core::f64      gracePeriodSec_{core::kGracePeriodSec};
    core::u32      latencyMs_{0};
    core::u32      packetLossPercent_{0};
    core::u32      reconcileGapThreshold_{core::kReconcileGapThreshold};
    core::f64      reconcileWindowSec_{core::kReconcileWindowSec};
    core::f64      interpolationDelaySec_{core::kInterpolationDelaySec};
    core::LogLevel logLevel_{core::LogLevel::kInfo};
};

} // namespace tether::engine
