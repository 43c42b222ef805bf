/**
 * @file Constants.hpp
 * @brief Compile-time constants of the simulation and the netcode.
 *
 * The board geometry and movement rule are shared verbatim by client and
 * server so that prediction replays stay bit-identical with the
 * authoritative simulation.  Values that deployments tune live in
 * tether::engine::Config and only take their defaults from here.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_CONSTANTS_HPP
    #define TETHER_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <array>

namespace tether::core {

// ---- Board & movement ----------------------------------------------------

inline constexpr i32   kBoardWidth               = 1024;
inline constexpr i32   kBoardHeight              = 768;
inline constexpr i32   kPlayerSize               = 20;
inline constexpr i32   kToolBarHeight            = 40;
inline constexpr i32   kPlayerSpeed              = 5;

inline constexpr i32   kMinX                     = kPlayerSize;
inline constexpr i32   kMaxX                     = kBoardWidth - kPlayerSize;
inline constexpr i32   kMinY                     = kPlayerSize;
inline constexpr i32   kMaxY                     = kBoardHeight - kPlayerSize - kToolBarHeight;

/// @brief Player colors as packed 0xRRGGBB.
inline constexpr std::array<u32, 9> kPlayerPalette = {
    0xFF1717u, // red
    0x17FF17u, // green
    0x1717FFu, // blue
    0xFFFF17u, // yellow
    0xFF7F17u, // orange
    0x7F17FFu, // purple
    0x17FFFFu, // cyan
    0xFF17FFu, // magenta
    0xFF7F7Fu, // pink
};

// ---- Buffers -------------------------------------------------------------

inline constexpr usize kServerHistoryCapacity    = 60;
inline constexpr usize kInterpolationCapacity    = 30;
inline constexpr usize kPredictionCapacity       = 128;
/// Largest UDP payload over IPv4; receive buffers are sized to it so no
/// datagram is ever truncated by recvfrom.
inline constexpr usize kMaxDatagramSize          = 65507;

// ---- Networking defaults -------------------------------------------------

inline constexpr u16   kDefaultPort              = 9000;
inline constexpr u32   kProtocolMagic            = 0x54544852; // "TTHR"
inline constexpr u8    kProtocolVersion          = 1;

inline constexpr i64   kJitterMs                 = 5;
inline constexpr u32   kMaxLatencyMs             = 1000;
inline constexpr u32   kLatencyStepMs            = 10;
inline constexpr u32   kMaxPacketLossPercent     = 100;

// ---- Timing defaults -----------------------------------------------------

inline constexpr f64   kSessionTimeoutSec        = 10.0;
inline constexpr f64   kGracePeriodSec           = 10.0;
inline constexpr u32   kBroadcastIntervalMs      = 16;
inline constexpr u32   kCleanupIntervalMs        = 1000;
inline constexpr u32   kPingIntervalMs           = 1000;

inline constexpr f64   kInterpolationDelaySec    = 0.1;
inline constexpr u32   kReconcileGapThreshold    = 5;
inline constexpr f64   kReconcileWindowSec       = 0.5;

} // namespace tether::core

#endif // TETHER_CORE_CONSTANTS_HPP
