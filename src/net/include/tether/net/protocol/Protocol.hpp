// /////////////////////////////////////////////////////////////////////////////
/// @file Protocol.hpp
/// @brief Datagram header layout and packet type identifiers.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/core/Types.hpp>
#include <tether/core/Constants.hpp>

namespace tether::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @enum PacketType
/// @brief Identifies the payload that follows the datagram header.
// /////////////////////////////////////////////////////////////////////////////
enum class PacketType : core::u8
{
    Connect       = 0x01,
    Reconnect     = 0x02,
    Input         = 0x03,
    Disconnect    = 0x04,
    Ping          = 0x05,
    Pong          = 0x06,
    AssignId      = 0x10,
    StateSnapshot = 0x11,
};

/// @brief Size of the header every datagram starts with:
///        magic (u32) | version (u8) | type (u8).
inline constexpr core::u32 kHeaderSize = 6;

/// @brief Encoded cost of one player in a snapshot: its state
///        (id u64, x i32, y i32, color u32) plus its ack (id u64, seq u32).
inline constexpr core::usize kSnapshotBytesPerPlayer = 20 + 12;

/// @brief Most players a single snapshot datagram can describe:
///        header, two u16 counts and the u64 server timestamp are fixed.
inline constexpr core::usize kMaxSnapshotPlayers =
    (core::kMaxDatagramSize - kHeaderSize - 2 - 2 - 8) / kSnapshotBytesPerPlayer;

[[nodiscard]] const char* toString(PacketType type) noexcept;

} // namespace tether::net::protocol
