// /////////////////////////////////////////////////////////////////////////////
/// @file Messages.hpp
/// @brief Typed datagram messages and their binary codec.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/protocol/Protocol.hpp>
#include <tether/net/protocol/Snapshot.hpp>
#include <tether/net/protocol/Types.hpp>
#include <tether/core/Expected.hpp>

#include <span>
#include <variant>
#include <vector>

namespace tether::net::protocol {

/// @brief Client asks for a fresh session.
struct ConnectMessage
{
    [[nodiscard]] bool operator==(const ConnectMessage&) const noexcept = default;
};

/// @brief Client asks to resume @c previousId at @c position.
struct ReconnectMessage
{
    PlayerId previousId{kInvalidPlayerId};
    Position position{};

    [[nodiscard]] bool operator==(const ReconnectMessage&) const noexcept = default;
};

/// @brief One sequenced movement command.
struct InputMessage
{
    PlayerInput input{};

    [[nodiscard]] bool operator==(const InputMessage&) const noexcept = default;
};

/// @brief Explicit leave notice. The server echoes it back as the ack.
struct DisconnectMessage
{
    [[nodiscard]] bool operator==(const DisconnectMessage&) const noexcept = default;
};

/// @brief Keep-alive message carrying the sender's clock.
struct PingMessage
{
    core::u64 timestampMs{0};

    [[nodiscard]] bool operator==(const PingMessage&) const noexcept = default;
};

/// @brief Echo of a PingMessage timestamp.
struct PongMessage
{
    core::u64 timestampMs{0};

    [[nodiscard]] bool operator==(const PongMessage&) const noexcept = default;
};

/// @brief Server tells a client which id it was assigned.
struct PlayerIdMessage
{
    PlayerId id{kInvalidPlayerId};

    [[nodiscard]] bool operator==(const PlayerIdMessage&) const noexcept = default;
};

/// @brief Periodic authoritative state broadcast.
struct SnapshotMessage
{
    GameStateSnapshot snapshot{};

    [[nodiscard]] bool operator==(const SnapshotMessage&) const = default;
};

using Message = std::variant<ConnectMessage,
                             ReconnectMessage,
                             InputMessage,
                             DisconnectMessage,
                             PingMessage,
                             PongMessage,
                             PlayerIdMessage,
                             SnapshotMessage>;

/// @brief Returns the wire type tag of @p message.
[[nodiscard]] PacketType packetTypeOf(const Message& message) noexcept;

/// @brief Serializes @p message, header included.
[[nodiscard]] std::vector<core::byte> encode(const Message& message);

/// @brief Parses one datagram.
///
/// Fails with @c kProtocolViolation on a foreign magic, version or type,
/// and with @c kDeserializationFailed on truncated payloads, invalid field
/// values or trailing bytes.
[[nodiscard]] core::Expected<Message> decode(std::span<const core::byte> datagram);

} // namespace tether::net::protocol
