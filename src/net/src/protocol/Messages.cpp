// /////////////////////////////////////////////////////////////////////////////
/// @file Messages.cpp
/// @brief Message codec implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/protocol/Messages.hpp>
#include <tether/net/protocol/Bitstream.hpp>

#include <string>

namespace tether::net::protocol {

namespace {

template <typename... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void writePosition(Bitstream& out, const Position& position)
{
    out.writeI32(position.x);
    out.writeI32(position.y);
}

core::Expected<Position> readPosition(Bitstream& in)
{
    Position position;
    position.x = TETHER_TRY(in.readI32());
    position.y = TETHER_TRY(in.readI32());
    return position;
}

void writeSnapshot(Bitstream& out, const GameStateSnapshot& snapshot)
{
    out.writeU16(static_cast<core::u16>(snapshot.players.size()));
    for (const auto& player : snapshot.players)
    {
        out.writeU64(player.id);
        writePosition(out, player.position);
        out.writeU32(player.color);
    }

    out.writeU16(static_cast<core::u16>(snapshot.lastProcessedInput.size()));
    for (const auto& [id, sequence] : snapshot.lastProcessedInput)
    {
        out.writeU64(id);
        out.writeU32(sequence);
    }

    out.writeU64(snapshot.serverTimestampMs);
}

core::Expected<GameStateSnapshot> readSnapshot(Bitstream& in)
{
    GameStateSnapshot snapshot;

    const core::u16 playerCount = TETHER_TRY(in.readU16());
    for (core::u16 i = 0; i < playerCount; ++i)
    {
        PlayerState player;
        player.id       = TETHER_TRY(in.readU64());
        player.position = TETHER_TRY(readPosition(in));
        player.color    = TETHER_TRY(in.readU32());
        snapshot.players.push_back(player);
    }

    const core::u16 ackCount = TETHER_TRY(in.readU16());
    for (core::u16 i = 0; i < ackCount; ++i)
    {
        const PlayerId  id       = TETHER_TRY(in.readU64());
        const core::u32 sequence = TETHER_TRY(in.readU32());
        snapshot.lastProcessedInput[id] = sequence;
    }

    snapshot.serverTimestampMs = TETHER_TRY(in.readU64());
    return snapshot;
}

core::Expected<Message> readPayload(PacketType type, Bitstream& in)
{
    switch (type)
    {
        case PacketType::Connect:
            return ConnectMessage{};

        case PacketType::Reconnect:
        {
            ReconnectMessage msg;
            msg.previousId = TETHER_TRY(in.readU64());
            msg.position   = TETHER_TRY(readPosition(in));
            return msg;
        }

        case PacketType::Input:
        {
            const core::u8 direction = TETHER_TRY(in.readU8());
            if (direction > static_cast<core::u8>(Direction::Right))
            {
                return core::makeError(core::ErrorCode::kDeserializationFailed,
                                       "Input carries an unknown direction");
            }
            InputMessage msg;
            msg.input.direction   = static_cast<Direction>(direction);
            msg.input.sequence    = TETHER_TRY(in.readU32());
            msg.input.timestampMs = TETHER_TRY(in.readU64());
            return msg;
        }

        case PacketType::Disconnect:
            return DisconnectMessage{};

        case PacketType::Ping:
        {
            PingMessage msg;
            msg.timestampMs = TETHER_TRY(in.readU64());
            return msg;
        }

        case PacketType::Pong:
        {
            PongMessage msg;
            msg.timestampMs = TETHER_TRY(in.readU64());
            return msg;
        }

        case PacketType::AssignId:
        {
            PlayerIdMessage msg;
            msg.id = TETHER_TRY(in.readU64());
            return msg;
        }

        case PacketType::StateSnapshot:
        {
            SnapshotMessage msg;
            msg.snapshot = TETHER_TRY(readSnapshot(in));
            return msg;
        }
    }

    return core::makeError(core::ErrorCode::kProtocolViolation, "Unknown packet type");
}

bool isKnownType(core::u8 raw) noexcept
{
    switch (static_cast<PacketType>(raw))
    {
        case PacketType::Connect:
        case PacketType::Reconnect:
        case PacketType::Input:
        case PacketType::Disconnect:
        case PacketType::Ping:
        case PacketType::Pong:
        case PacketType::AssignId:
        case PacketType::StateSnapshot:
            return true;
    }
    return false;
}

} // anonymous namespace

PacketType packetTypeOf(const Message& message) noexcept
{
    return std::visit(Overloaded{
        [](const ConnectMessage&)    { return PacketType::Connect; },
        [](const ReconnectMessage&)  { return PacketType::Reconnect; },
        [](const InputMessage&)      { return PacketType::Input; },
        [](const DisconnectMessage&) { return PacketType::Disconnect; },
        [](const PingMessage&)       { return PacketType::Ping; },
        [](const PongMessage&)       { return PacketType::Pong; },
        [](const PlayerIdMessage&)   { return PacketType::AssignId; },
        [](const SnapshotMessage&)   { return PacketType::StateSnapshot; },
    }, message);
}

std::vector<core::byte> encode(const Message& message)
{
    Bitstream out;
    out.writeU32(core::kProtocolMagic);
    out.writeU8(core::kProtocolVersion);
    out.writeU8(static_cast<core::u8>(packetTypeOf(message)));

    std::visit(Overloaded{
        [](const ConnectMessage&) {},
        [&out](const ReconnectMessage& msg) {
            out.writeU64(msg.previousId);
            writePosition(out, msg.position);
        },
        [&out](const InputMessage& msg) {
            out.writeU8(static_cast<core::u8>(msg.input.direction));
            out.writeU32(msg.input.sequence);
            out.writeU64(msg.input.timestampMs);
        },
        [](const DisconnectMessage&) {},
        [&out](const PingMessage& msg) { out.writeU64(msg.timestampMs); },
        [&out](const PongMessage& msg) { out.writeU64(msg.timestampMs); },
        [&out](const PlayerIdMessage& msg) { out.writeU64(msg.id); },
        [&out](const SnapshotMessage& msg) { writeSnapshot(out, msg.snapshot); },
    }, message);

    return out.release();
}

core::Expected<Message> decode(std::span<const core::byte> datagram)
{
    if (datagram.size() < kHeaderSize)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               "Datagram shorter than header");
    }

    Bitstream in{datagram};

    const core::u32 magic   = TETHER_TRY(in.readU32());
    const core::u8  version = TETHER_TRY(in.readU8());
    const core::u8  rawType = TETHER_TRY(in.readU8());

    if (magic != core::kProtocolMagic)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "Bad protocol magic");
    }
    if (version != core::kProtocolVersion)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "Unsupported protocol version " + std::to_string(version));
    }
    if (!isKnownType(rawType))
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "Unknown packet type " + std::to_string(rawType));
    }

    const auto type = static_cast<PacketType>(rawType);
    auto message = readPayload(type, in);
    if (!message)
    {
        if (message.error().code() == core::ErrorCode::kOutOfRange)
        {
            return core::makeError(core::ErrorCode::kDeserializationFailed,
                                   std::string{"Truncated "} + toString(type) + " datagram");
        }
        return std::unexpected(message.error());
    }

    if (in.bitsRemaining() != 0)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::string{"Trailing bytes after "} + toString(type) + " payload");
    }

    return message;
}

} // namespace tether::net::protocol
