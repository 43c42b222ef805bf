// /////////////////////////////////////////////////////////////////////////////
/// @file Types.cpp
/// @brief Debug formatting for protocol value types.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/protocol/Types.hpp>
#include <tether/net/protocol/Protocol.hpp>

namespace tether::net::protocol {

const char* toString(Direction direction) noexcept
{
    switch (direction)
    {
        case Direction::Up:    return "Up";
        case Direction::Down:  return "Down";
        case Direction::Left:  return "Left";
        case Direction::Right: return "Right";
    }
    return "Unknown";
}

std::string toString(const Position& position)
{
    return "(" + std::to_string(position.x) + ", " + std::to_string(position.y) + ")";
}

const char* toString(PacketType type) noexcept
{
    switch (type)
    {
        case PacketType::Connect:       return "Connect";
        case PacketType::Reconnect:     return "Reconnect";
        case PacketType::Input:         return "Input";
        case PacketType::Disconnect:    return "Disconnect";
        case PacketType::Ping:          return "Ping";
        case PacketType::Pong:          return "Pong";
        case PacketType::AssignId:      return "AssignId";
        case PacketType::StateSnapshot: return "StateSnapshot";
    }
    return "Unknown";
}

} // namespace tether::net::protocol
