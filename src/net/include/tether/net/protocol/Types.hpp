// /////////////////////////////////////////////////////////////////////////////
/// @file Types.hpp
/// @brief Value types shared by the wire format, the server and the client.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/core/Types.hpp>

#include <string>

namespace tether::net::protocol {

/// @brief Opaque player identifier. Zero never names a valid player.
using PlayerId = core::u64;

inline constexpr PlayerId kInvalidPlayerId = 0;

/// @brief Packed 0xRRGGBB color.
using Color = core::u32;

// /////////////////////////////////////////////////////////////////////////////
/// @struct Position
/// @brief Integer board coordinates of a player's center.
// /////////////////////////////////////////////////////////////////////////////
struct Position
{
    core::i32 x{0};
    core::i32 y{0};

    [[nodiscard]] bool operator==(const Position&) const noexcept = default;
};

// /////////////////////////////////////////////////////////////////////////////
/// @enum Direction
/// @brief One discrete movement step. Wire values are fixed.
// /////////////////////////////////////////////////////////////////////////////
enum class Direction : core::u8
{
    Up    = 0,
    Down  = 1,
    Left  = 2,
    Right = 3
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct PlayerInput
/// @brief A single sequenced movement command sent by a client.
// /////////////////////////////////////////////////////////////////////////////
struct PlayerInput
{
    Direction  direction{Direction::Up};
    core::u32  sequence{0};
    core::u64  timestampMs{0};

    [[nodiscard]] bool operator==(const PlayerInput&) const noexcept = default;
};

[[nodiscard]] const char* toString(Direction direction) noexcept;

[[nodiscard]] std::string toString(const Position& position);

} // namespace tether::net::protocol
