// /////////////////////////////////////////////////////////////////////////////
/// @file Movement.hpp
/// @brief The movement rule shared by client prediction and the server.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/protocol/Types.hpp>
#include <tether/core/Types.hpp>

namespace tether::net::netcode {

/// @brief Applies one step in @p direction and clamps to the playable area.
///
/// Both axes are clamped on every call so a position that somehow left the
/// board (e.g. a reconnect claim) is pulled back in by the next input.
[[nodiscard]] protocol::Position applyDirection(protocol::Position position,
                                                protocol::Direction direction) noexcept;

/// @brief Clamps @p position to the playable area.
[[nodiscard]] protocol::Position clampToBoard(protocol::Position position) noexcept;

/// @brief Linear blend between @p from and @p to, truncated toward zero.
/// @param t Fraction in [0, 1]; values outside are clamped.
[[nodiscard]] protocol::Position lerp(protocol::Position from,
                                      protocol::Position to,
                                      core::f64 t) noexcept;

} // namespace tether::net::netcode
