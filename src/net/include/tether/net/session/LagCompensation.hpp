// /////////////////////////////////////////////////////////////////////////////
/// @file LagCompensation.hpp
/// @brief Historical position reconstruction and collision detection.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/session/PositionHistory.hpp>
#include <tether/net/protocol/Types.hpp>
#include <tether/core/Types.hpp>

#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace tether::net::session {

/// @brief Unordered pair of colliding players, stored as (smaller, larger).
using CollisionPair = std::pair<protocol::PlayerId, protocol::PlayerId>;

// /////////////////////////////////////////////////////////////////////////////
/// @struct TrackedHistory
/// @brief A player id and a view of its position history.
// /////////////////////////////////////////////////////////////////////////////
struct TrackedHistory
{
    protocol::PlayerId      id;
    const PositionHistory*  history;
};

/// @brief Reconstructs where a player was at time @p at.
///
/// Interpolates linearly between the two samples bracketing @p at.  Before
/// the oldest sample the oldest position is returned, after the newest the
/// newest.  Returns nothing for an empty history.
[[nodiscard]] std::optional<protocol::Position> reconstruct(const PositionHistory& history,
                                                            core::TimePoint at);

/// @brief Every pair of players whose reconstructed positions at @p at are
///        exactly equal, each pair once, sorted.
///
/// Quadratic in the number of players.
[[nodiscard]] std::vector<CollisionPair> findCollisions(std::span<const TrackedHistory> players,
                                                        core::TimePoint at);

} // namespace tether::net::session
