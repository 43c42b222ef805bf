// /////////////////////////////////////////////////////////////////////////////
/// @file Snapshot.hpp
/// @brief Full authoritative world state broadcast by the server.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/protocol/Types.hpp>
#include <tether/core/Types.hpp>

#include <optional>
#include <unordered_map>
#include <vector>

namespace tether::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @struct PlayerState
/// @brief One player's entry in a snapshot.
// /////////////////////////////////////////////////////////////////////////////
struct PlayerState
{
    PlayerId  id{kInvalidPlayerId};
    Position  position{};
    Color     color{0};

    [[nodiscard]] bool operator==(const PlayerState&) const noexcept = default;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct GameStateSnapshot
/// @brief Every live player plus the last input sequence the server
///        processed for each of them.
///
/// Immutable once built; the client uses @c lastProcessedInput as the
/// acknowledgment for its own pending inputs.
// /////////////////////////////////////////////////////////////////////////////
struct GameStateSnapshot
{
    std::vector<PlayerState>                  players;
    std::unordered_map<PlayerId, core::u32>   lastProcessedInput;
    core::u64                                 serverTimestampMs{0};

    /// @brief Returns the entry for @p id, or nullptr.
    [[nodiscard]] const PlayerState* find(PlayerId id) const noexcept
    {
        for (const auto& player : players)
        {
            if (player.id == id)
            {
                return &player;
            }
        }
        return nullptr;
    }

    /// @brief Returns the acknowledged input sequence for @p id, if any.
    [[nodiscard]] std::optional<core::u32> ackFor(PlayerId id) const
    {
        const auto it = lastProcessedInput.find(id);
        if (it == lastProcessedInput.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool operator==(const GameStateSnapshot&) const = default;
};

} // namespace tether::net::protocol
