// /////////////////////////////////////////////////////////////////////////////
/// @file PlayerSession.hpp
/// @brief Server-side state of one connected player.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/session/PositionHistory.hpp>
#include <tether/net/transport/Endpoint.hpp>
#include <tether/net/protocol/Types.hpp>
#include <tether/core/Types.hpp>

namespace tether::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class PlayerSession
/// @brief Identity, authoritative position, color, liveness and position
///        history of a live player.
///
/// Owned by SessionStore. Position only changes through @ref moveTo, which
/// also records the move in the history.
// /////////////////////////////////////////////////////////////////////////////
class PlayerSession final
{
public:
    PlayerSession(protocol::PlayerId id,
                  transport::Endpoint endpoint,
                  protocol::Position position,
                  protocol::Color color,
                  core::TimePoint now);

    [[nodiscard]] protocol::PlayerId  id() const noexcept { return id_; }
    [[nodiscard]] const transport::Endpoint& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] protocol::Position  position() const noexcept { return position_; }
    [[nodiscard]] protocol::Color     color() const noexcept { return color_; }
    [[nodiscard]] core::TimePoint     lastActivity() const noexcept { return lastActivity_; }
    [[nodiscard]] const PositionHistory& history() const noexcept { return history_; }

    /// @brief Marks activity (input or keep-alive).
    void touch(core::TimePoint now) noexcept;

    /// @brief Sets the authoritative position and appends it to the history.
    void moveTo(protocol::Position position, core::TimePoint now);

private:
    protocol::PlayerId   id_;
    transport::Endpoint  endpoint_;
    protocol::Position   position_;
    protocol::Color      color_;
    core::TimePoint      lastActivity_;
    PositionHistory      history_;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct DisconnectedRecord
/// @brief What survives a disconnect for the duration of the grace period.
// /////////////////////////////////////////////////////////////////////////////
struct DisconnectedRecord
{
    protocol::Position position;
    protocol::Color    color;
    core::TimePoint    disconnectedAt;
};

} // namespace tether::net::session
