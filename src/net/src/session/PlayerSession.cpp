// /////////////////////////////////////////////////////////////////////////////
/// @file PlayerSession.cpp
/// @brief PlayerSession implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/session/PlayerSession.hpp>

namespace tether::net::session {

PlayerSession::PlayerSession(protocol::PlayerId id,
                             transport::Endpoint endpoint,
                             protocol::Position position,
                             protocol::Color color,
                             core::TimePoint now)
    : id_{id}
    , endpoint_{endpoint}
    , position_{position}
    , color_{color}
    , lastActivity_{now}
{
    history_.push(position, now);
}

void PlayerSession::touch(core::TimePoint now) noexcept
{
    if (now > lastActivity_)
    {
        lastActivity_ = now;
    }
}

void PlayerSession::moveTo(protocol::Position position, core::TimePoint now)
{
    position_ = position;
    history_.push(position, now);
}

} // namespace tether::net::session
