// /////////////////////////////////////////////////////////////////////////////
/// @file SessionStore.hpp
/// @brief Authoritative registry of live players and recently departed ones.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/session/LagCompensation.hpp>
#include <tether/net/session/PlayerSession.hpp>
#include <tether/net/protocol/Snapshot.hpp>
#include <tether/net/protocol/Types.hpp>
#include <tether/net/transport/Endpoint.hpp>
#include <tether/core/Types.hpp>
#include <tether/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace tether::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class SessionStore
/// @brief Owns every PlayerSession and DisconnectedRecord on the server.
///
/// The endpoint and id indices are only ever modified together, so a live
/// id always maps to exactly one endpoint and back.  Unknown endpoints or
/// ids are never an error: the corresponding operation is a no-op.
///
/// Not thread-safe. The server wraps it in concurrency::Guarded.
/// Every time-dependent operation takes an explicit @c now.
// /////////////////////////////////////////////////////////////////////////////
class SessionStore final : public core::NonCopyable<SessionStore>
{
public:
    SessionStore();

    /// @brief Deterministic ids, spawn points and colors (tests).
    explicit SessionStore(core::u64 seed);

    ~SessionStore();

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Returns the id bound to @p endpoint, creating a session with a
    ///        random spawn point and color if there is none.
    protocol::PlayerId connect(const transport::Endpoint& endpoint,
                               core::TimePoint now = core::Clock::now());

    /// @brief Applies one input authoritatively.
    /// @return @c false if @p endpoint has no session.
    bool applyInput(const transport::Endpoint& endpoint,
                    const protocol::PlayerInput& input,
                    core::TimePoint now = core::Clock::now());

    /// @brief Refreshes liveness without moving (keep-alive).
    /// @return @c false if @p endpoint has no session.
    bool touch(const transport::Endpoint& endpoint, core::TimePoint now = core::Clock::now());

    /// @brief Ends the session at @p endpoint and keeps a record of it.
    /// @return @c false if @p endpoint has no session.
    bool disconnect(const transport::Endpoint& endpoint, core::TimePoint now = core::Clock::now());

    /// @brief Resumes @p previousId at @p endpoint from its record.
    ///
    /// Succeeds only if a record exists for @p previousId, it is no older
    /// than @p gracePeriod, that id is not live anywhere and @p endpoint has
    /// no session of its own.  Expiry is checked here as well as in
    /// cleanupExpired(), so a late reconnect never waits on the next sweep.
    /// The claimed position is clamped to the board.  On failure nothing
    /// changes.
    bool reconnect(const transport::Endpoint& endpoint,
                   protocol::PlayerId previousId,
                   protocol::Position claimedPosition,
                   core::TimePoint now,
                   core::Duration gracePeriod);

    /// @brief Disconnects every session idle for longer than @p timeout.
    /// @return Number of sessions evicted.
    core::u32 evictTimedOut(core::TimePoint now, core::Duration timeout);

    /// @brief Forgets records older than @p gracePeriod.
    /// @return Number of records removed.
    core::u32 cleanupExpired(core::TimePoint now, core::Duration gracePeriod);

    // --------------------------------------------------------------------- //
    //  Queries                                                               //
    // --------------------------------------------------------------------- //

    /// @brief Current state of every live player, ordered by id.
    [[nodiscard]] protocol::GameStateSnapshot buildSnapshot(core::TimePoint now) const;

    /// @brief Pairs of live players occupying the same position at @p at.
    [[nodiscard]] std::vector<CollisionPair> collisionCheck(core::TimePoint at) const;

    /// @brief Reconstructed position of @p id at @p at.
    [[nodiscard]] std::optional<protocol::Position> positionAt(protocol::PlayerId id,
                                                               core::TimePoint at) const;

    [[nodiscard]] const PlayerSession* find(const transport::Endpoint& endpoint) const noexcept;
    [[nodiscard]] const PlayerSession* find(protocol::PlayerId id) const noexcept;

    [[nodiscard]] const DisconnectedRecord* record(protocol::PlayerId id) const noexcept;

    [[nodiscard]] std::optional<core::u32> lastProcessedInput(protocol::PlayerId id) const noexcept;

    /// @brief Endpoints of every live session.
    [[nodiscard]] std::vector<transport::Endpoint> endpoints() const;

    [[nodiscard]] core::u32 activeCount() const noexcept;
    [[nodiscard]] core::u32 disconnectedCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tether::net::session
