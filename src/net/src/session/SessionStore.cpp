// /////////////////////////////////////////////////////////////////////////////
/// @file SessionStore.cpp
/// @brief SessionStore implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/session/SessionStore.hpp>
#include <tether/net/netcode/Movement.hpp>
#include <tether/core/Constants.hpp>
#include <tether/core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <limits>
#include <random>
#include <unordered_map>

namespace tether::net::session {

struct SessionStore::Impl
{
    std::unordered_map<protocol::PlayerId, PlayerSession>        sessions;
    std::unordered_map<transport::Endpoint, protocol::PlayerId>  endpointToId;
    std::unordered_map<protocol::PlayerId, core::u32>            lastProcessed;
    std::unordered_map<protocol::PlayerId, DisconnectedRecord>   disconnected;
    std::mt19937_64                                              rng;

    explicit Impl(core::u64 seed) : rng{seed} {}

    protocol::PlayerId generateId()
    {
        std::uniform_int_distribution<protocol::PlayerId> dist{
            1, std::numeric_limits<protocol::PlayerId>::max()};

        protocol::PlayerId id = dist(rng);
        while (sessions.contains(id) || disconnected.contains(id))
        {
            id = dist(rng);
        }
        return id;
    }

    protocol::Position randomSpawn()
    {
        std::uniform_int_distribution<core::i32> xs{core::kMinX, core::kMaxX};
        std::uniform_int_distribution<core::i32> ys{core::kMinY, core::kMaxY};
        const core::i32 x = xs(rng);
        return protocol::Position{x, ys(rng)};
    }

    protocol::Color randomColor()
    {
        std::uniform_int_distribution<core::usize> dist{0, core::kPlayerPalette.size() - 1};
        return core::kPlayerPalette[dist(rng)];
    }

    PlayerSession* findByEndpoint(const transport::Endpoint& endpoint)
    {
        const auto it = endpointToId.find(endpoint);
        if (it == endpointToId.end())
        {
            return nullptr;
        }
        const auto session = sessions.find(it->second);
        return (session != sessions.end()) ? &session->second : nullptr;
    }

    /// Creates a live session and both index entries.
    PlayerSession& bind(protocol::PlayerId id,
                        const transport::Endpoint& endpoint,
                        protocol::Position position,
                        protocol::Color color,
                        core::TimePoint now)
    {
        endpointToId[endpoint] = id;
        return sessions.try_emplace(id, id, endpoint, position, color, now).first->second;
    }

    /// Removes the live session and both index entries; returns its record.
    DisconnectedRecord unbind(const PlayerSession& session, core::TimePoint now)
    {
        const DisconnectedRecord record{session.position(), session.color(), now};
        const auto id = session.id();
        endpointToId.erase(session.endpoint());
        lastProcessed.erase(id);
        sessions.erase(id);
        return record;
    }
};

SessionStore::SessionStore()
    : SessionStore{std::random_device{}()}
{}

SessionStore::SessionStore(core::u64 seed)
    : impl_{std::make_unique<Impl>(seed)}
{}

SessionStore::~SessionStore() = default;

protocol::PlayerId SessionStore::connect(const transport::Endpoint& endpoint, core::TimePoint now)
{
    if (const auto* existing = impl_->findByEndpoint(endpoint))
    {
        return existing->id();
    }

    const auto id = impl_->generateId();
    const auto position = impl_->randomSpawn();
    const auto color = impl_->randomColor();
    impl_->bind(id, endpoint, position, color, now);

    core::Log::info("session", "player " + std::to_string(id) + " connected from " +
                               endpoint.toString() + " at " + protocol::toString(position));
    return id;
}

bool SessionStore::applyInput(const transport::Endpoint& endpoint,
                              const protocol::PlayerInput& input,
                              core::TimePoint now)
{
    auto* session = impl_->findByEndpoint(endpoint);
    if (session == nullptr)
    {
        return false;
    }

    session->touch(now);
    impl_->lastProcessed[session->id()] = input.sequence;
    session->moveTo(netcode::applyDirection(session->position(), input.direction), now);
    return true;
}

bool SessionStore::touch(const transport::Endpoint& endpoint, core::TimePoint now)
{
    auto* session = impl_->findByEndpoint(endpoint);
    if (session == nullptr)
    {
        return false;
    }
    session->touch(now);
    return true;
}

bool SessionStore::disconnect(const transport::Endpoint& endpoint, core::TimePoint now)
{
    const auto* session = impl_->findByEndpoint(endpoint);
    if (session == nullptr)
    {
        return false;
    }

    const auto id = session->id();
    impl_->disconnected[id] = impl_->unbind(*session, now);

    core::Log::info("session", "player " + std::to_string(id) + " disconnected");
    return true;
}

bool SessionStore::reconnect(const transport::Endpoint& endpoint,
                             protocol::PlayerId previousId,
                             protocol::Position claimedPosition,
                             core::TimePoint now,
                             core::Duration gracePeriod)
{
    const auto record = impl_->disconnected.find(previousId);
    if (record == impl_->disconnected.end())
    {
        return false;
    }

    if (now - record->second.disconnectedAt > gracePeriod)
    {
        core::Log::debug("session", "reconnect of " + std::to_string(previousId) + " after grace period");
        return false;
    }

    if (impl_->sessions.contains(previousId) || impl_->endpointToId.contains(endpoint))
    {
        return false;
    }

    const auto color = record->second.color;
    impl_->disconnected.erase(record);
    impl_->bind(previousId, endpoint, netcode::clampToBoard(claimedPosition), color, now);

    core::Log::info("session", "player " + std::to_string(previousId) + " reconnected from " +
                               endpoint.toString());
    return true;
}

core::u32 SessionStore::evictTimedOut(core::TimePoint now, core::Duration timeout)
{
    std::vector<transport::Endpoint> expired;
    for (const auto& [id, session] : impl_->sessions)
    {
        if (now - session.lastActivity() > timeout)
        {
            expired.push_back(session.endpoint());
        }
    }

    core::u32 evicted = 0;
    for (const auto& endpoint : expired)
    {
        if (const auto* session = impl_->findByEndpoint(endpoint))
        {
            core::Log::info("session", "player " + std::to_string(session->id()) + " timed out");
        }
        if (disconnect(endpoint, now))
        {
            ++evicted;
        }
    }
    return evicted;
}

core::u32 SessionStore::cleanupExpired(core::TimePoint now, core::Duration gracePeriod)
{
    core::u32 removed = 0;
    for (auto it = impl_->disconnected.begin(); it != impl_->disconnected.end(); )
    {
        const bool expired = now - it->second.disconnectedAt > gracePeriod;
        if (expired && !impl_->sessions.contains(it->first))
        {
            core::Log::debug("session", "record of player " + std::to_string(it->first) + " expired");
            it = impl_->disconnected.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

protocol::GameStateSnapshot SessionStore::buildSnapshot(core::TimePoint now) const
{
    protocol::GameStateSnapshot snapshot;
    snapshot.players.reserve(impl_->sessions.size());

    for (const auto& [id, session] : impl_->sessions)
    {
        snapshot.players.push_back(protocol::PlayerState{id, session.position(), session.color()});
    }
    std::sort(snapshot.players.begin(), snapshot.players.end(),
              [](const protocol::PlayerState& a, const protocol::PlayerState& b) { return a.id < b.id; });

    snapshot.lastProcessedInput = impl_->lastProcessed;
    snapshot.serverTimestampMs = static_cast<core::u64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
    return snapshot;
}

std::vector<CollisionPair> SessionStore::collisionCheck(core::TimePoint at) const
{
    std::vector<TrackedHistory> tracked;
    tracked.reserve(impl_->sessions.size());
    for (const auto& [id, session] : impl_->sessions)
    {
        tracked.push_back(TrackedHistory{id, &session.history()});
    }
    return findCollisions(tracked, at);
}

std::optional<protocol::Position> SessionStore::positionAt(protocol::PlayerId id, core::TimePoint at) const
{
    const auto* session = find(id);
    if (session == nullptr)
    {
        return std::nullopt;
    }
    return reconstruct(session->history(), at);
}

const PlayerSession* SessionStore::find(const transport::Endpoint& endpoint) const noexcept
{
    return impl_->findByEndpoint(endpoint);
}

const PlayerSession* SessionStore::find(protocol::PlayerId id) const noexcept
{
    const auto it = impl_->sessions.find(id);
    return (it != impl_->sessions.end()) ? &it->second : nullptr;
}

const DisconnectedRecord* SessionStore::record(protocol::PlayerId id) const noexcept
{
    const auto it = impl_->disconnected.find(id);
    return (it != impl_->disconnected.end()) ? &it->second : nullptr;
}

std::optional<core::u32> SessionStore::lastProcessedInput(protocol::PlayerId id) const noexcept
{
    const auto it = impl_->lastProcessed.find(id);
    if (it == impl_->lastProcessed.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<transport::Endpoint> SessionStore::endpoints() const
{
    std::vector<transport::Endpoint> out;
    out.reserve(impl_->endpointToId.size());
    for (const auto& [endpoint, id] : impl_->endpointToId)
    {
        out.push_back(endpoint);
    }
    return out;
}

core::u32 SessionStore::activeCount() const noexcept
{
    return static_cast<core::u32>(impl_->sessions.size());
}

core::u32 SessionStore::disconnectedCount() const noexcept
{
    return static_cast<core::u32>(impl_->disconnected.size());
}

} // namespace tether::net::session
