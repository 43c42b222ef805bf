// /////////////////////////////////////////////////////////////////////////////
/// @file LagCompensation.cpp
/// @brief LagCompensation implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/session/LagCompensation.hpp>
#include <tether/net/netcode/Movement.hpp>

#include <algorithm>
#include <chrono>

namespace tether::net::session {

std::optional<protocol::Position> reconstruct(const PositionHistory& history, core::TimePoint at)
{
    if (history.empty())
    {
        return std::nullopt;
    }

    if (at <= history.oldest().timestamp)
    {
        return history.oldest().position;
    }
    if (at >= history.newest().timestamp)
    {
        return history.newest().position;
    }

    for (core::usize i = 0; i + 1 < history.size(); ++i)
    {
        const auto& before = history[i];
        const auto& after  = history[i + 1];

        if (before.timestamp <= at && at <= after.timestamp)
        {
            const auto span = after.timestamp - before.timestamp;
            if (span.count() == 0)
            {
                return after.position;
            }
            const core::f64 t = std::chrono::duration<core::f64>(at - before.timestamp).count() /
                                std::chrono::duration<core::f64>(span).count();
            return netcode::lerp(before.position, after.position, t);
        }
    }

    return history.newest().position;
}

std::vector<CollisionPair> findCollisions(std::span<const TrackedHistory> players, core::TimePoint at)
{
    std::vector<std::pair<protocol::PlayerId, protocol::Position>> positions;
    positions.reserve(players.size());

    for (const auto& tracked : players)
    {
        if (tracked.history == nullptr)
        {
            continue;
        }
        if (auto position = reconstruct(*tracked.history, at))
        {
            positions.emplace_back(tracked.id, *position);
        }
    }

    std::vector<CollisionPair> collisions;
    for (core::usize i = 0; i < positions.size(); ++i)
    {
        for (core::usize j = i + 1; j < positions.size(); ++j)
        {
            if (positions[i].second == positions[j].second)
            {
                collisions.emplace_back(std::min(positions[i].first, positions[j].first),
                                        std::max(positions[i].first, positions[j].first));
            }
        }
    }

    std::sort(collisions.begin(), collisions.end());
    collisions.erase(std::unique(collisions.begin(), collisions.end()), collisions.end());
    return collisions;
}

} // namespace tether::net::session
