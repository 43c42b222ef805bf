/**
 * @file TestSessionStore.cpp
 * @brief Unit tests for net::session::SessionStore.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/net/session/SessionStore.hpp"
#include "tether/net/netcode/Movement.hpp"

#include <algorithm>
#include <chrono>

namespace tether::net {

using namespace net::session;
using namespace std::chrono_literals;
using protocol::Direction;
using protocol::PlayerInput;
using protocol::Position;
using transport::Endpoint;

namespace {

const Endpoint kAlice = Endpoint::fromOctets(127, 0, 0, 1, 5001);
const Endpoint kBob   = Endpoint::fromOctets(127, 0, 0, 1, 5002);

PlayerInput input(Direction direction, core::u32 sequence)
{
    return PlayerInput{direction, sequence, 0};
}

/// Connects @p endpoint and moves it to @p position through a reconnect.
protocol::PlayerId place(SessionStore& store, const Endpoint& endpoint, Position position, core::TimePoint now)
{
    const auto id = store.connect(endpoint, now);
    REQUIRE(store.disconnect(endpoint, now));
    REQUIRE(store.reconnect(endpoint, id, position, now, 10s));
    return id;
}

} // anonymous namespace

TEST_CASE("SessionStore connect is idempotent per endpoint", "[session][store]")
{
    SessionStore store{1};
    const auto t0 = core::Clock::now();

    const auto a = store.connect(kAlice, t0);
    REQUIRE(a != protocol::kInvalidPlayerId);
    REQUIRE(store.connect(kAlice, t0 + 1s) == a);
    REQUIRE(store.activeCount() == 1);

    const auto b = store.connect(kBob, t0);
    REQUIRE(b != a);
    REQUIRE(b != protocol::kInvalidPlayerId);
    REQUIRE(store.activeCount() == 2);
    REQUIRE(store.find(kBob)->id() == b);
    REQUIRE(store.find(a)->endpoint() == kAlice);
}

TEST_CASE("SessionStore spawns inside the board with a palette color", "[session][store]")
{
    SessionStore store{2};
    const auto t0 = core::Clock::now();

    for (core::u16 port = 1; port <= 50; ++port)
    {
        const auto id = store.connect(Endpoint::fromOctets(10, 0, 0, 1, port), t0);
        const auto* session = store.find(id);
        REQUIRE(session != nullptr);
        REQUIRE(session->position() == netcode::clampToBoard(session->position()));
        REQUIRE(std::find(core::kPlayerPalette.begin(), core::kPlayerPalette.end(), session->color()) !=
                core::kPlayerPalette.end());
        REQUIRE(session->history().size() == 1);
    }
}

TEST_CASE("SessionStore applies inputs with the shared movement rule", "[session][store]")
{
    SessionStore store{3};
    const auto t0 = core::Clock::now();
    const auto id = store.connect(kAlice, t0);
    const Position start = store.find(id)->position();

    REQUIRE(store.applyInput(kAlice, input(Direction::Right, 1), t0 + 10ms));
    REQUIRE(store.find(id)->position() == netcode::applyDirection(start, Direction::Right));
    REQUIRE(store.lastProcessedInput(id) == 1u);
    REQUIRE(store.find(id)->lastActivity() == t0 + 10ms);

    REQUIRE_FALSE(store.applyInput(kBob, input(Direction::Right, 1), t0));
    REQUIRE(store.activeCount() == 1);
}

TEST_CASE("SessionStore keeps positions clamped and history bounded", "[session][store]")
{
    SessionStore store{4};
    const auto t0 = core::Clock::now();
    const auto id = store.connect(kAlice, t0);

    for (core::u32 i = 1; i <= 300; ++i)
        REQUIRE(store.applyInput(kAlice, input(Direction::Left, i), t0 + std::chrono::milliseconds{i}));

    REQUIRE(store.find(id)->position().x == core::kMinX);
    REQUIRE(store.find(id)->history().size() == core::kServerHistoryCapacity);
}

TEST_CASE("SessionStore disconnect keeps a record for the grace period", "[session][store]")
{
    SessionStore store{5};
    const auto t0 = core::Clock::now();
    const auto id = store.connect(kAlice, t0);
    REQUIRE(store.applyInput(kAlice, input(Direction::Down, 1), t0));
    const auto position = store.find(id)->position();
    const auto color = store.find(id)->color();

    REQUIRE(store.disconnect(kAlice, t0 + 1s));
    REQUIRE(store.activeCount() == 0);
    REQUIRE(store.find(kAlice) == nullptr);
    REQUIRE_FALSE(store.lastProcessedInput(id).has_value());

    const auto* record = store.record(id);
    REQUIRE(record != nullptr);
    REQUIRE(record->position == position);
    REQUIRE(record->color == color);
    REQUIRE(record->disconnectedAt == t0 + 1s);

    REQUIRE_FALSE(store.disconnect(kAlice, t0 + 2s));
    REQUIRE_FALSE(store.disconnect(kBob, t0 + 2s));
}

TEST_CASE("SessionStore reconnect within the grace period restores identity", "[session][store]")
{
    SessionStore store{6};
    const auto t0 = core::Clock::now();
    const auto id = store.connect(kAlice, t0);
    const auto color = store.find(id)->color();
    REQUIRE(store.disconnect(kAlice, t0));

    REQUIRE(store.cleanupExpired(t0 + 5s, 10s) == 0);
    REQUIRE(store.reconnect(kBob, id, Position{100, 100}, t0 + 5s, 10s));

    const auto* session = store.find(id);
    REQUIRE(session != nullptr);
    REQUIRE(session->endpoint() == kBob);
    REQUIRE(session->color() == color);
    REQUIRE(session->position() == Position{100, 100});
    REQUIRE(store.record(id) == nullptr);
    REQUIRE(store.disconnectedCount() == 0);
}

TEST_CASE("SessionStore reconnect clamps the claimed position", "[session][store]")
{
    SessionStore store{7};
    const auto t0 = core::Clock::now();
    const auto id = store.connect(kAlice, t0);
    REQUIRE(store.disconnect(kAlice, t0));
    REQUIRE(store.reconnect(kAlice, id, Position{-400, 99999}, t0, 10s));
    REQUIRE(store.find(id)->position() == Position{core::kMinX, core::kMaxY});
}

TEST_CASE("SessionStore reconnect after expiry yields a fresh identity", "[session][store]")
{
    SessionStore store{8};
    const auto t0 = core::Clock::now();
    const auto id = store.connect(kAlice, t0);
    REQUIRE(store.disconnect(kAlice, t0));

    REQUIRE(store.cleanupExpired(t0 + 11s, 10s) == 1);
    REQUIRE(store.record(id) == nullptr);
    REQUIRE_FALSE(store.reconnect(kAlice, id, Position{100, 100}, t0 + 11s, 10s));
    REQUIRE(store.activeCount() == 0);

    const auto fresh = store.connect(kAlice, t0 + 11s);
    REQUIRE(fresh != id);
}

TEST_CASE("SessionStore reconnect rejects an expired record before any sweep", "[session][store]")
{
    SessionStore store{11};
    const auto t0 = core::Clock::now();
    const auto id = store.connect(kAlice, t0);
    REQUIRE(store.disconnect(kAlice, t0));

    REQUIRE_FALSE(store.reconnect(kBob, id, Position{100, 100}, t0 + 10500ms, 10s));
    REQUIRE(store.find(id) == nullptr);
    REQUIRE(store.find(kBob) == nullptr);
    REQUIRE(store.activeCount() == 0);

    // Exactly at the boundary the record is still honoured.
    REQUIRE(store.reconnect(kBob, id, Position{100, 100}, t0 + 10s, 10s));
    REQUIRE(store.find(id)->endpoint() == kBob);
}

TEST_CASE("SessionStore reconnect refuses live identities and endpoints", "[session][store]")
{
    SessionStore store{9};
    const auto t0 = core::Clock::now();
    const auto a = store.connect(kAlice, t0);
    const auto b = store.connect(kBob, t0);
    REQUIRE(store.disconnect(kAlice, t0));

    REQUIRE_FALSE(store.reconnect(kBob, a, Position{100, 100}, t0, 10s));
    REQUIRE_FALSE(store.reconnect(kAlice, b, Position{100, 100}, t0, 10s));
    REQUIRE_FALSE(store.reconnect(kAlice, 0xDEADBEEF, Position{100, 100}, t0, 10s));
    REQUIRE(store.record(a) != nullptr);
}

TEST_CASE("SessionStore evicts players that stopped talking", "[session][store]")
{
    SessionStore store{10};
    const auto t0 = core::Clock::now();
    const auto a = store.connect(kAlice, t0);
    const auto b = store.connect(kBob, t0);
    REQUIRE(store.touch(kBob, t0 + 5s));

    REQUIRE(store.evictTimedOut(t0 + 9s, 10s) == 0);
    REQUIRE(store.evictTimedOut(t0 + 11s, 10s) == 1);

    REQUIRE(store.find(a) == nullptr);
    REQUIRE(store.record(a) != nullptr);
    REQUIRE(store.find(b) != nullptr);
    REQUIRE_FALSE(store.touch(kAlice, t0 + 12s));
}

TEST_CASE("SessionStore snapshot lists every live player", "[session][store]")
{
    SessionStore store{11};
    const auto t0 = core::Clock::now();
    const auto a = store.connect(kAlice, t0);
    const auto b = store.connect(kBob, t0);
    REQUIRE(store.applyInput(kBob, input(Direction::Up, 4), t0));

    const auto snapshot = store.buildSnapshot(t0);
    REQUIRE(snapshot.players.size() == 2);
    REQUIRE(snapshot.players[0].id < snapshot.players[1].id);
    REQUIRE(snapshot.find(a)->position == store.find(a)->position());
    REQUIRE(snapshot.find(b)->color == store.find(b)->color());
    REQUIRE(snapshot.ackFor(b) == 4u);
    REQUIRE_FALSE(snapshot.ackFor(a).has_value());
    REQUIRE(snapshot.serverTimestampMs == static_cast<core::u64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(t0.time_since_epoch()).count()));

    REQUIRE(store.endpoints().size() == 2);
}

TEST_CASE("SessionStore reconstructs past positions", "[session][store][lag]")
{
    SessionStore store{12};
    const auto t0 = core::Clock::now();
    const auto id = place(store, kAlice, Position{100, 100}, t0);
    REQUIRE(store.applyInput(kAlice, input(Direction::Right, 1), t0 + 1s));

    REQUIRE(store.positionAt(id, t0 - 1s) == Position{100, 100});
    REQUIRE(store.positionAt(id, t0 + 500ms) == Position{102, 100});
    REQUIRE(store.positionAt(id, t0 + 2s) == Position{105, 100});
    REQUIRE_FALSE(store.positionAt(0xABCDEF, t0).has_value());
}

TEST_CASE("SessionStore reports each collision pair once", "[session][store][lag]")
{
    SessionStore store{13};
    const auto t0 = core::Clock::now();
    const auto a = place(store, kAlice, Position{100, 100}, t0);
    const auto b = place(store, kBob, Position{110, 100}, t0);

    REQUIRE(store.applyInput(kBob, input(Direction::Left, 1), t0 + 1s));
    REQUIRE(store.applyInput(kBob, input(Direction::Left, 2), t0 + 2s));

    REQUIRE(store.collisionCheck(t0).empty());

    const auto collisions = store.collisionCheck(t0 + 2s);
    REQUIRE(collisions.size() == 1);
    REQUIRE(collisions[0] == CollisionPair{std::min(a, b), std::max(a, b)});
}

} // namespace tether::net
