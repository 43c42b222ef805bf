/**
 * @file TestLagCompensation.cpp
 * @brief Unit tests for position history and rewind queries.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/net/session/LagCompensation.hpp"

#include <chrono>
#include <vector>

namespace tether::net {

using namespace net::session;
using namespace std::chrono_literals;
using protocol::Position;

TEST_CASE("PositionHistory drops the oldest sample past capacity", "[session][history]")
{
    PositionHistory history{3};
    const auto t0 = core::Clock::now();
    for (int i = 0; i < 5; ++i)
        history.push(Position{i, i}, t0 + std::chrono::seconds{i});

    REQUIRE(history.size() == 3);
    REQUIRE(history.oldest().position == Position{2, 2});
    REQUIRE(history.newest().position == Position{4, 4});
}

TEST_CASE("PositionHistory keeps timestamps non-decreasing", "[session][history]")
{
    PositionHistory history;
    const auto t0 = core::Clock::now();
    history.push(Position{1, 1}, t0 + 2s);
    history.push(Position{2, 2}, t0);

    REQUIRE(history.size() == 2);
    REQUIRE(history[1].timestamp == t0 + 2s);
}

TEST_CASE("reconstruct clamps outside the recorded range", "[session][lag]")
{
    PositionHistory history;
    REQUIRE_FALSE(reconstruct(history, core::Clock::now()).has_value());

    const auto t0 = core::Clock::now();
    history.push(Position{100, 100}, t0);
    history.push(Position{200, 100}, t0 + 1s);

    REQUIRE(reconstruct(history, t0 - 10s) == Position{100, 100});
    REQUIRE(reconstruct(history, t0 + 10s) == Position{200, 100});
    REQUIRE(reconstruct(history, t0 + 250ms) == Position{125, 100});
}

TEST_CASE("findCollisions lists every overlapping pair sorted", "[session][lag]")
{
    const auto t0 = core::Clock::now();
    PositionHistory a, b, c, d;
    a.push(Position{50, 50}, t0);
    b.push(Position{50, 50}, t0);
    c.push(Position{50, 50}, t0);
    d.push(Position{60, 50}, t0);

    const std::vector<TrackedHistory> players{{30, &a}, {10, &b}, {20, &c}, {40, &d}, {50, nullptr}};
    const auto collisions = findCollisions(players, t0);

    REQUIRE(collisions == std::vector<CollisionPair>{{10, 20}, {10, 30}, {20, 30}});
}

} // namespace tether::net
