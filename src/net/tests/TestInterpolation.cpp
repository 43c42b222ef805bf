/**
 * @file TestInterpolation.cpp
 * @brief Unit tests for net::netcode::InterpolationBuffer.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/net/netcode/Interpolation.hpp"

namespace tether::net {

using namespace net::netcode;
using protocol::Position;

TEST_CASE("InterpolationBuffer is empty until a sample arrives", "[netcode][interpolation]")
{
    InterpolationBuffer buffer;
    REQUIRE(buffer.size() == 0);
    REQUIRE_FALSE(buffer.interpolatedPosition(1.0).has_value());
    REQUIRE_FALSE(buffer.lastSequence().has_value());
}

TEST_CASE("InterpolationBuffer returns the only sample", "[netcode][interpolation]")
{
    InterpolationBuffer buffer;
    REQUIRE(buffer.addPosition(Position{42, 24}, 3.0, 1));
    REQUIRE(buffer.interpolatedPosition(0.0) == Position{42, 24});
    REQUIRE(buffer.interpolatedPosition(100.0) == Position{42, 24});
}

TEST_CASE("InterpolationBuffer renders slightly in the past", "[netcode][interpolation]")
{
    InterpolationBuffer buffer{0.1};
    REQUIRE(buffer.addPosition(Position{100, 100}, 1.0, 1));
    REQUIRE(buffer.addPosition(Position{200, 200}, 2.0, 2));

    REQUIRE(buffer.interpolatedPosition(2.1) == Position{200, 200});
    REQUIRE(buffer.interpolatedPosition(1.1) == Position{100, 100});
    REQUIRE(buffer.interpolatedPosition(1.6) == Position{150, 150});
}

TEST_CASE("InterpolationBuffer clamps outside the buffered range", "[netcode][interpolation]")
{
    InterpolationBuffer buffer{0.1};
    REQUIRE(buffer.addPosition(Position{100, 100}, 1.0, 1));
    REQUIRE(buffer.addPosition(Position{200, 200}, 2.0, 2));

    REQUIRE(buffer.interpolatedPosition(0.5) == Position{100, 100});
    REQUIRE(buffer.interpolatedPosition(50.0) == Position{200, 200});
}

TEST_CASE("InterpolationBuffer rejects non-increasing sequences", "[netcode][interpolation]")
{
    InterpolationBuffer buffer;
    REQUIRE(buffer.addPosition(Position{1, 1}, 1.0, 5));
    REQUIRE_FALSE(buffer.addPosition(Position{2, 2}, 1.5, 5));
    REQUIRE_FALSE(buffer.addPosition(Position{3, 3}, 2.0, 4));
    REQUIRE(buffer.size() == 1);
    REQUIRE(buffer.lastSequence() == 5u);
}

TEST_CASE("InterpolationBuffer keeps the most recent samples", "[netcode][interpolation]")
{
    InterpolationBuffer buffer{0.1, 30};
    for (int i = 1; i <= 40; ++i)
        REQUIRE(buffer.addPosition(Position{i, i}, static_cast<double>(i), static_cast<core::u32>(i)));

    REQUIRE(buffer.size() == 30);
    REQUIRE(buffer.interpolatedPosition(0.0) == Position{11, 11});
}

} // namespace tether::net
