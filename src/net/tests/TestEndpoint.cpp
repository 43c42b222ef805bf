/**
 * @file TestEndpoint.cpp
 * @brief Unit tests for net::transport::Endpoint.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/net/transport/Endpoint.hpp"

#include <unordered_set>

namespace tether::net {

using namespace net::transport;

TEST_CASE("Endpoint parses dotted quads", "[transport][endpoint]")
{
    const auto ep = Endpoint::parse("192.168.1.20:9000");
    REQUIRE(ep.has_value());
    REQUIRE(*ep == Endpoint::fromOctets(192, 168, 1, 20, 9000));
    REQUIRE(ep->toString() == "192.168.1.20:9000");
}

TEST_CASE("Endpoint parses localhost", "[transport][endpoint]")
{
    const auto ep = Endpoint::parse("localhost:4242");
    REQUIRE(ep.has_value());
    REQUIRE(ep->address() == 0x7F000001u);
    REQUIRE(ep->port() == 4242);
}

TEST_CASE("Endpoint rejects malformed text", "[transport][endpoint]")
{
    for (const char* text : {"127.0.0.1", "127.0.0.1:", "127.0.0.1:70000", "127.0.0:9000",
                             "256.0.0.1:9000", "1.2.3.4.5:9000", "a.b.c.d:9000", "1.2.3.4:x"})
    {
        const auto ep = Endpoint::parse(text);
        INFO(text);
        REQUIRE_FALSE(ep.has_value());
        REQUIRE(ep.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("Endpoint hashes address and port together", "[transport][endpoint]")
{
    std::unordered_set<Endpoint> set;
    set.insert(Endpoint::fromOctets(127, 0, 0, 1, 1000));
    set.insert(Endpoint::fromOctets(127, 0, 0, 1, 1001));
    set.insert(Endpoint::fromOctets(127, 0, 0, 1, 1000));
    REQUIRE(set.size() == 2);
}

} // namespace tether::net
