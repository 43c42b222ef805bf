/**
 * @file TestNetworkSimulator.cpp
 * @brief Unit tests for net::transport::NetworkSimulator.
 */

#include <catch2/catch_test_macros.hpp>

#include "support/FakeTransport.hpp"
#include "tether/net/transport/NetworkSimulator.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

namespace tether::net {

using namespace net::transport;
using namespace std::chrono_literals;
using protocol::PingMessage;

namespace {

const Endpoint kPeer = Endpoint::fromOctets(10, 0, 0, 2, 9000);

std::vector<core::u64> pingStamps(const test::FakeTransport& transport)
{
    std::vector<core::u64> stamps;
    for (const auto& message : transport.sentMessages())
    {
        if (const auto* ping = std::get_if<PingMessage>(&message))
            stamps.push_back(ping->timestampMs);
    }
    return stamps;
}

} // anonymous namespace

TEST_CASE("NetworkSimulator passes traffic through a perfect link", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{}, 1};
    const auto now = core::Clock::now();

    REQUIRE(simulator.send(PingMessage{7}, kPeer, 0, now).has_value());
    const auto sent = transport.sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].peer == kPeer);
    REQUIRE(pingStamps(transport) == std::vector<core::u64>{7});
    REQUIRE(simulator.pendingCount() == 0);
    REQUIRE(simulator.stats().sent == 1);
}

TEST_CASE("NetworkSimulator clamps its settings", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{5000, 250}, 1};
    REQUIRE(simulator.settings().latencyMs == core::kMaxLatencyMs);
    REQUIRE(simulator.settings().packetLossPercent == 100);

    simulator.setLatency(120);
    simulator.setPacketLoss(15);
    REQUIRE(simulator.settings().latencyMs == 120);
    REQUIRE(simulator.settings().packetLossPercent == 15);
}

TEST_CASE("NetworkSimulator drops every outbound datagram at full loss", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{0, 100}, 42};
    const auto now = core::Clock::now();

    for (core::u64 i = 0; i < 1000; ++i)
        REQUIRE(simulator.send(PingMessage{i}, kPeer, 0, now).has_value());

    REQUIRE(transport.sent().empty());
    REQUIRE(simulator.stats().droppedOutbound == 1000);
}

TEST_CASE("NetworkSimulator drops every inbound datagram at full loss", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{0, 100}, 42};

    for (core::u64 i = 0; i < 1000; ++i)
    {
        transport.deliver(PingMessage{i}, kPeer);
        const auto incoming = simulator.poll();
        REQUIRE(incoming.has_value());
        REQUIRE_FALSE(incoming->has_value());
    }
    REQUIRE(simulator.stats().droppedInbound == 1000);
}

TEST_CASE("NetworkSimulator loses roughly the configured share", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{0, 50}, 7};
    const auto now = core::Clock::now();

    for (core::u64 i = 0; i < 2000; ++i)
        REQUIRE(simulator.send(PingMessage{i}, kPeer, 0, now).has_value());

    const auto delivered = transport.sent().size();
    REQUIRE(delivered > 800);
    REQUIRE(delivered < 1200);
}

TEST_CASE("NetworkSimulator holds datagrams for the configured latency", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{100, 0}, 3};
    const auto t0 = core::Clock::now();

    REQUIRE(simulator.send(PingMessage{1}, kPeer, 1, t0).has_value());
    REQUIRE(transport.sent().empty());
    REQUIRE(simulator.pendingCount() == 1);

    REQUIRE(simulator.flush(t0 + 50ms) == 0);
    REQUIRE(transport.sent().empty());

    REQUIRE(simulator.flush(t0 + 106ms) == 1);
    REQUIRE(pingStamps(transport) == std::vector<core::u64>{1});
    REQUIRE(simulator.pendingCount() == 0);
}

TEST_CASE("NetworkSimulator reorders datagrams released together", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{50, 0}, 99};
    const auto t0 = core::Clock::now();

    std::vector<core::u64> order;
    for (core::u64 i = 0; i < 200; ++i)
    {
        REQUIRE(simulator.send(PingMessage{i}, kPeer, static_cast<core::u32>(i), t0).has_value());
        order.push_back(i);
    }

    REQUIRE(simulator.flush(t0 + 200ms) == 200);
    auto stamps = pingStamps(transport);
    REQUIRE(stamps.size() == 200);
    REQUIRE(stamps != order);

    std::sort(stamps.begin(), stamps.end());
    REQUIRE(stamps == order);
}

TEST_CASE("NetworkSimulator discards datagrams that do not decode", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{}, 5};

    transport.deliver(std::vector<core::byte>{core::byte{0xDE}, core::byte{0xAD}}, kPeer);
    transport.deliver(PingMessage{9}, kPeer);

    const auto garbage = simulator.poll();
    REQUIRE(garbage.has_value());
    REQUIRE_FALSE(garbage->has_value());
    REQUIRE(simulator.stats().undecodable == 1);

    const auto valid = simulator.poll();
    REQUIRE(valid.has_value());
    REQUIRE(valid->has_value());
    REQUIRE((*valid)->from == kPeer);
    REQUIRE(std::get<PingMessage>((*valid)->message).timestampMs == 9);

    const auto idle = simulator.poll();
    REQUIRE(idle.has_value());
    REQUIRE_FALSE(idle->has_value());
}

TEST_CASE("NetworkSimulator propagates transport failures", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{}, 5};
    transport.failReceive = true;

    const auto result = simulator.poll();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kNetworkReceiveFailed);
}

TEST_CASE("NetworkSimulator clear forgets queued datagrams", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{300, 0}, 5};
    const auto t0 = core::Clock::now();

    REQUIRE(simulator.send(PingMessage{1}, kPeer, 0, t0).has_value());
    simulator.clear();
    REQUIRE(simulator.flush(t0 + 1s) == 0);
    REQUIRE(transport.sent().empty());
}

TEST_CASE("NetworkSimulator receives the largest snapshot intact", "[transport][simulator]")
{
    test::FakeTransport transport;
    NetworkSimulator simulator{transport, SimulatorSettings{}, 6};

    protocol::GameStateSnapshot snapshot;
    for (core::usize i = 0; i < protocol::kMaxSnapshotPlayers; ++i)
    {
        const auto id = static_cast<protocol::PlayerId>(1000 + i);
        snapshot.players.push_back(protocol::PlayerState{
            id, protocol::Position{static_cast<core::i32>(i % 1000), 20}, 0xFF1717u});
        snapshot.lastProcessedInput[id] = static_cast<core::u32>(i);
    }
    snapshot.serverTimestampMs = 123456;

    const auto bytes = protocol::encode(protocol::SnapshotMessage{snapshot});
    REQUIRE(bytes.size() > 2048);
    REQUIRE(bytes.size() <= core::kMaxDatagramSize);
    transport.deliver(bytes, kPeer);

    const auto received = simulator.poll();
    REQUIRE(received.has_value());
    REQUIRE(received->has_value());
    const auto& decoded = std::get<protocol::SnapshotMessage>((*received)->message).snapshot;
    REQUIRE(decoded.players.size() == protocol::kMaxSnapshotPlayers);
    REQUIRE(decoded.lastProcessedInput.size() == protocol::kMaxSnapshotPlayers);
    REQUIRE(decoded == snapshot);
    REQUIRE(simulator.stats().undecodable == 0);
}

} // namespace tether::net
