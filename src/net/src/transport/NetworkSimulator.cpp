// /////////////////////////////////////////////////////////////////////////////
/// @file NetworkSimulator.cpp
/// @brief NetworkSimulator implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/transport/NetworkSimulator.hpp>
#include <tether/core/Constants.hpp>
#include <tether/core/Log.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <iterator>
#include <mutex>
#include <random>
#include <vector>

namespace tether::net::transport {

namespace {

struct DelayedPacket
{
    std::vector<core::byte>   payload;
    Endpoint                  to;
    core::TimePoint           enqueuedAt;
    core::u32                 sequence;
    std::chrono::milliseconds delay;
};

} // anonymous namespace

struct NetworkSimulator::Impl
{
    ITransport&                  transport;
    SimulatorSettings            settings;
    SimulatorStats               stats;
    std::vector<DelayedPacket>   queue;
    std::mt19937                 rng;
    std::array<core::byte, core::kMaxDatagramSize> receiveBuffer{};
    mutable std::mutex           mutex;

    Impl(ITransport& t, SimulatorSettings s, core::u64 seed)
        : transport{t}
        , settings{s}
        , rng{static_cast<std::mt19937::result_type>(seed)}
    {}

    bool rollDrop()
    {
        if (settings.packetLossPercent == 0)
        {
            return false;
        }
        std::bernoulli_distribution drop{static_cast<core::f64>(settings.packetLossPercent) / 100.0};
        return drop(rng);
    }

    std::chrono::milliseconds jitteredDelay()
    {
        std::uniform_int_distribution<core::i64> jitter{-core::kJitterMs, core::kJitterMs};
        const core::i64 ms = static_cast<core::i64>(settings.latencyMs) + jitter(rng);
        return std::chrono::milliseconds{std::max<core::i64>(0, ms)};
    }

    core::u32 flushLocked(core::TimePoint now)
    {
        const auto split = std::stable_partition(queue.begin(), queue.end(),
            [now](const DelayedPacket& p) { return now - p.enqueuedAt < p.delay; });

        std::vector<DelayedPacket> ready{std::make_move_iterator(split),
                                         std::make_move_iterator(queue.end())};
        queue.erase(split, queue.end());

        std::shuffle(ready.begin(), ready.end(), rng);

        core::u32 transmitted = 0;
        for (const auto& packet : ready)
        {
            auto result = transport.send(packet.payload, packet.to);
            if (!result)
            {
                core::Log::warn("net", "NetworkSimulator: delayed send failed: " + result.error().message());
                continue;
            }
            ++transmitted;
            ++stats.sent;
        }
        return transmitted;
    }
};

NetworkSimulator::NetworkSimulator(ITransport& transport, SimulatorSettings settings)
    : NetworkSimulator{transport, settings, std::random_device{}()}
{}

NetworkSimulator::NetworkSimulator(ITransport& transport, SimulatorSettings settings, core::u64 seed)
    : impl_{std::make_unique<Impl>(transport, settings, seed)}
{
    setPacketLoss(settings.packetLossPercent);
    setLatency(settings.latencyMs);
}

NetworkSimulator::~NetworkSimulator() = default;

void NetworkSimulator::setLatency(core::u32 latencyMs) noexcept
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    impl_->settings.latencyMs = std::min(latencyMs, core::kMaxLatencyMs);
}

void NetworkSimulator::setPacketLoss(core::u32 percent) noexcept
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    impl_->settings.packetLossPercent = std::min(percent, core::kMaxPacketLossPercent);
}

SimulatorSettings NetworkSimulator::settings() const noexcept
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->settings;
}

SimulatorStats NetworkSimulator::stats() const noexcept
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->stats;
}

core::usize NetworkSimulator::pendingCount() const noexcept
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->queue.size();
}

core::ExpectedVoid NetworkSimulator::send(const protocol::Message& message,
                                          const Endpoint& to,
                                          core::u32 sequence,
                                          core::TimePoint now)
{
    const auto datagram = protocol::encode(message);
    return sendRaw(datagram, to, sequence, now);
}

core::ExpectedVoid NetworkSimulator::sendRaw(std::span<const core::byte> datagram,
                                             const Endpoint& to,
                                             core::u32 sequence,
                                             core::TimePoint now)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};

    impl_->flushLocked(now);

    if (impl_->rollDrop())
    {
        ++impl_->stats.droppedOutbound;
        return {};
    }

    if (impl_->settings.latencyMs > 0)
    {
        impl_->queue.push_back(DelayedPacket{
            {datagram.begin(), datagram.end()}, to, now, sequence, impl_->jitteredDelay()});
        ++impl_->stats.delayed;
        return {};
    }

    auto sent = impl_->transport.send(datagram, to);
    if (!sent)
    {
        return std::unexpected(sent.error());
    }
    ++impl_->stats.sent;
    return {};
}

core::u32 NetworkSimulator::flush(core::TimePoint now)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    return impl_->flushLocked(now);
}

core::Expected<std::optional<IncomingMessage>> NetworkSimulator::poll(core::TimePoint now)
{
    std::lock_guard<std::mutex> lock{impl_->mutex};

    impl_->flushLocked(now);

    const auto datagram = TETHER_TRY(impl_->transport.receive(impl_->receiveBuffer));
    if (!datagram)
    {
        return std::optional<IncomingMessage>{};
    }
    const Endpoint& from = datagram->from;

    ++impl_->stats.received;

    if (impl_->rollDrop())
    {
        ++impl_->stats.droppedInbound;
        return std::optional<IncomingMessage>{};
    }

    auto message = protocol::decode(std::span<const core::byte>{impl_->receiveBuffer.data(), datagram->size});
    if (!message)
    {
        ++impl_->stats.undecodable;
        if (core::Log::enabled(core::LogLevel::kDebug))
        {
            core::Log::debug("net", "NetworkSimulator: dropped datagram from " + from.toString() +
                                    ": " + message.error().message());
        }
        return std::optional<IncomingMessage>{};
    }

    return std::optional<IncomingMessage>{IncomingMessage{std::move(*message), from}};
}

void NetworkSimulator::clear() noexcept
{
    std::lock_guard<std::mutex> lock{impl_->mutex};
    impl_->queue.clear();
}

} // namespace tether::net::transport
