// /////////////////////////////////////////////////////////////////////////////
/// @file NetworkSimulator.hpp
/// @brief Lossy, latent, reordering decorator over an ITransport.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/transport/ITransport.hpp>
#include <tether/net/protocol/Messages.hpp>
#include <tether/core/Types.hpp>
#include <tether/core/Expected.hpp>
#include <tether/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <span>

namespace tether::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @struct SimulatorSettings
/// @brief Injected network conditions. Zero means a perfect link.
// /////////////////////////////////////////////////////////////////////////////
struct SimulatorSettings
{
    core::u32 latencyMs{0};
    core::u32 packetLossPercent{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct SimulatorStats
/// @brief Running counters, mostly for diagnostics and tests.
// /////////////////////////////////////////////////////////////////////////////
struct SimulatorStats
{
    core::u64 sent{0};
    core::u64 delayed{0};
    core::u64 droppedOutbound{0};
    core::u64 received{0};
    core::u64 droppedInbound{0};
    core::u64 undecodable{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct IncomingMessage
/// @brief A decoded datagram together with its sender.
// /////////////////////////////////////////////////////////////////////////////
struct IncomingMessage
{
    protocol::Message message;
    Endpoint          from;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class NetworkSimulator
/// @brief Wraps a transport and degrades it on purpose.
///
/// Outbound datagrams are dropped with probability @c packetLossPercent.
/// Survivors either go out immediately (zero latency) or wait in a delay
/// queue for @c latencyMs plus a uniform jitter of +/-5 ms.  Every
/// @ref flush scans the whole queue, shuffles the batch that is due and
/// transmits it in that order, which produces genuine reordering.
///
/// Inbound datagrams face an independent drop with the same probability,
/// then are decoded; anything that does not decode is discarded.
///
/// All methods are thread-safe.
// /////////////////////////////////////////////////////////////////////////////
class NetworkSimulator final : public core::NonCopyable<NetworkSimulator>
{
public:
    /// @param transport Underlying transport, must outlive the simulator.
    /// @param settings  Initial network conditions.
    explicit NetworkSimulator(ITransport& transport, SimulatorSettings settings = {});

    /// @brief Same as above with a fixed random seed (deterministic tests).
    NetworkSimulator(ITransport& transport, SimulatorSettings settings, core::u64 seed);

    ~NetworkSimulator();

    void setLatency(core::u32 latencyMs) noexcept;
    void setPacketLoss(core::u32 percent) noexcept;

    [[nodiscard]] SimulatorSettings settings() const noexcept;
    [[nodiscard]] SimulatorStats stats() const noexcept;

    /// @brief Number of datagrams waiting in the delay queue.
    [[nodiscard]] core::usize pendingCount() const noexcept;

    /// @brief Encodes and sends @p message through the simulated link.
    /// @param sequence Input sequence carried for bookkeeping, 0 otherwise.
    /// @return Error only if the underlying transport rejected an
    ///         immediate send. A simulated drop is a success.
    [[nodiscard]] core::ExpectedVoid send(const protocol::Message& message,
                                          const Endpoint& to,
                                          core::u32 sequence = 0,
                                          core::TimePoint now = core::Clock::now());

    /// @brief Sends an already-encoded datagram through the simulated link.
    [[nodiscard]] core::ExpectedVoid sendRaw(std::span<const core::byte> datagram,
                                             const Endpoint& to,
                                             core::u32 sequence = 0,
                                             core::TimePoint now = core::Clock::now());

    /// @brief Transmits every queued datagram whose delay has elapsed.
    /// @return Number of datagrams handed to the transport.
    core::u32 flush(core::TimePoint now = core::Clock::now());

    /// @brief Flushes, then performs one non-blocking receive.
    /// @return A message, @c std::nullopt when nothing usable arrived, or a
    ///         transport error.
    [[nodiscard]] core::Expected<std::optional<IncomingMessage>> poll(
        core::TimePoint now = core::Clock::now());

    /// @brief Drops everything still waiting in the delay queue.
    void clear() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tether::net::transport
