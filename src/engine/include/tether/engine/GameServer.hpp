// /////////////////////////////////////////////////////////////////////////////
/// @file GameServer.hpp
/// @brief Authoritative server: inbound loop, broadcast tick, cleanup tick.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/engine/Config.hpp>
#include <tether/net/protocol/Messages.hpp>
#include <tether/net/session/SessionStore.hpp>
#include <tether/net/transport/Endpoint.hpp>
#include <tether/net/transport/ITransport.hpp>
#include <tether/net/transport/NetworkSimulator.hpp>
#include <tether/concurrency/Guarded.hpp>
#include <tether/core/Types.hpp>
#include <tether/core/Expected.hpp>
#include <tether/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace tether::engine {

// /////////////////////////////////////////////////////////////////////////////
/// @struct OutgoingMessage
/// @brief A reply produced by message handling, sent once the session lock
///        has been released.
// /////////////////////////////////////////////////////////////////////////////
struct OutgoingMessage
{
    net::transport::Endpoint  to;
    net::protocol::Message    message;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class GameServer
/// @brief Runs the authoritative simulation over UDP.
///
/// Three activities share one SessionStore behind a mutex:
///   - the inbound loop applies connects, inputs, pings and disconnects;
///   - the broadcast tick sends a full snapshot to every live session;
///   - the cleanup tick evicts idle sessions and expires old records.
/// No socket I/O ever happens while the store is locked.
// /////////////////////////////////////////////////////////////////////////////
class GameServer final : public core::NonCopyable<GameServer>
{
public:
    using Sessions = concurrency::Guarded<net::session::SessionStore>;

    /// @brief Server on a UDP socket bound to @c config.port().
    explicit GameServer(Config config);

    /// @brief Server on a caller-provided transport with a fixed seed.
    GameServer(Config config,
               std::unique_ptr<net::transport::ITransport> transport,
               core::u64 seed);

    ~GameServer();

    /// @brief Opens the transport and spawns the three activities.
    [[nodiscard]] core::ExpectedVoid start();

    /// @brief Stops and joins every activity, then closes the transport.
    void stop();

    [[nodiscard]] bool running() const noexcept;

    /// @brief Applies one inbound message and returns the replies.
    [[nodiscard]] std::vector<OutgoingMessage> handle(const net::protocol::Message& message,
                                                      const net::transport::Endpoint& from,
                                                      core::TimePoint now);

    /// @brief Receives, handles and answers at most one datagram.
    /// @return @c true if a message was processed.
    bool pollOnce(core::TimePoint now = core::Clock::now());

    /// @brief Sends the current snapshot to every live session.
    /// @return Number of sessions addressed.
    core::u32 broadcastTick(core::TimePoint now = core::Clock::now());

    /// @brief Evicts idle sessions, then expires old disconnect records.
    void cleanupTick(core::TimePoint now = core::Clock::now());

    [[nodiscard]] Sessions& sessions() noexcept;
    [[nodiscard]] net::transport::NetworkSimulator& network() noexcept;
    [[nodiscard]] const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tether::engine
