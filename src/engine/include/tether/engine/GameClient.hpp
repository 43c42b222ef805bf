// /////////////////////////////////////////////////////////////////////////////
/// @file GameClient.hpp
/// @brief Predicting, reconciling and interpolating client.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/engine/Config.hpp>
#include <tether/engine/PerformanceAnalyzer.hpp>
#include <tether/net/netcode/Prediction.hpp>
#include <tether/net/protocol/Types.hpp>
#include <tether/net/transport/Endpoint.hpp>
#include <tether/net/transport/ITransport.hpp>
#include <tether/net/transport/NetworkSimulator.hpp>
#include <tether/core/Types.hpp>
#include <tether/core/Expected.hpp>
#include <tether/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace tether::engine {

// /////////////////////////////////////////////////////////////////////////////
/// @struct RemotePlayerView
/// @brief Where to draw another player this frame.
// /////////////////////////////////////////////////////////////////////////////
struct RemotePlayerView
{
    net::protocol::PlayerId  id;
    net::protocol::Position  position;
    net::protocol::Color     color;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct ClientView
/// @brief Everything a renderer needs for one frame.
// /////////////////////////////////////////////////////////////////////////////
struct ClientView
{
    std::optional<net::protocol::PlayerId> localId;
    net::protocol::Position                localPosition;
    net::protocol::Color                   localColor{0};
    std::vector<RemotePlayerView>          remotes;
    core::f32                              predictionError{0.0f};
    core::f32                              roundTripMs{0.0f};
    bool                                   connected{false};
    net::transport::SimulatorSettings      network;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class GameClient
/// @brief Single-threaded client driven by an explicit frame step.
///
/// Each @ref step keeps the session alive, predicts and sends local inputs,
/// drains the inbound queue, reconciles the local player against the latest
/// snapshot and feeds every other player's interpolation buffer.  Time is
/// passed in as seconds on a caller-chosen monotonic clock.
// /////////////////////////////////////////////////////////////////////////////
class GameClient final : public core::NonCopyable<GameClient>
{
public:
    /// @brief Client on an ephemeral UDP socket.
    GameClient(Config config, net::transport::Endpoint server);

    /// @brief Client on a caller-provided transport with a fixed seed.
    GameClient(Config config,
               net::transport::Endpoint server,
               std::unique_ptr<net::transport::ITransport> transport,
               core::u64 seed);

    ~GameClient();

    /// @brief Opens the transport and sends the first Connect.
    [[nodiscard]] core::ExpectedVoid init(core::f64 now);

    /// @brief Runs one frame.
    /// @param pressed Directions newly pressed this frame, in order.
    /// @param now     Client time in seconds.
    void step(std::span<const net::protocol::Direction> pressed, core::f64 now);

    /// @brief Sends an explicit Disconnect and stops acting as connected.
    void leave(core::f64 now);

    /// @brief Asks the server to resume the previous id at the current
    ///        position.  Falls back to Connect if no id was ever assigned.
    void reconnect(core::f64 now);

    /// @brief Enables or suspends keep-alive pings. Suspending them lets
    ///        the server time the session out.
    void setKeepAlive(bool enabled) noexcept;

    /// @brief Shifts the simulated latency by @p deltaMs (clamped).
    void adjustLatency(core::i32 deltaMs);

    /// @brief Shifts the simulated outbound/inbound loss by @p deltaPercent.
    void adjustPacketLoss(core::i32 deltaPercent);

    /// @brief Starts cycling through the analyzer's network conditions.
    void startPerformanceRun(core::f64 now);

    [[nodiscard]] ClientView view(core::f64 now) const;

    [[nodiscard]] const PerformanceAnalyzer& analyzer() const noexcept;
    [[nodiscard]] const net::netcode::PredictionEngine& prediction() const noexcept;
    [[nodiscard]] net::transport::NetworkSimulator& network() noexcept;

    /// @brief Sends a Disconnect if still connected and closes the transport.
    void shutdown(core::f64 now);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tether::engine
