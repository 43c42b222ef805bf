// /////////////////////////////////////////////////////////////////////////////
/// @file GameClient.cpp
/// @brief GameClient implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/engine/GameClient.hpp>
#include <tether/net/netcode/Interpolation.hpp>
#include <tether/net/protocol/Messages.hpp>
#include <tether/net/transport/SocketTransport.hpp>
#include <tether/core/Constants.hpp>
#include <tether/core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <limits>
#include <random>
#include <unordered_map>

namespace tether::engine {

namespace protocol  = net::protocol;
namespace transport = net::transport;
namespace netcode   = net::netcode;

namespace {

/// Upper bound on datagrams handled per frame.
constexpr core::u32 kMaxMessagesPerStep = 64;

/// Delay between two Connect attempts while no id has been assigned.
constexpr core::f64 kConnectRetrySec = 1.0;

constexpr core::f64 kNever = -std::numeric_limits<core::f64>::infinity();

struct RemoteEntity
{
    netcode::InterpolationBuffer buffer;
    protocol::Color              color;
    protocol::Position           lastKnown;
};

} // anonymous namespace

struct GameClient::Impl
{
    Config                                      config;
    transport::Endpoint                         server;
    std::unique_ptr<transport::ITransport>      socket;
    transport::NetworkSimulator                 network;
    netcode::PredictionEngine                   prediction;
    PerformanceAnalyzer                         analyzer;
    std::unordered_map<protocol::PlayerId, RemoteEntity> remotes;

    core::TimePoint                             epoch{core::Clock::now()};
    std::optional<protocol::PlayerId>           localId;
    protocol::Position                          localPosition{};
    protocol::Color                             localColor{0};
    bool                                        open{false};
    bool                                        connected{false};
    bool                                        awaitingId{false};
    bool                                        awaitingBaseline{false};
    bool                                        keepAlive{true};
    core::f64                                   lastPing{kNever};
    core::f64                                   lastConnectAttempt{kNever};
    core::u64                                   newestSnapshotMs{0};
    core::f32                                   predictionError{0.0f};
    core::f32                                   roundTripMs{0.0f};
    transport::SimulatorSettings                settingsBeforeRun{};

    Impl(Config cfg, transport::Endpoint srv, std::unique_ptr<transport::ITransport> t, core::u64 seed)
        : config{std::move(cfg)}
        , server{srv}
        , socket{std::move(t)}
        , network{*socket,
                  transport::SimulatorSettings{config.latencyMs(), config.packetLossPercent()},
                  seed}
        , prediction{protocol::Position{},
                     netcode::ReconcileSettings{config.reconcileGapThreshold(), config.reconcileWindowSec()}}
    {}

    core::TimePoint toTimePoint(core::f64 now) const
    {
        return epoch + std::chrono::duration_cast<core::Duration>(std::chrono::duration<core::f64>(now));
    }

    static core::u64 toMs(core::f64 now) noexcept
    {
        return static_cast<core::u64>(std::max(now, 0.0) * 1000.0);
    }

    void send(const protocol::Message& message, core::f64 now, core::u32 sequence = 0)
    {
        auto result = network.send(message, server, sequence, toTimePoint(now));
        if (!result)
        {
            core::Log::warn("client", std::string{"sending "} +
                                      protocol::toString(protocol::packetTypeOf(message)) +
                                      " failed: " + result.error().message());
        }
    }

    void sendConnect(core::f64 now)
    {
        awaitingId = true;
        lastConnectAttempt = now;
        send(protocol::ConnectMessage{}, now);
    }

    void applyCondition(core::f64 now)
    {
        if (const auto* condition = analyzer.current())
        {
            network.setLatency(condition->latencyMs);
            network.setPacketLoss(condition->packetLossPercent);
            return;
        }

        network.setLatency(settingsBeforeRun.latencyMs);
        network.setPacketLoss(settingsBeforeRun.packetLossPercent);
        core::Log::info("client", "performance run finished at t=" + std::to_string(now));
    }

    void onPlayerId(protocol::PlayerId id)
    {
        if (id == protocol::kInvalidPlayerId)
        {
            return;
        }
        if (localId == id && connected && !awaitingId)
        {
            return;
        }

        if (localId.has_value() && *localId != id)
        {
            core::Log::info("client", "server assigned new id " + std::to_string(id) +
                                      " (was " + std::to_string(*localId) + ")");
            remotes.clear();
        }
        else
        {
            core::Log::info("client", "assigned player id " + std::to_string(id));
        }

        localId = id;
        connected = true;
        awaitingId = false;
        awaitingBaseline = true;
    }

    void onSnapshot(const protocol::GameStateSnapshot& snapshot, core::f64 now)
    {
        if (!localId || !connected)
        {
            return;
        }
        if (snapshot.serverTimestampMs < newestSnapshotMs)
        {
            return;
        }
        newestSnapshotMs = snapshot.serverTimestampMs;

        const auto* me = snapshot.find(*localId);
        if (me == nullptr)
        {
            if (!awaitingBaseline)
            {
                core::Log::warn("client", "server no longer tracks player " + std::to_string(*localId));
                connected = false;
            }
            return;
        }

        const core::u32 ack = snapshot.ackFor(*localId).value_or(0);
        if (awaitingBaseline)
        {
            prediction.reset(me->position, std::max(ack, prediction.lastConfirmedSequence()), now);
            awaitingBaseline = false;
            predictionError = 0.0f;
        }
        else
        {
            if (ack > prediction.lastConfirmedSequence())
            {
                predictionError = prediction.divergenceAt(me->position, ack, localPosition);
                analyzer.recordPredictionError(predictionError);
            }
            prediction.reconcile(me->position, ack, now);
        }
        prediction.reapplyPendingInputs(localPosition);
        localColor = me->color;

        for (const auto& player : snapshot.players)
        {
            if (player.id == *localId)
            {
                continue;
            }
            auto [it, inserted] = remotes.try_emplace(
                player.id,
                RemoteEntity{netcode::InterpolationBuffer{config.interpolationDelaySec()},
                             player.color,
                             player.position});
            it->second.color = player.color;
            it->second.lastKnown = player.position;
            it->second.buffer.addPosition(player.position, now, snapshot.ackFor(player.id).value_or(0));
        }

        std::erase_if(remotes, [&snapshot](const auto& entry) {
            return snapshot.find(entry.first) == nullptr;
        });
    }

    void handle(const transport::IncomingMessage& incoming, core::f64 now)
    {
        if (incoming.from != server)
        {
            if (core::Log::enabled(core::LogLevel::kDebug))
            {
                core::Log::debug("client", "ignoring datagram from " + incoming.from.toString());
            }
            return;
        }

        if (const auto* assigned = std::get_if<protocol::PlayerIdMessage>(&incoming.message))
        {
            onPlayerId(assigned->id);
        }
        else if (const auto* state = std::get_if<protocol::SnapshotMessage>(&incoming.message))
        {
            onSnapshot(state->snapshot, now);
        }
        else if (const auto* pong = std::get_if<protocol::PongMessage>(&incoming.message))
        {
            const auto sentMs = pong->timestampMs;
            const auto nowMs = toMs(now);
            roundTripMs = (nowMs >= sentMs) ? static_cast<core::f32>(nowMs - sentMs) : 0.0f;
            analyzer.recordRoundTrip(roundTripMs);
        }
        else if (std::holds_alternative<protocol::DisconnectMessage>(incoming.message))
        {
            core::Log::info("client", "server acknowledged disconnect");
            connected = false;
        }
        else if (const auto* ping = std::get_if<protocol::PingMessage>(&incoming.message))
        {
            send(protocol::PongMessage{ping->timestampMs}, now);
        }
    }
};

GameClient::GameClient(Config config, transport::Endpoint server)
    : GameClient{std::move(config), server, std::make_unique<transport::SocketTransport>(0),
                 std::random_device{}()}
{}

GameClient::GameClient(Config config,
                       transport::Endpoint server,
                       std::unique_ptr<transport::ITransport> link,
                       core::u64 seed)
    : impl_{std::make_unique<Impl>(std::move(config), server, std::move(link), seed)}
{}

GameClient::~GameClient()
{
    if (impl_ && impl_->open)
    {
        impl_->socket->close();
    }
}

core::ExpectedVoid GameClient::init(core::f64 now)
{
    if (impl_->open)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Client already initialised");
    }

    TETHER_TRY_VOID(impl_->socket->open());
    impl_->open = true;

    core::Log::info("client", "connecting to " + impl_->server.toString());
    impl_->sendConnect(now);
    return {};
}

void GameClient::step(std::span<const protocol::Direction> pressed, core::f64 now)
{
    if (!impl_->open)
    {
        return;
    }

    if (impl_->analyzer.running() && impl_->analyzer.update(now))
    {
        impl_->applyCondition(now);
    }

    if (!impl_->localId && impl_->awaitingId && now - impl_->lastConnectAttempt >= kConnectRetrySec)
    {
        impl_->sendConnect(now);
    }

    const core::f64 pingInterval = static_cast<core::f64>(impl_->config.pingIntervalMs()) / 1000.0;
    if (impl_->connected && impl_->keepAlive && now - impl_->lastPing >= pingInterval)
    {
        impl_->lastPing = now;
        impl_->send(protocol::PingMessage{Impl::toMs(now)}, now);
    }

    if (impl_->connected && !impl_->awaitingBaseline)
    {
        for (const auto direction : pressed)
        {
            const auto input = impl_->prediction.recordInput(direction, Impl::toMs(now));
            impl_->prediction.applyPrediction(input, impl_->localPosition);
            impl_->send(protocol::InputMessage{input}, now, input.sequence);
        }
    }

    for (core::u32 i = 0; i < kMaxMessagesPerStep; ++i)
    {
        auto incoming = impl_->network.poll(impl_->toTimePoint(now));
        if (!incoming)
        {
            core::Log::warn("client", "receive failed: " + incoming.error().message());
            break;
        }
        if (!incoming->has_value())
        {
            break;
        }
        impl_->handle(**incoming, now);
    }

    impl_->network.flush(impl_->toTimePoint(now));
}

void GameClient::leave(core::f64 now)
{
    if (!impl_->open || !impl_->connected)
    {
        return;
    }
    impl_->send(protocol::DisconnectMessage{}, now);
    impl_->connected = false;
    core::Log::info("client", "left the game");
}

void GameClient::reconnect(core::f64 now)
{
    if (!impl_->open)
    {
        return;
    }

    if (!impl_->localId)
    {
        impl_->sendConnect(now);
        return;
    }

    // Unacknowledged inputs are abandoned; the claimed position already
    // includes their effect.
    impl_->prediction.reset(impl_->localPosition, impl_->prediction.nextSequence() - 1, now);
    impl_->awaitingId = true;
    impl_->connected = false;
    impl_->keepAlive = true;
    impl_->newestSnapshotMs = 0;
    impl_->lastConnectAttempt = now;

    core::Log::info("client", "reconnecting as " + std::to_string(*impl_->localId) +
                              " at " + protocol::toString(impl_->localPosition));
    impl_->send(protocol::ReconnectMessage{*impl_->localId, impl_->localPosition}, now);
}

void GameClient::setKeepAlive(bool enabled) noexcept
{
    impl_->keepAlive = enabled;
}

void GameClient::adjustLatency(core::i32 deltaMs)
{
    const auto current = static_cast<core::i64>(impl_->network.settings().latencyMs);
    const auto next = std::clamp<core::i64>(current + deltaMs, 0, core::kMaxLatencyMs);
    impl_->network.setLatency(static_cast<core::u32>(next));
}

void GameClient::adjustPacketLoss(core::i32 deltaPercent)
{
    const auto current = static_cast<core::i64>(impl_->network.settings().packetLossPercent);
    const auto next = std::clamp<core::i64>(current + deltaPercent, 0, core::kMaxPacketLossPercent);
    impl_->network.setPacketLoss(static_cast<core::u32>(next));
}

void GameClient::startPerformanceRun(core::f64 now)
{
    if (!impl_->analyzer.running())
    {
        impl_->settingsBeforeRun = impl_->network.settings();
    }
    impl_->analyzer.start(now);
    impl_->applyCondition(now);
}

ClientView GameClient::view(core::f64 now) const
{
    ClientView out;
    out.localId = impl_->localId;
    out.localPosition = impl_->localPosition;
    out.localColor = impl_->localColor;
    out.predictionError = impl_->predictionError;
    out.roundTripMs = impl_->roundTripMs;
    out.connected = impl_->connected;
    out.network = impl_->network.settings();

    out.remotes.reserve(impl_->remotes.size());
    for (const auto& [id, remote] : impl_->remotes)
    {
        const auto position = remote.buffer.interpolatedPosition(now).value_or(remote.lastKnown);
        out.remotes.push_back(RemotePlayerView{id, position, remote.color});
    }
    std::sort(out.remotes.begin(), out.remotes.end(),
              [](const RemotePlayerView& a, const RemotePlayerView& b) { return a.id < b.id; });
    return out;
}

const PerformanceAnalyzer& GameClient::analyzer() const noexcept
{
    return impl_->analyzer;
}

const netcode::PredictionEngine& GameClient::prediction() const noexcept
{
    return impl_->prediction;
}

transport::NetworkSimulator& GameClient::network() noexcept
{
    return impl_->network;
}

void GameClient::shutdown(core::f64 now)
{
    if (!impl_->open)
    {
        return;
    }
    leave(now);
    impl_->network.flush(impl_->toTimePoint(now));
    impl_->socket->close();
    impl_->open = false;
}

} // namespace tether::engine
