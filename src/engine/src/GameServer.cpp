// /////////////////////////////////////////////////////////////////////////////
/// @file GameServer.cpp
/// @brief GameServer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/engine/GameServer.hpp>
#include <tether/net/transport/SocketTransport.hpp>
#include <tether/concurrency/PeriodicWorker.hpp>
#include <tether/core/Log.hpp>

#include <atomic>
#include <chrono>
#include <random>
#include <thread>

namespace tether::engine {

namespace {

template <typename... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

struct GameServer::Impl
{
    Config                                          config;
    std::unique_ptr<net::transport::ITransport>     transport;
    net::transport::NetworkSimulator                network;
    Sessions                                        sessions;

    std::atomic<bool>                               running{false};
    std::thread                                     receiveThread;
    std::unique_ptr<concurrency::PeriodicWorker>    broadcastWorker;
    std::unique_ptr<concurrency::PeriodicWorker>    cleanupWorker;

    Impl(Config cfg, std::unique_ptr<net::transport::ITransport> t, core::u64 seed)
        : config{std::move(cfg)}
        , transport{std::move(t)}
        , network{*transport,
                  net::transport::SimulatorSettings{config.latencyMs(), config.packetLossPercent()},
                  seed}
        , sessions{seed}
    {}

    void send(const OutgoingMessage& out, core::TimePoint now)
    {
        auto result = network.send(out.message, out.to, 0, now);
        if (!result)
        {
            core::Log::warn("server", "send to " + out.to.toString() + " failed: " +
                                      result.error().message());
        }
    }
};

GameServer::GameServer(Config config)
    : GameServer{config,
                 std::make_unique<net::transport::SocketTransport>(config.port()),
                 std::random_device{}()}
{}

GameServer::GameServer(Config config,
                       std::unique_ptr<net::transport::ITransport> transport,
                       core::u64 seed)
    : impl_{std::make_unique<Impl>(std::move(config), std::move(transport), seed)}
{}

GameServer::~GameServer()
{
    stop();
}

core::ExpectedVoid GameServer::start()
{
    if (impl_->running)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Server already running");
    }

    TETHER_TRY_VOID(impl_->transport->open());

    impl_->running = true;

    impl_->receiveThread = std::thread{[this] {
        while (impl_->running)
        {
            if (!pollOnce())
            {
                std::this_thread::sleep_for(std::chrono::milliseconds{1});
            }
        }
    }};

    impl_->broadcastWorker = std::make_unique<concurrency::PeriodicWorker>(
        "broadcast",
        std::chrono::milliseconds{impl_->config.broadcastIntervalMs()},
        [this] { broadcastTick(); });

    impl_->cleanupWorker = std::make_unique<concurrency::PeriodicWorker>(
        "cleanup",
        std::chrono::milliseconds{impl_->config.cleanupIntervalMs()},
        [this] { cleanupTick(); });

    impl_->broadcastWorker->start();
    impl_->cleanupWorker->start();

    core::Log::info("server", "listening on port " + std::to_string(impl_->config.port()) +
                              " via " + std::string{impl_->transport->name()});
    return {};
}

void GameServer::stop()
{
    if (!impl_->running.exchange(false))
    {
        return;
    }

    if (impl_->receiveThread.joinable())
    {
        impl_->receiveThread.join();
    }
    if (impl_->broadcastWorker)
    {
        impl_->broadcastWorker->stop();
    }
    if (impl_->cleanupWorker)
    {
        impl_->cleanupWorker->stop();
    }

    impl_->network.clear();
    impl_->transport->close();
    core::Log::info("server", "stopped");
}

bool GameServer::running() const noexcept
{
    return impl_->running;
}

std::vector<OutgoingMessage> GameServer::handle(const net::protocol::Message& message,
                                                const net::transport::Endpoint& from,
                                                core::TimePoint now)
{
    namespace protocol = net::protocol;
    std::vector<OutgoingMessage> replies;

    auto welcome = [&](protocol::PlayerId id, protocol::GameStateSnapshot snapshot) {
        replies.push_back(OutgoingMessage{from, protocol::PlayerIdMessage{id}});
        replies.push_back(OutgoingMessage{from, protocol::SnapshotMessage{std::move(snapshot)}});
    };

    std::visit(Overloaded{
        [&](const protocol::ConnectMessage&) {
            auto [id, snapshot] = impl_->sessions.with([&](net::session::SessionStore& store) {
                const auto assigned = store.connect(from, now);
                return std::pair{assigned, store.buildSnapshot(now)};
            });
            welcome(id, std::move(snapshot));
        },
        [&](const protocol::ReconnectMessage& msg) {
            auto [id, snapshot] = impl_->sessions.with([&](net::session::SessionStore& store) {
                if (store.reconnect(from, msg.previousId, msg.position, now, impl_->config.gracePeriod()))
                {
                    return std::pair{msg.previousId, store.buildSnapshot(now)};
                }
                const auto assigned = store.connect(from, now);
                return std::pair{assigned, store.buildSnapshot(now)};
            });
            if (id != msg.previousId)
            {
                core::Log::info("server", "reconnect of " + std::to_string(msg.previousId) +
                                          " refused, issued " + std::to_string(id));
            }
            welcome(id, std::move(snapshot));
        },
        [&](const protocol::InputMessage& msg) {
            const bool applied = impl_->sessions.with([&](net::session::SessionStore& store) {
                return store.applyInput(from, msg.input, now);
            });
            if (!applied && core::Log::enabled(core::LogLevel::kDebug))
            {
                core::Log::debug("server", "input from unknown endpoint " + from.toString());
            }
        },
        [&](const protocol::DisconnectMessage&) {
            impl_->sessions.with([&](net::session::SessionStore& store) {
                return store.disconnect(from, now);
            });
            replies.push_back(OutgoingMessage{from, protocol::DisconnectMessage{}});
        },
        [&](const protocol::PingMessage& msg) {
            impl_->sessions.with([&](net::session::SessionStore& store) {
                return store.touch(from, now);
            });
            replies.push_back(OutgoingMessage{from, protocol::PongMessage{msg.timestampMs}});
        },
        [&](const protocol::PongMessage&) {},
        [&](const protocol::PlayerIdMessage&) {
            if (core::Log::enabled(core::LogLevel::kDebug))
            {
                core::Log::debug("server", "ignoring PlayerId from " + from.toString());
            }
        },
        [&](const protocol::SnapshotMessage&) {
            if (core::Log::enabled(core::LogLevel::kDebug))
            {
                core::Log::debug("server", "ignoring snapshot from " + from.toString());
            }
        },
    }, message);

    return replies;
}

bool GameServer::pollOnce(core::TimePoint now)
{
    auto incoming = impl_->network.poll(now);
    if (!incoming)
    {
        core::Log::warn("server", "receive failed: " + incoming.error().message());
        return false;
    }
    if (!incoming->has_value())
    {
        return false;
    }

    const auto& [message, from] = **incoming;
    for (const auto& reply : handle(message, from, now))
    {
        impl_->send(reply, now);
    }
    return true;
}

core::u32 GameServer::broadcastTick(core::TimePoint now)
{
    auto [snapshot, targets] = impl_->sessions.with([&](const net::session::SessionStore& store) {
        return std::pair{store.buildSnapshot(now), store.endpoints()};
    });

    if (targets.empty())
    {
        impl_->network.flush(now);
        return 0;
    }

    const auto datagram = net::protocol::encode(net::protocol::SnapshotMessage{std::move(snapshot)});
    if (datagram.size() > core::kMaxDatagramSize)
    {
        // sendto would fail with EMSGSIZE.
        core::Log::error("server", "snapshot of " + std::to_string(datagram.size()) +
                                   " bytes exceeds the largest UDP payload, not sent");
        impl_->network.flush(now);
        return 0;
    }

    for (const auto& endpoint : targets)
    {
        auto result = impl_->network.sendRaw(datagram, endpoint, 0, now);
        if (!result)
        {
            core::Log::warn("server", "snapshot to " + endpoint.toString() + " failed: " +
                                      result.error().message());
        }
    }
    impl_->network.flush(now);
    return static_cast<core::u32>(targets.size());
}

void GameServer::cleanupTick(core::TimePoint now)
{
    const auto timeout = impl_->config.sessionTimeout();
    const auto grace = impl_->config.gracePeriod();

    const auto [evicted, expired] = impl_->sessions.with([&](net::session::SessionStore& store) {
        const auto e = store.evictTimedOut(now, timeout);
        const auto x = store.cleanupExpired(now, grace);
        return std::pair{e, x};
    });

    if (evicted > 0 || expired > 0)
    {
        core::Log::debug("server", "cleanup: " + std::to_string(evicted) + " evicted, " +
                                   std::to_string(expired) + " records expired");
    }
}

GameServer::Sessions& GameServer::sessions() noexcept
{
    return impl_->sessions;
}

net::transport::NetworkSimulator& GameServer::network() noexcept
{
    return impl_->network;
}

const Config& GameServer::config() const noexcept
{
    return impl_->config;
}

} // namespace tether::engine
