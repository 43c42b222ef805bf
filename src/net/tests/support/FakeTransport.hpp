// /////////////////////////////////////////////////////////////////////////////
/// @file FakeTransport.hpp
/// @brief In-memory ITransport for unit tests.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/protocol/Messages.hpp>
#include <tether/net/transport/ITransport.hpp>

#include <algorithm>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tether::test {

class FakeTransport;

// /////////////////////////////////////////////////////////////////////////////
/// @class FakeNetwork
/// @brief Routes datagrams between FakeTransports by endpoint.
// /////////////////////////////////////////////////////////////////////////////
class FakeNetwork
{
public:
    void attach(const net::transport::Endpoint& at, FakeTransport* node)
    {
        std::lock_guard<std::mutex> lock{mutex_};
        nodes_[at] = node;
    }

    void route(std::vector<core::byte> bytes,
               const net::transport::Endpoint& from,
               const net::transport::Endpoint& to);

private:
    std::mutex                                                    mutex_;
    std::unordered_map<net::transport::Endpoint, FakeTransport*>  nodes_;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class FakeTransport
/// @brief Records sent datagrams and serves queued inbound ones.
///
/// Thread-safe so it can sit under a running GameServer.
// /////////////////////////////////////////////////////////////////////////////
class FakeTransport final : public net::transport::ITransport
{
public:
    struct Datagram
    {
        std::vector<core::byte>   bytes;
        net::transport::Endpoint  peer;
    };

    explicit FakeTransport(net::transport::Endpoint self = {}, FakeNetwork* network = nullptr)
        : self_{self}
        , network_{network}
    {
        if (network_ != nullptr)
        {
            network_->attach(self_, this);
        }
    }

    core::ExpectedVoid open() override
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (failOpen)
        {
            return core::makeError(core::ErrorCode::kNetworkBindFailed, "fake bind failure");
        }
        opened_ = true;
        return {};
    }

    void close() noexcept override
    {
        std::lock_guard<std::mutex> lock{mutex_};
        opened_ = false;
    }

    core::ExpectedVoid send(std::span<const core::byte> payload,
                            const net::transport::Endpoint& to) override
    {
        std::vector<core::byte> bytes{payload.begin(), payload.end()};
        {
            std::lock_guard<std::mutex> lock{mutex_};
            sent_.push_back(Datagram{bytes, to});
        }
        if (network_ != nullptr)
        {
            network_->route(std::move(bytes), self_, to);
        }
        return {};
    }

    core::Expected<std::optional<net::transport::ReceivedDatagram>> receive(
        std::span<core::byte> buffer) override
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (failReceive)
        {
            return core::makeError(core::ErrorCode::kNetworkReceiveFailed, "fake receive failure");
        }
        if (inbox_.empty())
        {
            return std::optional<net::transport::ReceivedDatagram>{};
        }

        auto datagram = std::move(inbox_.front());
        inbox_.pop_front();
        const auto n = std::min(buffer.size(), datagram.bytes.size());
        std::copy_n(datagram.bytes.begin(), n, buffer.begin());
        return std::optional<net::transport::ReceivedDatagram>{
            net::transport::ReceivedDatagram{datagram.peer, n}};
    }

    std::string_view name() const noexcept override { return "fake"; }

    // ---- Test helpers -----------------------------------------------------

    void deliver(std::vector<core::byte> bytes, const net::transport::Endpoint& from)
    {
        std::lock_guard<std::mutex> lock{mutex_};
        inbox_.push_back(Datagram{std::move(bytes), from});
    }

    void deliver(const net::protocol::Message& message, const net::transport::Endpoint& from)
    {
        deliver(net::protocol::encode(message), from);
    }

    [[nodiscard]] std::vector<Datagram> sent() const
    {
        std::lock_guard<std::mutex> lock{mutex_};
        return sent_;
    }

    /// Decodes every sent datagram; undecodable ones are skipped.
    [[nodiscard]] std::vector<net::protocol::Message> sentMessages() const
    {
        std::vector<net::protocol::Message> out;
        for (const auto& datagram : sent())
        {
            if (auto message = net::protocol::decode(datagram.bytes))
            {
                out.push_back(std::move(*message));
            }
        }
        return out;
    }

    void clearSent()
    {
        std::lock_guard<std::mutex> lock{mutex_};
        sent_.clear();
    }

    [[nodiscard]] std::size_t inboxSize() const
    {
        std::lock_guard<std::mutex> lock{mutex_};
        return inbox_.size();
    }

    [[nodiscard]] bool isOpen() const
    {
        std::lock_guard<std::mutex> lock{mutex_};
        return opened_;
    }

    [[nodiscard]] const net::transport::Endpoint& self() const noexcept { return self_; }

    bool failOpen{false};
    bool failReceive{false};

private:
    net::transport::Endpoint  self_;
    FakeNetwork*              network_;
    mutable std::mutex        mutex_;
    bool                      opened_{false};
    std::deque<Datagram>      inbox_;
    std::vector<Datagram>     sent_;
};

inline void FakeNetwork::route(std::vector<core::byte> bytes,
                               const net::transport::Endpoint& from,
                               const net::transport::Endpoint& to)
{
    FakeTransport* target = nullptr;
    {
        std::lock_guard<std::mutex> lock{mutex_};
        const auto it = nodes_.find(to);
        if (it != nodes_.end())
        {
            target = it->second;
        }
    }
    if (target != nullptr)
    {
        target->deliver(std::move(bytes), from);
    }
}

} // namespace tether::test
