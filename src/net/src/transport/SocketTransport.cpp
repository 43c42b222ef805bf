// /////////////////////////////////////////////////////////////////////////////
/// @file SocketTransport.cpp
/// @brief SocketTransport implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/transport/SocketTransport.hpp>
#include <tether/core/Log.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace tether::net::transport {

namespace {

/// Owns a file descriptor; -1 means none.
class Descriptor final
{
public:
    Descriptor() noexcept = default;
    explicit Descriptor(int fd) noexcept : fd_{fd} {}
    Descriptor(Descriptor&& other) noexcept : fd_{std::exchange(other.fd_, -1)} {}
    Descriptor& operator=(Descriptor&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;
    ~Descriptor() { reset(); }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept
    {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_{-1};
};

sockaddr_in toSockaddr(core::u32 address, core::u16 port) noexcept
{
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(address);
    return addr;
}

core::Unexpected systemError(core::ErrorCode code, std::string_view call, int err)
{
    return core::makeError(code, std::string{call} + ": " + std::strerror(err));
}

// EWOULDBLOCK: nothing queued.  ECONNREFUSED: the kernel is reporting an
// ICMP port-unreachable for an earlier sendto; the socket itself is fine.
bool isQuietReceiveError(int err) noexcept
{
    return err == EAGAIN || err == EWOULDBLOCK || err == ECONNREFUSED || err == EINTR;
}

} // anonymous namespace

struct SocketTransport::Impl
{
    core::u16  requestedPort;
    core::u16  boundPort{0};
    Descriptor socket;
};

SocketTransport::SocketTransport(core::u16 port)
    : impl_{std::make_unique<Impl>(Impl{port, 0, Descriptor{}})}
{}

SocketTransport::~SocketTransport() = default;

core::ExpectedVoid SocketTransport::open()
{
    if (impl_->socket.valid())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "socket is already open");
    }

    Descriptor fd{::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0)};
    if (!fd.valid())
    {
        return systemError(core::ErrorCode::kIoError, "socket", errno);
    }

    const sockaddr_in local = toSockaddr(INADDR_ANY, impl_->requestedPort);
    if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0)
    {
        const int err = errno;
        return core::makeError(core::ErrorCode::kNetworkBindFailed,
                               "port " + std::to_string(impl_->requestedPort) + ": " + std::strerror(err));
    }

    sockaddr_in bound{};
    socklen_t length = sizeof(bound);
    if (::getsockname(fd.get(), reinterpret_cast<sockaddr*>(&bound), &length) != 0)
    {
        return systemError(core::ErrorCode::kIoError, "getsockname", errno);
    }

    impl_->boundPort = ntohs(bound.sin_port);
    impl_->socket = std::move(fd);
    core::Log::info("net", "udp socket bound to port " + std::to_string(impl_->boundPort));
    return {};
}

void SocketTransport::close() noexcept
{
    impl_->socket.reset();
    impl_->boundPort = 0;
}

core::ExpectedVoid SocketTransport::send(std::span<const core::byte> payload, const Endpoint& to)
{
    if (!impl_->socket.valid())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "send on a closed socket");
    }

    const sockaddr_in peer = toSockaddr(to.address(), to.port());
    const ssize_t sent = ::sendto(impl_->socket.get(), payload.data(), payload.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&peer), sizeof(peer));
    if (sent < 0)
    {
        const int err = errno;
        return core::makeError(core::ErrorCode::kNetworkSendFailed,
                               to.toString() + ": " + std::strerror(err));
    }
    if (static_cast<core::usize>(sent) != payload.size())
    {
        return core::makeError(core::ErrorCode::kNetworkSendFailed,
                               "short datagram to " + to.toString());
    }
    return {};
}

core::Expected<std::optional<ReceivedDatagram>> SocketTransport::receive(std::span<core::byte> buffer)
{
    if (!impl_->socket.valid())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "receive on a closed socket");
    }

    sockaddr_in peer{};
    socklen_t length = sizeof(peer);
    const ssize_t received = ::recvfrom(impl_->socket.get(), buffer.data(), buffer.size(), 0,
                                        reinterpret_cast<sockaddr*>(&peer), &length);
    if (received < 0)
    {
        const int err = errno;
        if (isQuietReceiveError(err))
        {
            return std::optional<ReceivedDatagram>{};
        }
        return systemError(core::ErrorCode::kNetworkReceiveFailed, "recvfrom", err);
    }

    return std::optional<ReceivedDatagram>{ReceivedDatagram{
        Endpoint{ntohl(peer.sin_addr.s_addr), ntohs(peer.sin_port)},
        static_cast<core::usize>(received)}};
}

core::u16 SocketTransport::localPort() const noexcept
{
    return impl_->boundPort;
}

} // namespace tether::net::transport
