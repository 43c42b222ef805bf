// /////////////////////////////////////////////////////////////////////////////
/// @file SocketTransport.hpp
/// @brief UDP implementation of ITransport over a POSIX socket.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/transport/ITransport.hpp>
#include <tether/core/NonCopyable.hpp>

#include <memory>

namespace tether::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class SocketTransport
/// @brief Non-blocking IPv4 UDP socket bound on every interface.
///
/// The server binds its configured port.  Clients pass 0 and let the kernel
/// choose; @ref localPort reports the result.
// /////////////////////////////////////////////////////////////////////////////
class SocketTransport final : public ITransport,
                              public core::NonCopyable<SocketTransport>
{
public:
    explicit SocketTransport(core::u16 port);
    ~SocketTransport() override;

    [[nodiscard]] core::ExpectedVoid open() override;
    void close() noexcept override;

    [[nodiscard]] core::ExpectedVoid send(std::span<const core::byte> payload,
                                          const Endpoint& to) override;

    [[nodiscard]] core::Expected<std::optional<ReceivedDatagram>> receive(
        std::span<core::byte> buffer) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "udp"; }

    /// @brief Bound port, 0 while closed.
    [[nodiscard]] core::u16 localPort() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tether::net::transport
