// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Datagram I/O seam between the netcode and the operating system.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/transport/Endpoint.hpp>
#include <tether/core/Types.hpp>
#include <tether/core/Expected.hpp>

#include <optional>
#include <span>
#include <string_view>

namespace tether::net::transport {

/// @brief Where a received datagram came from and how much of the buffer it filled.
struct ReceivedDatagram
{
    Endpoint    from;
    core::usize size{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Unreliable, unordered, non-blocking datagram socket.
///
/// @c SocketTransport talks UDP; the tests substitute an in-memory fake.
/// Datagrams are all-or-nothing: a partial send is an error and a payload
/// larger than the receive buffer is truncated.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual core::ExpectedVoid open() = 0;
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual core::ExpectedVoid send(std::span<const core::byte> payload,
                                                  const Endpoint& to) = 0;

    /// @return The next pending datagram copied into @p buffer, or
    ///         @c std::nullopt when nothing is waiting.
    [[nodiscard]] virtual core::Expected<std::optional<ReceivedDatagram>> receive(
        std::span<core::byte> buffer) = 0;

    /// @brief Short label for log lines.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace tether::net::transport
