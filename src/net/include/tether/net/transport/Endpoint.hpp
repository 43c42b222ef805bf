// /////////////////////////////////////////////////////////////////////////////
/// @file Endpoint.hpp
/// @brief IPv4 address + UDP port value type.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/core/Types.hpp>
#include <tether/core/Expected.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace tether::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class Endpoint
/// @brief Network address of a peer, stored in host byte order.
///
/// Hashable and comparable so it can key session tables.
// /////////////////////////////////////////////////////////////////////////////
class Endpoint final
{
public:
    constexpr Endpoint() noexcept = default;

    constexpr Endpoint(core::u32 address, core::u16 port) noexcept
        : address_{address}
        , port_{port}
    {}

    /// @brief Builds an endpoint from four dotted-quad octets.
    [[nodiscard]] static constexpr Endpoint fromOctets(core::u8 a, core::u8 b, core::u8 c,
                                                       core::u8 d, core::u16 port) noexcept
    {
        return Endpoint{(core::u32{a} << 24) | (core::u32{b} << 16) |
                        (core::u32{c} << 8) | core::u32{d},
                        port};
    }

    /// @brief Parses @c "a.b.c.d:port" (or @c "localhost:port").
    [[nodiscard]] static core::Expected<Endpoint> parse(std::string_view text);

    [[nodiscard]] constexpr core::u32 address() const noexcept { return address_; }
    [[nodiscard]] constexpr core::u16 port() const noexcept { return port_; }

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] constexpr bool operator==(const Endpoint&) const noexcept = default;

private:
    core::u32 address_{0};
    core::u16 port_{0};
};

} // namespace tether::net::transport

template <>
struct std::hash<tether::net::transport::Endpoint>
{
    std::size_t operator()(const tether::net::transport::Endpoint& ep) const noexcept
    {
        const tether::core::u64 key = (static_cast<tether::core::u64>(ep.address()) << 16) | ep.port();
        return std::hash<tether::core::u64>{}(key);
    }
};
