// /////////////////////////////////////////////////////////////////////////////
/// @file Endpoint.cpp
/// @brief Endpoint parsing and formatting.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/transport/Endpoint.hpp>

#include <charconv>

namespace tether::net::transport {

namespace {

bool parseNumber(std::string_view text, core::u32 max, core::u32& out)
{
    if (text.empty())
    {
        return false;
    }
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last && out <= max;
}

} // anonymous namespace

core::Expected<Endpoint> Endpoint::parse(std::string_view text)
{
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Endpoint '" + std::string{text} + "' has no port");
    }

    const auto host = text.substr(0, colon);
    core::u32 port = 0;
    if (!parseNumber(text.substr(colon + 1), 0xFFFF, port))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Endpoint '" + std::string{text} + "' has an invalid port");
    }

    if (host == "localhost")
    {
        return fromOctets(127, 0, 0, 1, static_cast<core::u16>(port));
    }

    core::u32 address = 0;
    std::string_view rest = host;
    for (int i = 0; i < 4; ++i)
    {
        const auto dot = rest.find('.');
        const auto part = (i < 3) ? rest.substr(0, dot) : rest;
        core::u32 octet = 0;
        if ((i < 3 && dot == std::string_view::npos) || !parseNumber(part, 255, octet))
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "Endpoint '" + std::string{text} + "' has an invalid IPv4 address");
        }
        address = (address << 8) | octet;
        if (i < 3)
        {
            rest = rest.substr(dot + 1);
        }
    }

    return Endpoint{address, static_cast<core::u16>(port)};
}

std::string Endpoint::toString() const
{
    return std::to_string((address_ >> 24) & 0xFF) + "." +
           std::to_string((address_ >> 16) & 0xFF) + "." +
           std::to_string((address_ >> 8) & 0xFF) + "." +
           std::to_string(address_ & 0xFF) + ":" +
           std::to_string(port_);
}

} // namespace tether::net::transport
