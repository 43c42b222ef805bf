// /////////////////////////////////////////////////////////////////////////////
/// @file Movement.cpp
/// @brief Movement rule implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/netcode/Movement.hpp>
#include <tether/core/Constants.hpp>

#include <algorithm>

namespace tether::net::netcode {

protocol::Position applyDirection(protocol::Position position,
                                  protocol::Direction direction) noexcept
{
    switch (direction)
    {
        case protocol::Direction::Up:    position.y -= core::kPlayerSpeed; break;
        case protocol::Direction::Down:  position.y += core::kPlayerSpeed; break;
        case protocol::Direction::Left:  position.x -= core::kPlayerSpeed; break;
        case protocol::Direction::Right: position.x += core::kPlayerSpeed; break;
    }
    return clampToBoard(position);
}

protocol::Position clampToBoard(protocol::Position position) noexcept
{
    position.x = std::clamp(position.x, core::kMinX, core::kMaxX);
    position.y = std::clamp(position.y, core::kMinY, core::kMaxY);
    return position;
}

protocol::Position lerp(protocol::Position from, protocol::Position to, core::f64 t) noexcept
{
    t = std::clamp(t, 0.0, 1.0);
    const auto blend = [t](core::i32 a, core::i32 b) {
        return static_cast<core::i32>(static_cast<core::f64>(a) +
                                      static_cast<core::f64>(b - a) * t);
    };
    return protocol::Position{blend(from.x, to.x), blend(from.y, to.y)};
}

} // namespace tether::net::netcode
