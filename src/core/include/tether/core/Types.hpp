/**
 * @file Types.hpp
 * @brief Short numeric aliases and the clock every timestamp is taken from.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_TYPES_HPP
    #define TETHER_CORE_TYPES_HPP

    #include <chrono>
    #include <cstddef>
    #include <cstdint>

namespace tether::core {

// ---- Integers ------------------------------------------------------------

using u8  = std::uint8_t;   using i8  = std::int8_t;
using u16 = std::uint16_t;  using i16 = std::int16_t;
using u32 = std::uint32_t;  using i32 = std::int32_t;
using u64 = std::uint64_t;  using i64 = std::int64_t;

using usize = std::size_t;

// ---- Floating point ------------------------------------------------------

using f32 = float;
using f64 = double;

// ---- Raw datagram bytes --------------------------------------------------

using byte = std::byte;

// ---- Time ----------------------------------------------------------------

/// Server time is monotonic; wall-clock jumps must not expire sessions.
using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;

} // namespace tether::core

#endif // TETHER_CORE_TYPES_HPP
