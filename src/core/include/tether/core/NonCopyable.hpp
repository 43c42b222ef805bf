/**
 * @file NonCopyable.hpp
 * @brief Mixin that makes a class move-only.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_NON_COPYABLE_HPP
    #define TETHER_CORE_NON_COPYABLE_HPP

namespace tether::core {

/**
 * @brief Base for owners of sockets, threads and pImpl state.
 *
 * Copies are deleted; moves stay available so factories can return by value.
 * The template parameter gives each user its own base, which keeps empty-base
 * optimisation working when two move-only types are nested.
 *
 * @tparam Owner The deriving class.
 */
template <typename Owner>
class NonCopyable
{
public:
    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

protected:
    constexpr NonCopyable() noexcept = default;
    ~NonCopyable() = default;

    NonCopyable(NonCopyable&&) noexcept = default;
    NonCopyable& operator=(NonCopyable&&) noexcept = default;
};

} // namespace tether::core

#endif // TETHER_CORE_NON_COPYABLE_HPP
