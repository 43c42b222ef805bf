/**
 * @file Expected.hpp
 * @brief Result aliases and the early-return helpers built on them.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_EXPECTED_HPP
    #define TETHER_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace tether::core {

template <typename T>
using Expected = std::expected<T, Error>;

using ExpectedVoid = Expected<void>;

} // namespace tether::core

// Both helpers return from the *enclosing* function on failure, so they may
// only be used inside functions that themselves return an Expected.
// TETHER_TRY is a GNU statement expression: its last statement is its value.

#define TETHER_TRY(expr)                                                   \
    ({                                                                     \
        auto &&tetherTryResult_ = (expr);                                  \
        if (!tetherTryResult_) [[unlikely]]                                \
            return ::tether::core::Unexpected{                             \
                std::move(tetherTryResult_).error()};                      \
        *std::move(tetherTryResult_);                                      \
    })

#define TETHER_TRY_VOID(expr)                                              \
    do {                                                                   \
        if (auto &&tetherTryResult_ = (expr); !tetherTryResult_) [[unlikely]] \
            return ::tether::core::Unexpected{                             \
                std::move(tetherTryResult_).error()};                      \
    } while (false)

#endif // TETHER_CORE_EXPECTED_HPP
