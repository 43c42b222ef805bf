/**
 * @file Error.hpp
 * @brief Error value shared by every fallible operation in tether.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_ERROR_HPP
    #define TETHER_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace tether::core {

/// What went wrong, grouped by the layer that reports it.
enum class ErrorCode : u8 {
    // caller mistakes
    kInvalidArgument,
    kInvalidState,
    kOutOfRange,

    // operating system
    kIoError,
    kNetworkBindFailed,
    kNetworkSendFailed,
    kNetworkReceiveFailed,

    // peer sent something we cannot use
    kProtocolViolation,
    kDeserializationFailed,
};

[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kInvalidArgument:       return "invalid argument";
        case ErrorCode::kInvalidState:          return "invalid state";
        case ErrorCode::kOutOfRange:            return "out of range";
        case ErrorCode::kIoError:               return "i/o error";
        case ErrorCode::kNetworkBindFailed:     return "bind failed";
        case ErrorCode::kNetworkSendFailed:     return "send failed";
        case ErrorCode::kNetworkReceiveFailed:  return "receive failed";
        case ErrorCode::kProtocolViolation:     return "protocol violation";
        case ErrorCode::kDeserializationFailed: return "malformed payload";
    }
    return "unknown";
}

/**
 * @brief A code, a message for humans and the call site that raised it.
 *
 * The location defaults to the caller of the constructor, so errors built
 * through makeError() point at the function that gave up rather than at
 * this header.
 */
class Error final {
public:
    explicit Error(ErrorCode code, std::string message,
                   std::source_location where = std::source_location::current())
        : code_{code}, message_{std::move(message)}, where_{where}
    {
    }

    [[nodiscard]] ErrorCode            code()     const noexcept { return code_; }
    [[nodiscard]] const std::string   &message()  const noexcept { return message_; }
    [[nodiscard]] std::source_location location() const noexcept { return where_; }

    /// "<code>: <message>", the form the executables log.
    [[nodiscard]] std::string describe() const
    {
        std::string text{toString(code_)};
        text += ": ";
        text += message_;
        return text;
    }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location where_;
};

using Unexpected = std::unexpected<Error>;

/// Shorthand for `return Unexpected{Error{...}}` that keeps the caller's location.
[[nodiscard]] inline Unexpected makeError(ErrorCode code, std::string message,
                                          std::source_location where = std::source_location::current())
{
    return Unexpected{Error{code, std::move(message), where}};
}

} // namespace tether::core

#endif // TETHER_CORE_ERROR_HPP
