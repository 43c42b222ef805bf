/**
 * @file Assert.hpp
 * @brief Debug-only contract checks.
 *
 * TETHER_ASSERT guards caller contracts (argument ranges, call order) and
 * compiles to nothing unless TETHER_DEBUG is defined.  Input that comes off
 * the wire is validated with Expected, never with this macro.
 *
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_ASSERT_HPP
    #define TETHER_CORE_ASSERT_HPP

    #ifdef TETHER_DEBUG
        #include <cstdio>
        #include <cstdlib>
        #include <source_location>

namespace tether::core::detail {

[[noreturn]] inline void contractViolated(
    const char *condition,
    std::source_location where = std::source_location::current())
{
    std::fprintf(stderr, "[FATAL][contract] %s:%u: %s does not hold (in %s)\n",
                 where.file_name(), static_cast<unsigned>(where.line()),
                 condition, where.function_name());
    std::abort();
}

} // namespace tether::core::detail

        #define TETHER_ASSERT(cond)                                        \
            do {                                                           \
                if (!(cond)) [[unlikely]]                                  \
                    ::tether::core::detail::contractViolated(#cond);       \
            } while (false)
    #else
        #define TETHER_ASSERT(cond) ((void)sizeof(cond))
    #endif

#endif // TETHER_CORE_ASSERT_HPP
