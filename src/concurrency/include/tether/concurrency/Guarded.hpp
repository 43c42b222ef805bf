// /////////////////////////////////////////////////////////////////////////////
/// @file Guarded.hpp
/// @brief Value wrapper that only hands out access under its own mutex.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/core/NonCopyable.hpp>

#include <mutex>
#include <type_traits>
#include <utility>

namespace tether::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class Guarded
/// @brief Owns a @p T and serialises every access to it.
///
/// Callers pass a callable to @ref with; it runs while the lock is held and
/// its result is returned by value.  Keep the callable short and never do
/// I/O from inside it.
// /////////////////////////////////////////////////////////////////////////////
template <typename T>
class Guarded final : public core::NonCopyable<Guarded<T>>
{
public:
    template <typename... Args>
    explicit Guarded(Args&&... args)
        : value_{std::forward<Args>(args)...}
    {}

    /// @brief Runs @p fn with exclusive access to the value.
    template <typename F>
    decltype(auto) with(F&& fn)
    {
        std::lock_guard<std::mutex> lock{mutex_};
        return std::forward<F>(fn)(value_);
    }

    /// @brief Runs @p fn with exclusive, read-only access to the value.
    template <typename F>
    decltype(auto) with(F&& fn) const
    {
        std::lock_guard<std::mutex> lock{mutex_};
        return std::forward<F>(fn)(static_cast<const T&>(value_));
    }

private:
    mutable std::mutex mutex_;
    T                  value_;
};

} // namespace tether::concurrency
