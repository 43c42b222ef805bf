// /////////////////////////////////////////////////////////////////////////////
/// @file PeriodicWorker.hpp
/// @brief Dedicated thread running a task at a fixed interval.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/core/Types.hpp>
#include <tether/core/NonCopyable.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tether::concurrency {

// /////////////////////////////////////////////////////////////////////////////
/// @class PeriodicWorker
/// @brief Runs a task every @c interval on its own thread until stopped.
///
/// Ticks are scheduled against absolute deadlines so a slow task does not
/// accumulate drift.  @ref stop wakes the sleeping thread immediately and
/// joins it; the destructor calls @c stop implicitly.
// /////////////////////////////////////////////////////////////////////////////
class PeriodicWorker final : public core::NonCopyable<PeriodicWorker>
{
public:
    using Task = std::function<void()>;

    /// @param name     Label used in log messages.
    /// @param interval Delay between two task invocations.
    /// @param task     Work executed on every tick.
    PeriodicWorker(std::string name, std::chrono::milliseconds interval, Task task);
    ~PeriodicWorker();

    /// @brief Spawns the worker thread. No-op if already running.
    void start();

    /// @brief Signals the thread to finish and joins it.
    void stop();

    [[nodiscard]] bool running() const noexcept;

    /// @brief Number of completed ticks since @ref start.
    [[nodiscard]] core::u64 tickCount() const noexcept;

private:
    void loop();

    std::string                name_;
    std::chrono::milliseconds  interval_;
    Task                       task_;

    mutable std::mutex         mutex_;
    std::condition_variable    cv_;
    bool                       stopRequested_{false};
    bool                       running_{false};
    core::u64                  ticks_{0};
    std::thread                thread_;
};

} // namespace tether::concurrency
