// /////////////////////////////////////////////////////////////////////////////
/// @file PeriodicWorker.cpp
/// @brief PeriodicWorker implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/concurrency/PeriodicWorker.hpp>
#include <tether/core/Log.hpp>

namespace tether::concurrency {

PeriodicWorker::PeriodicWorker(std::string name,
                               std::chrono::milliseconds interval,
                               Task task)
    : name_{std::move(name)}
    , interval_{interval}
    , task_{std::move(task)}
{}

PeriodicWorker::~PeriodicWorker()
{
    stop();
}

void PeriodicWorker::start()
{
    std::lock_guard<std::mutex> lock{mutex_};
    if (running_)
    {
        return;
    }

    stopRequested_ = false;
    running_ = true;
    ticks_ = 0;
    thread_ = std::thread{&PeriodicWorker::loop, this};
}

void PeriodicWorker::stop()
{
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (!running_)
        {
            return;
        }
        stopRequested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable())
    {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock{mutex_};
    running_ = false;
}

bool PeriodicWorker::running() const noexcept
{
    std::lock_guard<std::mutex> lock{mutex_};
    return running_;
}

core::u64 PeriodicWorker::tickCount() const noexcept
{
    std::lock_guard<std::mutex> lock{mutex_};
    return ticks_;
}

void PeriodicWorker::loop()
{
    core::Log::debug("worker", name_ + ": started");

    auto deadline = core::Clock::now() + interval_;

    for (;;)
    {
        {
            std::unique_lock<std::mutex> lock{mutex_};
            if (cv_.wait_until(lock, deadline, [this] { return stopRequested_; }))
            {
                break;
            }
        }

        task_();

        {
            std::lock_guard<std::mutex> lock{mutex_};
            ++ticks_;
        }

        deadline += interval_;
        const auto now = core::Clock::now();
        if (deadline < now)
        {
            deadline = now;
        }
    }

    core::Log::debug("worker", name_ + ": stopped");
}

} // namespace tether::concurrency
