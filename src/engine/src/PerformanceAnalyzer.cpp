// /////////////////////////////////////////////////////////////////////////////
/// @file PerformanceAnalyzer.cpp
/// @brief PerformanceAnalyzer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/engine/PerformanceAnalyzer.hpp>
#include <tether/core/Log.hpp>

#include <algorithm>

namespace tether::engine {

std::vector<NetworkCondition> PerformanceAnalyzer::defaultConditions()
{
    return {
        {"Very Poor", 200, 10},
        {"Lossy",     100,  5},
        {"Poor",      200,  0},
        {"Average",   100,  0},
        {"Good",       50,  0},
        {"Ideal",       0,  0},
    };
}

PerformanceAnalyzer::PerformanceAnalyzer(std::vector<NetworkCondition> conditions,
                                         core::f64 conditionDurationSec)
    : conditions_{std::move(conditions)}
    , duration_{conditionDurationSec}
{}

void PerformanceAnalyzer::start(core::f64 now)
{
    results_.clear();
    if (conditions_.empty())
    {
        index_.reset();
        return;
    }

    begin(0, now);
}

void PerformanceAnalyzer::cancel() noexcept
{
    index_.reset();
}

bool PerformanceAnalyzer::update(core::f64 now)
{
    if (!index_ || now - conditionStart_ < duration_)
    {
        return false;
    }

    finishCurrent();

    const core::usize next = *index_ + 1;
    if (next >= conditions_.size())
    {
        index_.reset();
        core::Log::info("perf", "all " + std::to_string(results_.size()) + " conditions tested");
        return true;
    }

    begin(next, now);
    return true;
}

bool PerformanceAnalyzer::running() const noexcept
{
    return index_.has_value();
}

const NetworkCondition* PerformanceAnalyzer::current() const noexcept
{
    return index_ ? &conditions_[*index_] : nullptr;
}

void PerformanceAnalyzer::recordPredictionError(core::f32 error)
{
    if (!index_)
    {
        return;
    }

    if (samples_ == 0)
    {
        minError_ = maxError_ = error;
    }
    else
    {
        minError_ = std::min(minError_, error);
        maxError_ = std::max(maxError_, error);
    }
    sumError_ += error;
    ++samples_;
}

void PerformanceAnalyzer::recordRoundTrip(core::f32 milliseconds)
{
    if (!index_)
    {
        return;
    }
    sumRoundTrip_ += milliseconds;
    ++roundTrips_;
}

const std::vector<ConditionResult>& PerformanceAnalyzer::results() const noexcept
{
    return results_;
}

const std::vector<NetworkCondition>& PerformanceAnalyzer::conditions() const noexcept
{
    return conditions_;
}

void PerformanceAnalyzer::begin(core::usize index, core::f64 now)
{
    index_ = index;
    conditionStart_ = now;
    minError_ = maxError_ = 0.0f;
    sumError_ = sumRoundTrip_ = 0.0;
    samples_ = roundTrips_ = 0;

    core::Log::info("perf", "testing condition: " + conditions_[index].name);
}

void PerformanceAnalyzer::finishCurrent()
{
    ConditionResult result;
    result.condition = conditions_[*index_];
    result.minError = minError_;
    result.maxError = maxError_;
    result.sampleCount = samples_;
    result.avgError = samples_ ? static_cast<core::f32>(sumError_ / static_cast<core::f64>(samples_)) : 0.0f;
    result.roundTripCount = roundTrips_;
    result.avgRoundTripMs = roundTrips_
        ? static_cast<core::f32>(sumRoundTrip_ / static_cast<core::f64>(roundTrips_))
        : 0.0f;
    results_.push_back(std::move(result));
}

} // namespace tether::engine
