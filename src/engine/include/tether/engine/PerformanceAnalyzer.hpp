// /////////////////////////////////////////////////////////////////////////////
/// @file PerformanceAnalyzer.hpp
/// @brief Measures prediction error under a sequence of network conditions.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/core/Types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tether::engine {

// /////////////////////////////////////////////////////////////////////////////
/// @struct NetworkCondition
/// @brief A named latency / loss combination to run the client under.
// /////////////////////////////////////////////////////////////////////////////
struct NetworkCondition
{
    std::string name;
    core::u32   latencyMs{0};
    core::u32   packetLossPercent{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct ConditionResult
/// @brief Aggregated prediction error observed under one condition.
///
/// This is what the external report generator consumes.
// /////////////////////////////////////////////////////////////////////////////
struct ConditionResult
{
    NetworkCondition condition;
    core::f32        minError{0.0f};
    core::f32        avgError{0.0f};
    core::f32        maxError{0.0f};
    core::u64        sampleCount{0};
    core::f32        avgRoundTripMs{0.0f};
    core::u64        roundTripCount{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class PerformanceAnalyzer
/// @brief Steps through a list of conditions, each for a fixed duration,
///        and aggregates the errors recorded meanwhile.
///
/// The owner polls @ref update every frame and applies @ref current to its
/// network simulator whenever @ref update reports a change.
// /////////////////////////////////////////////////////////////////////////////
class PerformanceAnalyzer final
{
public:
    /// @brief Very Poor, Lossy, Poor, Average, Good and Ideal, in that order.
    [[nodiscard]] static std::vector<NetworkCondition> defaultConditions();

    explicit PerformanceAnalyzer(std::vector<NetworkCondition> conditions = defaultConditions(),
                                 core::f64 conditionDurationSec = 1.0);

    /// @brief Starts a run at @p now, discarding previous results.
    void start(core::f64 now);

    /// @brief Aborts a run without recording the current condition.
    void cancel() noexcept;

    /// @brief Advances to the next condition once the current one expired.
    /// @return @c true if the active condition changed (or the run ended).
    bool update(core::f64 now);

    [[nodiscard]] bool running() const noexcept;

    /// @brief Condition under test, or nullptr when idle.
    [[nodiscard]] const NetworkCondition* current() const noexcept;

    void recordPredictionError(core::f32 error);
    void recordRoundTrip(core::f32 milliseconds);

    [[nodiscard]] const std::vector<ConditionResult>& results() const noexcept;
    [[nodiscard]] const std::vector<NetworkCondition>& conditions() const noexcept;

private:
    void begin(core::usize index, core::f64 now);
    void finishCurrent();

    std::vector<NetworkCondition>  conditions_;
    core::f64                      duration_;
    std::optional<core::usize>     index_;
    core::f64                      conditionStart_{0.0};

    core::f32                      minError_{0.0f};
    core::f32                      maxError_{0.0f};
    core::f64                      sumError_{0.0};
    core::u64                      samples_{0};
    core::f64                      sumRoundTrip_{0.0};
    core::u64                      roundTrips_{0};

    std::vector<ConditionResult>   results_;
};

} // namespace tether::engine
