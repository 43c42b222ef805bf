// /////////////////////////////////////////////////////////////////////////////
/// @file Prediction.hpp
/// @brief Client-side prediction and server reconciliation of the local
///        player.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/protocol/Types.hpp>
#include <tether/core/Types.hpp>
#include <tether/core/Constants.hpp>
#include <tether/core/NonCopyable.hpp>

#include <deque>
#include <optional>

namespace tether::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @struct PredictedSample
/// @brief Position of the local player just before input @c sequence.
// /////////////////////////////////////////////////////////////////////////////
struct PredictedSample
{
    core::u32          sequence;
    protocol::Position position;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct ReconcileSettings
/// @brief When to give up on incremental correction and snap instead.
// /////////////////////////////////////////////////////////////////////////////
struct ReconcileSettings
{
    /// Acks jumping further than this many sequences trigger a resync.
    core::u32 gapThreshold{core::kReconcileGapThreshold};

    /// Reconciliations further apart than this (seconds) trigger a resync.
    core::f64 windowSec{core::kReconcileWindowSec};
};

/// @brief What a call to PredictionEngine::reconcile did.
enum class ReconcileOutcome : core::u8
{
    Ignored,    ///< Ack not newer than the last confirmed one.
    Applied,    ///< Baseline moved, acknowledged inputs purged.
    Resynced    ///< Baseline moved and every pending input dropped.
};

// /////////////////////////////////////////////////////////////////////////////
/// @class PredictionEngine
/// @brief Tracks unacknowledged inputs of the local player.
///
/// The displayed position is always the confirmed baseline plus a replay of
/// the pending inputs.  Inputs are applied with the exact movement rule the
/// server uses, so a replay lands where the server will.
///
/// Call order on every snapshot: @ref reconcile, then
/// @ref reapplyPendingInputs.
// /////////////////////////////////////////////////////////////////////////////
class PredictionEngine final : public core::NonCopyable<PredictionEngine>
{
public:
    /// @param initial  Starting baseline.
    /// @param settings Resync thresholds.
    /// @param capacity Maximum pending inputs.  Beyond it the oldest is
    ///        dropped, and a later reconcile acknowledging less than the
    ///        dropped input resyncs instead of replaying.
    explicit PredictionEngine(protocol::Position initial = {},
                              ReconcileSettings settings = {},
                              core::usize capacity = core::kPredictionCapacity);
    ~PredictionEngine();

    /// @brief Assigns the next sequence to a new input and queues it.
    [[nodiscard]] protocol::PlayerInput recordInput(protocol::Direction direction,
                                                    core::u64 timestampMs);

    /// @brief Records the pre-input position, then moves @p position.
    void applyPrediction(const protocol::PlayerInput& input, protocol::Position& position);

    /// @brief Adopts the server position for inputs up to @p ackSequence.
    /// @param now Client time in seconds.
    ReconcileOutcome reconcile(protocol::Position serverPosition,
                               core::u32 ackSequence,
                               core::f64 now);

    /// @brief Resets @p position to the baseline and replays pending inputs.
    void reapplyPendingInputs(protocol::Position& position);

    /// @brief Euclidean distance between the baseline and @p serverPosition.
    [[nodiscard]] core::f32 predictionError(protocol::Position serverPosition) const noexcept;

    /// @brief Distance between where prediction placed the player right
    ///        after input @p ackSequence and where the server put it.
    /// @param displayed Current predicted position, used when every pending
    ///        input is covered by @p ackSequence.
    /// Call before @ref reconcile.
    [[nodiscard]] core::f32 divergenceAt(protocol::Position serverPosition,
                                         core::u32 ackSequence,
                                         protocol::Position displayed) const noexcept;

    /// @brief Takes @p position as the new baseline outright.
    ///
    /// Pending inputs up to @p confirmedSequence are dropped, later ones are
    /// kept for the next replay.  Sequence numbering continues; sequences
    /// are never reused.
    void reset(protocol::Position position, core::u32 confirmedSequence, core::f64 now);

    [[nodiscard]] const std::deque<protocol::PlayerInput>& pendingInputs() const noexcept;
    [[nodiscard]] const std::deque<PredictedSample>& history() const noexcept;
    [[nodiscard]] protocol::Position confirmedPosition() const noexcept;
    [[nodiscard]] core::u32 lastConfirmedSequence() const noexcept;
    [[nodiscard]] core::u32 nextSequence() const noexcept;

private:
    ReconcileSettings                  settings_;
    core::usize                        capacity_;
    core::u32                          nextSequence_{1};
    std::deque<protocol::PlayerInput>  pending_;
    std::deque<PredictedSample>        history_;
    protocol::Position                 confirmedPosition_;
    core::u32                          lastConfirmedSequence_{0};
    core::u32                          droppedThrough_{0};
    std::optional<core::f64>           lastReconciliation_;
};

} // namespace tether::net::netcode
