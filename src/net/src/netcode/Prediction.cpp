// /////////////////////////////////////////////////////////////////////////////
/// @file Prediction.cpp
/// @brief PredictionEngine implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/netcode/Prediction.hpp>
#include <tether/net/netcode/Movement.hpp>
#include <tether/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace tether::net::netcode {

PredictionEngine::PredictionEngine(protocol::Position initial,
                                   ReconcileSettings settings,
                                   core::usize capacity)
    : settings_{settings}
    , capacity_{std::max<core::usize>(capacity, 1)}
    , confirmedPosition_{initial}
{}

PredictionEngine::~PredictionEngine() = default;

protocol::PlayerInput PredictionEngine::recordInput(protocol::Direction direction,
                                                    core::u64 timestampMs)
{
    const protocol::PlayerInput input{direction, nextSequence_++, timestampMs};

    if (pending_.size() >= capacity_)
    {
        if (droppedThrough_ <= lastConfirmedSequence_)
        {
            core::Log::warn("prediction", "pending input queue full at " + std::to_string(capacity_) +
                                          ", next reconcile will resync");
        }
        droppedThrough_ = pending_.front().sequence;
        pending_.pop_front();
    }
    pending_.push_back(input);
    return input;
}

void PredictionEngine::applyPrediction(const protocol::PlayerInput& input,
                                       protocol::Position& position)
{
    if (history_.size() >= capacity_)
    {
        history_.pop_front();
    }
    history_.push_back(PredictedSample{input.sequence, position});

    position = applyDirection(position, input.direction);
}

ReconcileOutcome PredictionEngine::reconcile(protocol::Position serverPosition,
                                             core::u32 ackSequence,
                                             core::f64 now)
{
    if (ackSequence <= lastConfirmedSequence_)
    {
        return ReconcileOutcome::Ignored;
    }

    const core::u32 gap = ackSequence - lastConfirmedSequence_;
    // Inputs after the ack were dropped unreplayed; the baseline plus
    // pending_ no longer reaches the server's position.
    const bool incomplete = ackSequence < droppedThrough_;
    const bool stale = lastReconciliation_.has_value() &&
                       (now - *lastReconciliation_) > settings_.windowSec;
    lastReconciliation_ = now;

    confirmedPosition_ = serverPosition;
    lastConfirmedSequence_ = ackSequence;

    const auto acknowledged = [ackSequence](core::u32 sequence) { return sequence <= ackSequence; };
    std::erase_if(pending_, [&](const protocol::PlayerInput& in) { return acknowledged(in.sequence); });
    std::erase_if(history_, [&](const PredictedSample& s) { return acknowledged(s.sequence); });

    if (gap > settings_.gapThreshold || stale || incomplete)
    {
        if (!pending_.empty())
        {
            core::Log::debug("prediction", "hard resync, dropping " +
                                           std::to_string(pending_.size()) + " pending inputs");
        }
        pending_.clear();
        history_.clear();
        return ReconcileOutcome::Resynced;
    }

    return ReconcileOutcome::Applied;
}

void PredictionEngine::reapplyPendingInputs(protocol::Position& position)
{
    position = confirmedPosition_;
    history_.clear();

    for (const auto& input : pending_)
    {
        applyPrediction(input, position);
    }
}

namespace {

core::f32 distance(protocol::Position a, protocol::Position b) noexcept
{
    const auto dx = static_cast<core::f32>(a.x - b.x);
    const auto dy = static_cast<core::f32>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}

} // anonymous namespace

core::f32 PredictionEngine::predictionError(protocol::Position serverPosition) const noexcept
{
    return distance(serverPosition, confirmedPosition_);
}

core::f32 PredictionEngine::divergenceAt(protocol::Position serverPosition,
                                         core::u32 ackSequence,
                                         protocol::Position displayed) const noexcept
{
    // The sample of the first unacknowledged input holds the position
    // reached right after the acknowledged one.
    for (const auto& sample : history_)
    {
        if (sample.sequence > ackSequence)
        {
            return distance(serverPosition, sample.position);
        }
    }
    return distance(serverPosition, displayed);
}

void PredictionEngine::reset(protocol::Position position, core::u32 confirmedSequence, core::f64 now)
{
    std::erase_if(pending_, [confirmedSequence](const protocol::PlayerInput& in) {
        return in.sequence <= confirmedSequence;
    });
    history_.clear();
    confirmedPosition_ = position;
    lastConfirmedSequence_ = confirmedSequence;
    lastReconciliation_ = now;
}

const std::deque<protocol::PlayerInput>& PredictionEngine::pendingInputs() const noexcept { return pending_; }
const std::deque<PredictedSample>&       PredictionEngine::history() const noexcept       { return history_; }
protocol::Position PredictionEngine::confirmedPosition() const noexcept                  { return confirmedPosition_; }
core::u32          PredictionEngine::lastConfirmedSequence() const noexcept              { return lastConfirmedSequence_; }
core::u32          PredictionEngine::nextSequence() const noexcept                       { return nextSequence_; }

} // namespace tether::net::netcode
