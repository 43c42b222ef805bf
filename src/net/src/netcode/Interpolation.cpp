// /////////////////////////////////////////////////////////////////////////////
/// @file Interpolation.cpp
/// @brief InterpolationBuffer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/netcode/Interpolation.hpp>
#include <tether/net/netcode/Movement.hpp>

#include <algorithm>

namespace tether::net::netcode {

InterpolationBuffer::InterpolationBuffer(core::f64 delaySec, core::usize capacity)
    : delay_{delaySec}
    , capacity_{std::max<core::usize>(capacity, 1)}
{}

bool InterpolationBuffer::addPosition(protocol::Position position,
                                      core::f64 timestamp,
                                      core::u32 sequence)
{
    if (lastSequence_.has_value() && sequence <= *lastSequence_)
    {
        return false;
    }

    lastSequence_ = sequence;
    samples_.push_back(InterpolationSample{position, timestamp, sequence});

    while (samples_.size() > capacity_)
    {
        samples_.pop_front();
    }
    return true;
}

std::optional<protocol::Position> InterpolationBuffer::interpolatedPosition(core::f64 now) const
{
    if (samples_.empty())
    {
        return std::nullopt;
    }
    if (samples_.size() < 2)
    {
        return samples_.back().position;
    }

    const core::f64 target = now - delay_;

    if (target <= samples_.front().timestamp)
    {
        return samples_.front().position;
    }
    if (target >= samples_.back().timestamp)
    {
        return samples_.back().position;
    }

    for (core::usize i = 0; i + 1 < samples_.size(); ++i)
    {
        const auto& before = samples_[i];
        const auto& after  = samples_[i + 1];

        if (before.timestamp <= target && target < after.timestamp)
        {
            const core::f64 span = after.timestamp - before.timestamp;
            const core::f64 t = (span > 0.0) ? (target - before.timestamp) / span : 1.0;
            return lerp(before.position, after.position, t);
        }
    }

    // Client timestamps may be non-monotonic; fall back to the newest sample.
    return samples_.back().position;
}

} // namespace tether::net::netcode
