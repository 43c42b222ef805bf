// /////////////////////////////////////////////////////////////////////////////
/// @file PositionHistory.cpp
/// @brief PositionHistory implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/session/PositionHistory.hpp>

#include <algorithm>

namespace tether::net::session {

PositionHistory::PositionHistory(core::usize capacity)
    : capacity_{std::max<core::usize>(capacity, 1)}
{}

void PositionHistory::push(protocol::Position position, core::TimePoint timestamp)
{
    if (!samples_.empty() && timestamp < samples_.back().timestamp)
    {
        timestamp = samples_.back().timestamp;
    }

    samples_.push_back(PositionSample{position, timestamp});

    while (samples_.size() > capacity_)
    {
        samples_.pop_front();
    }
}

} // namespace tether::net::session
