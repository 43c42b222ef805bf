// /////////////////////////////////////////////////////////////////////////////
/// @file PositionHistory.hpp
/// @brief Bounded, time-ordered record of a player's past positions.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/protocol/Types.hpp>
#include <tether/core/Types.hpp>
#include <tether/core/Constants.hpp>

#include <deque>

namespace tether::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @struct PositionSample
/// @brief One authoritative position and the server time it was reached.
// /////////////////////////////////////////////////////////////////////////////
struct PositionSample
{
    protocol::Position position;
    core::TimePoint    timestamp;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class PositionHistory
/// @brief FIFO of PositionSample with a fixed capacity.
///
/// Timestamps never decrease: a sample older than the newest one is stored
/// with the newest timestamp instead.  Pushing past capacity evicts the
/// oldest sample.
// /////////////////////////////////////////////////////////////////////////////
class PositionHistory final
{
public:
    using Container = std::deque<PositionSample>;

    explicit PositionHistory(core::usize capacity = core::kServerHistoryCapacity);

    void push(protocol::Position position, core::TimePoint timestamp);

    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
    [[nodiscard]] core::usize size() const noexcept { return samples_.size(); }
    [[nodiscard]] core::usize capacity() const noexcept { return capacity_; }

    [[nodiscard]] const PositionSample& oldest() const { return samples_.front(); }
    [[nodiscard]] const PositionSample& newest() const { return samples_.back(); }

    [[nodiscard]] Container::const_iterator begin() const noexcept { return samples_.begin(); }
    [[nodiscard]] Container::const_iterator end() const noexcept { return samples_.end(); }

    [[nodiscard]] const PositionSample& operator[](core::usize i) const { return samples_[i]; }

private:
    core::usize capacity_;
    Container   samples_;
};

} // namespace tether::net::session
