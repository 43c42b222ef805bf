// /////////////////////////////////////////////////////////////////////////////
/// @file Interpolation.hpp
/// @brief Delayed, smoothed display of a remote player.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/net/protocol/Types.hpp>
#include <tether/core/Types.hpp>
#include <tether/core/Constants.hpp>

#include <deque>
#include <optional>

namespace tether::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @struct InterpolationSample
/// @brief A remote position as received, stamped with client time.
// /////////////////////////////////////////////////////////////////////////////
struct InterpolationSample
{
    protocol::Position position;
    core::f64          timestamp;
    core::u32          sequence;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class InterpolationBuffer
/// @brief Renders a remote player slightly in the past, blending between
///        the two samples around that instant.
///
/// Only samples with a strictly increasing sequence are accepted, so
/// duplicated or reordered updates never move the entity backwards.
// /////////////////////////////////////////////////////////////////////////////
class InterpolationBuffer final
{
public:
    /// @param delaySec How far in the past to render, in seconds.
    /// @param capacity Maximum buffered samples; the oldest is dropped beyond.
    explicit InterpolationBuffer(core::f64 delaySec = core::kInterpolationDelaySec,
                                 core::usize capacity = core::kInterpolationCapacity);

    /// @brief Buffers a sample.
    /// @return @c false if @p sequence is not newer than the last accepted.
    bool addPosition(protocol::Position position, core::f64 timestamp, core::u32 sequence);

    /// @brief Position to display at client time @p now.
    [[nodiscard]] std::optional<protocol::Position> interpolatedPosition(core::f64 now) const;

    [[nodiscard]] core::usize size() const noexcept { return samples_.size(); }
    [[nodiscard]] core::f64 delay() const noexcept { return delay_; }
    [[nodiscard]] std::optional<core::u32> lastSequence() const noexcept { return lastSequence_; }

private:
    core::f64                         delay_;
    core::usize                       capacity_;
    std::deque<InterpolationSample>   samples_;
    std::optional<core::u32>          lastSequence_;
};

} // namespace tether::net::netcode
