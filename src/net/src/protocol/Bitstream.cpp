// /////////////////////////////////////////////////////////////////////////////
/// @file Bitstream.cpp
/// @brief Bitstream implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <tether/net/protocol/Bitstream.hpp>
#include <tether/core/Assert.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace tether::net::protocol {

Bitstream::Bitstream(std::span<const core::byte> payload)
    : bytes_{payload.begin(), payload.end()}
    , reading_{true}
{}

void Bitstream::writeBits(core::u32 value, core::u32 bitCount)
{
    TETHER_ASSERT(!reading_);
    TETHER_ASSERT(bitCount >= 1 && bitCount <= 32);

    const core::u64 mask = (core::u64{1} << bitCount) - 1;
    pending_ = (pending_ << bitCount) | (value & mask);
    pendingBits_ += bitCount;

    while (pendingBits_ >= 8)
    {
        pendingBits_ -= 8;
        bytes_.push_back(static_cast<core::byte>((pending_ >> pendingBits_) & 0xFFu));
    }
    pending_ &= (core::u64{1} << pendingBits_) - 1;
}

void Bitstream::writeU64(core::u64 value)
{
    writeU32(static_cast<core::u32>(value >> 32));
    writeU32(static_cast<core::u32>(value));
}

core::u32 Bitstream::bitsWritten() const noexcept
{
    return static_cast<core::u32>(bytes_.size() * 8) + pendingBits_;
}

std::vector<core::byte> Bitstream::release()
{
    if (pendingBits_ > 0)
    {
        bytes_.push_back(static_cast<core::byte>(pending_ << (8 - pendingBits_)));
    }
    pending_ = 0;
    pendingBits_ = 0;
    return std::exchange(bytes_, {});
}

core::Expected<core::u32> Bitstream::readBits(core::u32 bitCount)
{
    TETHER_ASSERT(bitCount >= 1 && bitCount <= 32);

    if (bitCount > bitsRemaining())
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "need " + std::to_string(bitCount) + " bits, " +
                               std::to_string(bitsRemaining()) + " left");
    }

    // Consume up to one byte per iteration.
    core::u32 result = 0;
    while (bitCount > 0)
    {
        const auto current = static_cast<core::u32>(bytes_[cursor_ / 8]);
        const core::u32 available = 8 - cursor_ % 8;
        const core::u32 take = std::min(available, bitCount);

        const core::u32 chunk = (current >> (available - take)) & ((1u << take) - 1);
        result = (result << take) | chunk;

        cursor_ += take;
        bitCount -= take;
    }
    return result;
}

core::Expected<core::u8> Bitstream::readU8()
{
    return static_cast<core::u8>(TETHER_TRY(readBits(8)));
}

core::Expected<core::u16> Bitstream::readU16()
{
    return static_cast<core::u16>(TETHER_TRY(readBits(16)));
}

core::Expected<core::u64> Bitstream::readU64()
{
    const core::u64 high = TETHER_TRY(readU32());
    const core::u64 low  = TETHER_TRY(readU32());
    return (high << 32) | low;
}

core::Expected<core::i32> Bitstream::readI32()
{
    return static_cast<core::i32>(TETHER_TRY(readU32()));
}

core::u32 Bitstream::bitsRemaining() const noexcept
{
    if (!reading_)
        return 0;
    return static_cast<core::u32>(bytes_.size() * 8) - cursor_;
}

} // namespace tether::net::protocol
