// /////////////////////////////////////////////////////////////////////////////
/// @file Bitstream.hpp
/// @brief MSB-first bit packing for datagram payloads.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/core/Types.hpp>
#include <tether/core/Expected.hpp>
#include <tether/core/NonCopyable.hpp>

#include <span>
#include <vector>

namespace tether::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class Bitstream
/// @brief Either builds a payload or walks a received one.
///
/// A default-constructed stream is written to; one built over a byte span
/// is read from.  Multi-byte fields come out big-endian whatever the host
/// order.  Running off the end of a received payload is an
/// @c ErrorCode::kOutOfRange, never a read out of bounds.
// /////////////////////////////////////////////////////////////////////////////
class Bitstream final : public core::NonCopyable<Bitstream>
{
public:
    Bitstream() noexcept = default;
    explicit Bitstream(std::span<const core::byte> payload);

    // ---- writing ------------------------------------------------------- //

    /// @brief Appends the low @p bitCount bits of @p value, 1 <= bitCount <= 32.
    void writeBits(core::u32 value, core::u32 bitCount);

    void writeU8(core::u8 value)   { writeBits(value, 8); }
    void writeU16(core::u16 value) { writeBits(value, 16); }
    void writeU32(core::u32 value) { writeBits(value, 32); }
    void writeU64(core::u64 value);
    void writeI32(core::i32 value) { writeU32(static_cast<core::u32>(value)); }

    [[nodiscard]] core::u32 bitsWritten() const noexcept;

    /// @brief Hands over the payload, zero-padding the last byte.
    [[nodiscard]] std::vector<core::byte> release();

    // ---- reading ------------------------------------------------------- //

    [[nodiscard]] core::Expected<core::u32> readBits(core::u32 bitCount);

    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32() { return readBits(32); }
    [[nodiscard]] core::Expected<core::u64> readU64();
    [[nodiscard]] core::Expected<core::i32> readI32();

    [[nodiscard]] core::u32 bitsRemaining() const noexcept;

private:
    std::vector<core::byte> bytes_;

    // Writer: bits not yet forming a whole byte, right-aligned.
    core::u64 pending_{0};
    core::u32 pendingBits_{0};

    // Reader: absolute bit offset into bytes_.
    core::u32 cursor_{0};
    bool      reading_{false};
};

} // namespace tether::net::protocol
