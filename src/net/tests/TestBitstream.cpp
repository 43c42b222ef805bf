/**
 * @file TestBitstream.cpp
 * @brief Unit tests for net::protocol::Bitstream.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/net/protocol/Bitstream.hpp"

#include <vector>

namespace tether::net {

using namespace net::protocol;

TEST_CASE("Bitstream packs bits most significant first", "[protocol][bitstream]")
{
    Bitstream out;
    out.writeBits(0b101, 3);
    out.writeU8(0xFF);

    REQUIRE(out.bitsWritten() == 11);
    const auto bytes = out.release();
    REQUIRE(bytes.size() == 2);
    REQUIRE(bytes[0] == core::byte{0b10111111});
    REQUIRE(bytes[1] == core::byte{0b11100000});
}

TEST_CASE("Bitstream multi-byte values are big-endian", "[protocol][bitstream]")
{
    Bitstream out;
    out.writeU32(0x54544852u);
    const auto bytes = out.release();
    REQUIRE(bytes == std::vector<core::byte>{core::byte{'T'}, core::byte{'T'},
                                             core::byte{'H'}, core::byte{'R'}});
}

TEST_CASE("Bitstream reads back what was written", "[protocol][bitstream]")
{
    Bitstream out;
    out.writeU16(0xBEEF);
    out.writeI32(-1234);
    out.writeU64(0x0123456789ABCDEFull);
    const auto bytes = out.release();

    Bitstream in{bytes};
    REQUIRE(in.bitsRemaining() == 14 * 8);

    const auto a = in.readU16();
    const auto b = in.readI32();
    const auto c = in.readU64();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(c.has_value());
    REQUIRE(*a == 0xBEEF);
    REQUIRE(*b == -1234);
    REQUIRE(*c == 0x0123456789ABCDEFull);
    REQUIRE(in.bitsRemaining() == 0);
}

TEST_CASE("Bitstream reports underflow instead of reading garbage", "[protocol][bitstream]")
{
    const std::vector<core::byte> bytes{core::byte{0x01}, core::byte{0x02}};
    Bitstream in{bytes};

    const auto value = in.readU32();
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code() == core::ErrorCode::kOutOfRange);

    const auto small = in.readU16();
    REQUIRE(small.has_value());
    REQUIRE(*small == 0x0102);
    REQUIRE_FALSE(in.readU8().has_value());
}

} // namespace tether::net
