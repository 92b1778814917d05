#include "src/bit_codec.hpp"
#include "src/errors.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

TEST(BitCodec, MostSignificantBitFirst) {
    EXPECT_EQ(gdd::byteToBits(0xB4).toString(), "10110100");
    EXPECT_EQ(gdd::byteToBits(0x01).toString(), "00000001");
    EXPECT_EQ(gdd::byteToBits(0x80).toString(), "10000000");
    EXPECT_EQ(gdd::bitsToByte(gdd::BitVector::fromString("00000011")), 0x03);
}

TEST(BitCodec, EveryByteRoundTrips) {
    for (int value = 0; value < 256; ++value) {
        auto byte = static_cast<uint8_t>(value);
        auto bits = gdd::byteToBits(byte);
        ASSERT_EQ(bits.size(), 8u);
        EXPECT_EQ(gdd::bitsToByte(bits), byte) << "Byte " << value;
    }
}

TEST(BitCodec, ByteNeedsEightBits) {
    EXPECT_THROW(gdd::bitsToByte(gdd::BitVector::zeros(7)), gdd::InvalidLength);
    EXPECT_THROW(gdd::bitsToByte(gdd::BitVector::zeros(9)), gdd::InvalidLength);
}

TEST(BitCodec, MultiByteRanges) {
    std::vector<uint8_t> bytes{0xAB, 0xCD, 0xEF};
    auto bits = gdd::bytesToBits(bytes, 1, 2);
    EXPECT_EQ(bits.toString(), "1100110111101111");
    EXPECT_THROW(gdd::bytesToBits(bytes, 2, 2), std::out_of_range);

    std::vector<uint8_t> out;
    gdd::appendBytes(bits, out);
    EXPECT_EQ(out, (std::vector<uint8_t>{0xCD, 0xEF}));
    EXPECT_THROW(gdd::appendBytes(gdd::BitVector::zeros(12), out), gdd::InvalidLength);
}
