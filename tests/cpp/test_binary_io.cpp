#include <gtest/gtest.h>
#include "utils/BinaryIO.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace binform;
using namespace binform::utils;

// Integer assembly in both byte orders
TEST(BinaryIO, ReadUnsignedLittleEndian) {
    std::vector<uint8_t> buffer = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};

    // Short: 0x0201 = 513
    EXPECT_EQ(readUnsigned(buffer.data(), 2, ByteOrder::Little), 513u);

    // Int: 0x04030201 = 67305985
    EXPECT_EQ(readUnsigned(buffer.data(), 4, ByteOrder::Little), 67305985u);

    // Long: 0x0807060504030201
    EXPECT_EQ(readUnsigned(buffer.data(), 8, ByteOrder::Little), 0x0807060504030201ull);
}

TEST(BinaryIO, ReadUnsignedBigEndian) {
    std::vector<uint8_t> buffer = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};

    EXPECT_EQ(readUnsigned(buffer.data(), 2, ByteOrder::Big), 0x0102u);
    EXPECT_EQ(readUnsigned(buffer.data(), 4, ByteOrder::Big), 0x01020304u);
    EXPECT_EQ(readUnsigned(buffer.data(), 8, ByteOrder::Big), 0x0102030405060708ull);

    // Odd widths are fine too
    EXPECT_EQ(readUnsigned(buffer.data(), 3, ByteOrder::Big), 0x010203u);
    EXPECT_EQ(readUnsigned(buffer.data(), 3, ByteOrder::Little), 0x030201u);
}

TEST(BinaryIO, SignExtend) {
    EXPECT_EQ(signExtend(0xff, 1), -1);
    EXPECT_EQ(signExtend(0x7f, 1), 127);
    EXPECT_EQ(signExtend(0x8000, 2), -32768);
    EXPECT_EQ(signExtend(0x800000, 3), -8388608);
    EXPECT_EQ(signExtend(0xffffffffffffffffull, 8), -1);
    EXPECT_EQ(signExtend(0x12345678, 4), 0x12345678);
}

// IEEE754 half precision
TEST(BinaryIO, HalfToFloat) {
    EXPECT_FLOAT_EQ(halfToFloat(0x0000), 0.0f);
    EXPECT_FLOAT_EQ(halfToFloat(0x3c00), 1.0f);
    EXPECT_FLOAT_EQ(halfToFloat(0xc000), -2.0f);
    EXPECT_FLOAT_EQ(halfToFloat(0x7bff), 65504.0f);

    // Smallest subnormal: 2^-24
    EXPECT_FLOAT_EQ(halfToFloat(0x0001), std::ldexp(1.0f, -24));

    EXPECT_TRUE(std::isinf(halfToFloat(0x7c00)));
    EXPECT_TRUE(std::isnan(halfToFloat(0x7e00)));
    EXPECT_TRUE(std::signbit(halfToFloat(0x8000)));
}

TEST(BinaryIO, ReadIeee) {
    // 1.5f = 0x3FC00000
    std::vector<uint8_t> single = {0x3f, 0xc0, 0x00, 0x00};
    EXPECT_DOUBLE_EQ(readIeee(single.data(), 4, ByteOrder::Big), 1.5);

    // -0.25 = 0xBFD0000000000000
    std::vector<uint8_t> dbl = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xd0, 0xbf};
    EXPECT_DOUBLE_EQ(readIeee(dbl.data(), 8, ByteOrder::Little), -0.25);

    std::vector<uint8_t> half = {0x00, 0x3c};
    EXPECT_DOUBLE_EQ(readIeee(half.data(), 2, ByteOrder::Little), 1.0);
}
