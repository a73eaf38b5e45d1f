#include <gtest/gtest.h>
#include "utils/BinaryIO.hpp"
#include <vector>

using namespace ninep::utils;

// Test Little Endian Reads
TEST(BinaryIO, ReadLittleEndian) {
    std::vector<uint8_t> buffer = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};

    // 0x0201 = 513
    EXPECT_EQ(readLe16(buffer.data()), 513);

    // 0x04030201 = 67305985
    EXPECT_EQ(readLe32(buffer.data()), 67305985u);

    EXPECT_EQ(readLe64(buffer.data()), 0x0807060504030201ull);
}

// High bits must come back unsigned, never sign-extended.
TEST(BinaryIO, ReadHighBitIsUnsigned) {
    std::vector<uint8_t> buffer(8, 0xff);

    EXPECT_EQ(readLe16(buffer.data()), 0xffffu);
    EXPECT_EQ(readLe32(buffer.data()), 0xffffffffu);
    EXPECT_EQ(readLe64(buffer.data()), 0xffffffffffffffffull);
}

TEST(BinaryIO, WriteLittleEndian) {
    std::vector<uint8_t> buffer(8, 0);

    writeLe16(buffer.data(), 0xbeef);
    EXPECT_EQ(buffer[0], 0xef);
    EXPECT_EQ(buffer[1], 0xbe);

    writeLe32(buffer.data(), 0x80000001u);
    EXPECT_EQ(buffer[0], 0x01);
    EXPECT_EQ(buffer[3], 0x80);

    writeLe64(buffer.data(), 0x0102030405060708ull);
    std::vector<uint8_t> expected = {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
    EXPECT_EQ(buffer, expected);
}

TEST(BinaryIO, TemplateDispatchMatchesWidth) {
    std::vector<uint8_t> buffer = {0xaa, 0xbb, 0xcc, 0xdd, 0x11, 0x22, 0x33, 0x44};

    EXPECT_EQ(readLe<uint8_t>(buffer.data()), 0xaa);
    EXPECT_EQ(readLe<uint16_t>(buffer.data()), 0xbbaa);
    EXPECT_EQ(readLe<uint32_t>(buffer.data()), 0xddccbbaau);
    EXPECT_EQ(readLe<uint64_t>(buffer.data()), 0x44332211ddccbbaaull);
}
