// ZEUS - Hex and Hash Type Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>
#include "zeus/core/hex.h"
#include "zeus/core/types.h"

#include <stdexcept>

using namespace zeus;

// ============================================================================
// Hex Encoding
// ============================================================================

TEST(HexTest, BytesToHexLowercase) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fabff");
    EXPECT_EQ(BytesToHex(data.data(), 0), "");
}

TEST(HexTest, HexToBytesMixedCase) {
    auto bytes = HexToBytes("DeadBEEF");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0xde);
    EXPECT_EQ(bytes[3], 0xef);
}

TEST(HexTest, HexToBytesRejectsBadInput) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_TRUE(HexToBytes("").empty());
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}

// ============================================================================
// Hash256
// ============================================================================

TEST(Hash256Test, DefaultIsNull) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.ToHex(), std::string(64, '0'));
}

TEST(Hash256Test, HexKeepsByteOrder) {
    std::string hex = "01" + std::string(62, '0');
    Hash256 h = Hash256::FromHex(hex);
    EXPECT_EQ(h[0], 0x01);
    EXPECT_FALSE(h.IsNull());
    EXPECT_EQ(h.ToHex(), hex);
}

TEST(Hash256Test, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash256::FromHex("00"), std::invalid_argument);
}

TEST(Hash256Test, ComparisonUsesHighByteFirst) {
    Hash256 low;
    Hash256 high;
    low[0] = 0xff;
    high[31] = 0x01;
    EXPECT_TRUE(low < high);
    EXPECT_FALSE(high < low);
    EXPECT_NE(low, high);
}

// ============================================================================
// Little-endian helpers
// ============================================================================

TEST(EndianTest, ReadWriteLE32) {
    Byte buf[4];
    WriteLE32(buf, 0x11223344u);
    EXPECT_EQ(buf[0], 0x44);
    EXPECT_EQ(buf[3], 0x11);
    EXPECT_EQ(ReadLE32(buf), 0x11223344u);
}

TEST(EndianTest, WriteLE64) {
    Byte buf[8];
    WriteLE64(buf, 0x0102030405060708ULL);
    EXPECT_EQ(buf[0], 0x08);
    EXPECT_EQ(buf[7], 0x01);
    EXPECT_EQ(ReadLE32(buf + 4), 0x01020304u);
}

TEST(TimeTest, MillisTracksSeconds) {
    int64_t s = GetTime();
    TimestampMs ms = GetTimeMillis();
    EXPECT_NEAR(static_cast<double>(ms / 1000), static_cast<double>(s), 2.0);
}
