// ZEUS - Serialization Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>
#include "zeus/core/serialize.h"

#include <cmath>
#include <limits>

using namespace zeus;

// ============================================================================
// DataStream
// ============================================================================

TEST(DataStreamTest, WriteThenRead) {
    DataStream s;
    const uint8_t in[] = {1, 2, 3};
    s.Write(in, sizeof(in));
    EXPECT_EQ(s.size(), 3u);
    
    uint8_t out[2];
    s.Read(out, 2);
    EXPECT_EQ(out[1], 2);
    EXPECT_EQ(s.size(), 1u);
    EXPECT_FALSE(s.empty());
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream s;
    ser_writedata8(s, 0x7f);
    uint8_t out[2];
    EXPECT_THROW(s.Read(out, 2), std::ios_base::failure);
}

TEST(DataStreamTest, ConstructFromBuffer) {
    std::vector<uint8_t> raw = {0x04, 0x03, 0x02, 0x01};
    DataStream s(raw);
    EXPECT_EQ(ser_readdata32(s), 0x01020304u);
    EXPECT_TRUE(s.empty());
}

// ============================================================================
// Integers
// ============================================================================

TEST(SerializeTest, IntegersAreLittleEndian) {
    DataStream s;
    s << uint32_t{0xaabbccdd} << uint64_t{1};
    ASSERT_EQ(s.size(), 12u);
    EXPECT_EQ(s.data()[0], 0xdd);
    EXPECT_EQ(s.data()[4], 0x01);
    
    uint32_t a = 0;
    uint64_t b = 0;
    s >> a >> b;
    EXPECT_EQ(a, 0xaabbccddu);
    EXPECT_EQ(b, 1u);
}

TEST(SerializeTest, SignedAndBool) {
    DataStream s;
    s << int64_t{-5} << true << uint8_t{9};
    
    int64_t i = 0;
    bool flag = false;
    uint8_t small = 0;
    s >> i >> flag >> small;
    EXPECT_EQ(i, -5);
    EXPECT_TRUE(flag);
    EXPECT_EQ(small, 9);
}

TEST(SerializeTest, DoubleBitExact) {
    DataStream s;
    const double values[] = {0.0, -1.5, 1e-300, std::numeric_limits<double>::infinity()};
    for (double v : values) s << v;
    for (double v : values) {
        double out = 0;
        s >> out;
        EXPECT_EQ(out, v);
    }
}

// ============================================================================
// Strings
// ============================================================================

TEST(SerializeTest, StringLengthPrefix) {
    DataStream s;
    s << std::string("zeus");
    EXPECT_EQ(s.size(), 8u);
    
    std::string out;
    s >> out;
    EXPECT_EQ(out, "zeus");
}

TEST(SerializeTest, EmptyString) {
    DataStream s;
    s << std::string();
    std::string out = "x";
    s >> out;
    EXPECT_TRUE(out.empty());
}

TEST(SerializeTest, TruncatedStringThrows) {
    DataStream s;
    ser_writedata32(s, 10);
    s.Write("abc", 3);
    std::string out;
    EXPECT_THROW(s >> out, std::ios_base::failure);
}

TEST(SerializeTest, OversizedStringThrows) {
    DataStream s;
    ser_writedata32(s, static_cast<uint32_t>(MAX_SERIALIZE_SIZE + 1));
    std::string out;
    EXPECT_THROW(s >> out, std::ios_base::failure);
}
