// ZEUS - Random Number Generation Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>
#include "zeus/core/random.h"
#include "zeus/core/types.h"
#include <vector>
#include <set>
#include <algorithm>

using namespace zeus;

// ============================================================================
// GetRandBytes Tests
// ============================================================================

TEST(RandomTest, GetRandBytesNonZero) {
    // Random bytes should not all be zero (extremely unlikely)
    std::vector<uint8_t> bytes(32);
    GetRandBytes(bytes.data(), bytes.size());
    
    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, GetRandBytesDifferent) {
    std::vector<uint8_t> bytes1(32);
    std::vector<uint8_t> bytes2(32);
    
    GetRandBytes(bytes1.data(), bytes1.size());
    GetRandBytes(bytes2.data(), bytes2.size());
    
    EXPECT_NE(bytes1, bytes2);
}

TEST(RandomTest, GetRandBytesZeroLength) {
    uint8_t dummy = 0;
    EXPECT_NO_THROW(GetRandBytes(&dummy, 0));
}

TEST(RandomTest, GetOSEntropy) {
    std::vector<uint8_t> bytes(64, 0);
    EXPECT_TRUE(detail::GetOSEntropy(bytes.data(), bytes.size()));
}

// ============================================================================
// Integer Tests
// ============================================================================

TEST(RandomTest, GetRandIntRange) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(GetRandInt(10), 10u);
    }
}

TEST(RandomTest, GetRandIntDegenerate) {
    EXPECT_EQ(GetRandInt(0), 0u);
    EXPECT_EQ(GetRandInt(1), 0u);
}

TEST(RandomTest, GetRandIntCoversRange) {
    std::set<uint64_t> seen;
    for (int i = 0; i < 2000; ++i) {
        seen.insert(GetRandInt(4));
    }
    EXPECT_EQ(seen.size(), 4u);
}

// ============================================================================
// SeededRandom Tests
// ============================================================================

TEST(RandomTest, SeededRandomIsDeterministic) {
    SeededRandom a(42);
    SeededRandom b(42);
    
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(a.NextUint64(), b.NextUint64());
    }
    EXPECT_EQ(a.NextBytes(76), b.NextBytes(76));
}

TEST(RandomTest, SeededRandomDiffersBySeed) {
    SeededRandom a(1);
    SeededRandom b(2);
    EXPECT_NE(a.NextBytes(32), b.NextBytes(32));
}

TEST(RandomTest, NextDoubleInUnitInterval) {
    SeededRandom rng(7);
    double sum = 0.0;
    for (int i = 0; i < 10000; ++i) {
        double d = rng.NextDouble();
        ASSERT_GE(d, 0.0);
        ASSERT_LT(d, 1.0);
        sum += d;
    }
    // Mean of U[0,1) should be near 0.5
    EXPECT_NEAR(sum / 10000.0, 0.5, 0.02);
}

TEST(RandomTest, NextIntThroughInterface) {
    SeededRandom rng(99);
    RandomSource& source = rng;
    std::set<uint64_t> seen;
    for (int i = 0; i < 500; ++i) {
        uint64_t v = source.NextInt(3);
        ASSERT_LT(v, 3u);
        seen.insert(v);
    }
    EXPECT_EQ(seen.size(), 3u);
}

TEST(RandomTest, NextBytesOddLength) {
    SeededRandom rng(5);
    Bytes out = rng.NextBytes(13);
    EXPECT_EQ(out.size(), 13u);
}
