// ZEUS - Checkpoint Store Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>
#include "zeus/validator/checkpoint.h"
#include "zeus/util/json.h"

namespace zeus {
namespace validator {
namespace test {

class CheckpointTest : public ::testing::Test {
protected:
    static MinerRecord Sample(const MinerId& id) {
        MinerRecord r = MinerRecord::Create(id, 0x1234, 1000);
        r.lastSeenAt = 5000;
        r.successRate = DualRateEwma(0.9, 0.7, true);
        r.responseTimeMs = 812.5;
        r.responseVarianceMs2 = 4000.0;
        r.responseSamples = 8;
        r.errorRate = 0.125;
        r.acceptRate = 0.8125;
        r.hashrateEstimate = 1.5e6;
        r.challengeCount = 11;
        r.acceptedCount = 9;
        r.submittedCount = 10;
        r.difficulty.highStreak = 3;
        r.difficulty.sinceAdjust = 4;
        r.difficulty.adjustments = 2;
        r.weightTracker = DualRateEwma(1.4, 1.2, true);
        r.consensusWeight = 0.33;
        r.epochScoreSum = 2.5;
        r.epochScoreCount = 2;
        return r;
    }

    db::MemoryDatabase db_;
};

TEST_F(CheckpointTest, SaveAndLoad) {
    CheckpointStore store(db_);
    std::vector<MinerRecord> saved = {Sample("alice"), Sample("bob")};
    ASSERT_TRUE(store.Save(saved, 42).ok());
    
    std::vector<MinerRecord> loaded;
    ASSERT_TRUE(store.Load(loaded).ok());
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0], saved[0]);
    EXPECT_EQ(loaded[1], saved[1]);
    EXPECT_EQ(store.LoadEpoch(), 42u);
}

TEST_F(CheckpointTest, EmptyStore) {
    CheckpointStore store(db_);
    std::vector<MinerRecord> loaded;
    ASSERT_TRUE(store.Load(loaded).ok());
    EXPECT_TRUE(loaded.empty());
    EXPECT_EQ(store.LoadEpoch(), 0u);
}

TEST_F(CheckpointTest, SaveOverwrites) {
    CheckpointStore store(db_);
    MinerRecord r = Sample("alice");
    ASSERT_TRUE(store.Save({r}, 1).ok());
    r.challengeCount = 99;
    ASSERT_TRUE(store.Save({r}, 2).ok());
    
    std::vector<MinerRecord> loaded;
    ASSERT_TRUE(store.Load(loaded).ok());
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].challengeCount, 99u);
    EXPECT_EQ(store.LoadEpoch(), 2u);
}

TEST_F(CheckpointTest, CorruptRecordIsSkipped) {
    CheckpointStore store(db_);
    ASSERT_TRUE(store.Save({Sample("alice")}, 1).ok());
    db_.Put(db::MakeKey(db::prefix::MINER_RECORD, "broken"), db::Slice("\x07junk"));
    
    std::vector<MinerRecord> loaded;
    ASSERT_TRUE(store.Load(loaded).ok());
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].minerId, "alice");
}

TEST_F(CheckpointTest, UnknownVersionIsRejected) {
    std::string raw = db::SerializeToString(Sample("alice"));
    raw[0] = static_cast<char>(MINER_RECORD_VERSION + 1);
    MinerRecord out;
    EXPECT_FALSE(db::DeserializeFromString(raw, out));
}

TEST_F(CheckpointTest, SaveWeights) {
    CheckpointStore store(db_);
    WeightVector v;
    v.epoch = 4;
    v.weights["alice"] = 1.0;
    ASSERT_TRUE(store.SaveWeights(v).ok());
    
    std::string value;
    ASSERT_TRUE(db_.Get(db::MakeKey(db::prefix::WEIGHTS), &value).ok());
    EXPECT_EQ(util::JSONValue::Parse(value)["epoch"].GetInt(), 4);
}

} // namespace test
} // namespace validator
} // namespace zeus
