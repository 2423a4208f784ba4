// ZEUS - Scoring Engine Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>
#include "zeus/validator/scoring_engine.h"
#include "zeus/validator/difficulty_controller.h"
#include "zeus/validator/weight_aggregator.h"
#include "zeus/util/json.h"

namespace zeus {
namespace validator {
namespace test {

using protocol::ChallengeClass;

class ScoringEngineTest : public ::testing::Test {
protected:
    static ChallengeOutcome Accepted(ChallengeClass cls, int64_t elapsedMs) {
        ChallengeOutcome o;
        o.challengeId = "c1";
        o.minerId = "alice";
        o.challengeClass = cls;
        o.difficultyTarget = 0xffff;
        o.result = VerificationResult::Accepted;
        o.elapsedMs = elapsedMs;
        return o;
    }

    /// Seasoned miner: long history, steady, high success
    MinerRecord Veteran() const {
        MinerRecord r = MinerRecord::Create("vet", 0xffff, 0);
        r.challengeCount = 50;
        r.acceptedCount = 45;
        r.submittedCount = 45;
        r.acceptRate = 1.0;
        r.successRate = DualRateEwma(0.9, 0.9, true);
        r.responseSamples = 45;
        r.responseTimeMs = 1000.0;
        r.responseVarianceMs2 = 1000.0;
        return r;
    }

    /// Two challenges in, both solved
    MinerRecord Newcomer() const {
        MinerRecord r = MinerRecord::Create("new", 0xffff, 0);
        r.challengeCount = 2;
        r.acceptedCount = 2;
        r.submittedCount = 2;
        r.acceptRate = 1.0;
        r.successRate = DualRateEwma(1.0, 1.0, true);
        return r;
    }

    ValidatorConfig config_;
};

TEST_F(ScoringEngineTest, RejectedScoresZero) {
    ScoringEngine engine(config_);
    for (VerificationResult r : {VerificationResult::Invalid, VerificationResult::Late,
                                 VerificationResult::Stale, VerificationResult::Duplicate,
                                 VerificationResult::Expired}) {
        ChallengeOutcome o = Accepted(ChallengeClass::HighDifficulty, 10);
        o.result = r;
        Score s = engine.Evaluate(o, Veteran());
        EXPECT_DOUBLE_EQ(s.final, 0.0) << VerificationResultToString(r);
        EXPECT_TRUE(s.bonuses.empty());
    }
}

TEST_F(ScoringEngineTest, FreshMinerGetsBaseAndSpeed) {
    ScoringEngine engine(config_);
    MinerRecord fresh = MinerRecord::Create("x", 0xffff, 0);
    
    Score s = engine.Evaluate(Accepted(ChallengeClass::Standard, 2500), fresh);
    EXPECT_DOUBLE_EQ(s.base, 1.0);
    EXPECT_DOUBLE_EQ(s.BonusValue(BonusName::SPEED), 0.25);
    EXPECT_EQ(s.bonuses.size(), 1u);
    EXPECT_DOUBLE_EQ(s.final, 1.25);
    EXPECT_FALSE(s.capped);
}

TEST_F(ScoringEngineTest, SpeedBonusShape) {
    ScoringEngine engine(config_);
    MinerRecord fresh = MinerRecord::Create("x", 0xffff, 0);
    
    EXPECT_DOUBLE_EQ(engine.Evaluate(Accepted(ChallengeClass::Standard, 0), fresh)
                         .BonusValue(BonusName::SPEED), config_.speedBonusMax);
    EXPECT_FALSE(engine.Evaluate(Accepted(ChallengeClass::Standard, 5000), fresh)
                     .HasBonus(BonusName::SPEED));
    EXPECT_FALSE(engine.Evaluate(Accepted(ChallengeClass::Standard, 9000), fresh)
                     .HasBonus(BonusName::SPEED));
}

TEST_F(ScoringEngineTest, ClassBonuses) {
    ScoringEngine engine(config_);
    MinerRecord fresh = MinerRecord::Create("x", 0xffff, 0);
    
    Score high = engine.Evaluate(Accepted(ChallengeClass::HighDifficulty, 6000), fresh);
    EXPECT_DOUBLE_EQ(high.BonusValue(BonusName::HIGH_DIFFICULTY), config_.highDifficultyBonus);
    
    Score quick = engine.Evaluate(Accepted(ChallengeClass::EfficiencyTest, 100), fresh);
    EXPECT_DOUBLE_EQ(quick.BonusValue(BonusName::EFFICIENCY_TEST), config_.efficiencyTestBonusMax);
    Score slow = engine.Evaluate(Accepted(ChallengeClass::EfficiencyTest, 2000), fresh);
    EXPECT_NEAR(slow.BonusValue(BonusName::EFFICIENCY_TEST), config_.efficiencyTestBonusMax * 0.05, 1e-12);
}

TEST_F(ScoringEngineTest, VeteranBonuses) {
    ScoringEngine engine(config_);
    Score s = engine.Evaluate(Accepted(ChallengeClass::Standard, 6000), Veteran());
    
    EXPECT_TRUE(s.HasBonus(BonusName::HISTORICAL));
    EXPECT_TRUE(s.HasBonus(BonusName::CONSISTENCY));
    EXPECT_FALSE(s.HasBonus(BonusName::EARLY_DETECTION));
    // Accept ratio 1.0 against a 0.5 target
    EXPECT_DOUBLE_EQ(s.BonusValue(BonusName::EFFICIENCY), config_.efficiencyBonusMax);
}

TEST_F(ScoringEngineTest, NewcomerIsDetectedEarly) {
    ScoringEngine engine(config_);
    Score newcomer = engine.Evaluate(Accepted(ChallengeClass::Standard, 6000), Newcomer());
    Score veteran = engine.Evaluate(Accepted(ChallengeClass::Standard, 6000), Veteran());
    
    EXPECT_TRUE(newcomer.HasBonus(BonusName::EARLY_DETECTION));
    EXPECT_FALSE(newcomer.HasBonus(BonusName::HISTORICAL));
    // base + efficiency + early detection vs base + efficiency + historical + consistency
    EXPECT_NEAR(newcomer.final, 1.5, 1e-12);
    EXPECT_NEAR(veteran.final, 1.65, 1e-12);
}

TEST_F(ScoringEngineTest, NewcomerOutranksEstablishedMinerOnSameProof) {
    config_.newMinerThreshold = 5;
    ScoringEngine engine(config_);
    
    MinerRecord newcomer = Newcomer();
    MinerRecord established = Newcomer();
    established.minerId = "old";
    established.challengeCount = 5;
    established.acceptedCount = 5;
    established.submittedCount = 5;
    
    ChallengeOutcome proof = Accepted(ChallengeClass::Standard, 2500);
    Score fresh = engine.Evaluate(proof, newcomer);
    Score seasoned = engine.Evaluate(proof, established);
    EXPECT_TRUE(fresh.HasBonus(BonusName::EARLY_DETECTION));
    EXPECT_FALSE(seasoned.HasBonus(BonusName::EARLY_DETECTION));
    EXPECT_GT(fresh.final, seasoned.final);
    
    newcomer.epochScoreSum = fresh.final;
    newcomer.epochScoreCount = 1;
    established.epochScoreSum = seasoned.final;
    established.epochScoreCount = 1;
    std::vector<MinerRecord*> records = {&newcomer, &established};
    WeightVector weights = WeightAggregator(config_).Aggregate(records, 1);
    EXPECT_GT(weights.WeightOf("new"), weights.WeightOf("old"));
}

TEST_F(ScoringEngineTest, InvalidStreakRemovesEfficiencyBonus) {
    ScoringEngine engine(config_);
    DifficultyController ctl(config_);
    MinerRecord r = ctl.NewRecord("alice", 0);
    
    ChallengeOutcome o = Accepted(ChallengeClass::Standard, 1000);
    for (int i = 0; i < 100; ++i) {
        o.difficultyTarget = r.difficulty.target;
        ctl.RecordOutcome(r, o);
    }
    EXPECT_TRUE(engine.Evaluate(o, r).HasBonus(BonusName::EFFICIENCY));
    
    o.result = VerificationResult::Invalid;
    for (int i = 0; i < 40; ++i) {
        ctl.RecordOutcome(r, o);
    }
    // 100 of 140 lifetime, but the recent submissions are all invalid
    EXPECT_LT(r.acceptRate, config_.efficiencyTarget);
    o.result = VerificationResult::Accepted;
    EXPECT_FALSE(engine.Evaluate(o, r).HasBonus(BonusName::EFFICIENCY));
}

TEST_F(ScoringEngineTest, EarlyDetectionCliff) {
    MinerRecord r = Newcomer();
    r.challengeCount = config_.newMinerThreshold - 1;
    r.acceptedCount = r.challengeCount;
    EXPECT_TRUE(QualifiesForEarlyDetection(r, config_));
    
    r.challengeCount = config_.newMinerThreshold;
    r.acceptedCount = r.challengeCount;
    EXPECT_FALSE(QualifiesForEarlyDetection(r, config_));
    
    r.challengeCount = 4;
    r.acceptedCount = 3;
    EXPECT_FALSE(QualifiesForEarlyDetection(r, config_));
    
    EXPECT_FALSE(QualifiesForEarlyDetection(MinerRecord::Create("x", 1, 0), config_));
}

TEST_F(ScoringEngineTest, TotalIsCapped) {
    ScoringEngine engine(config_);
    MinerRecord r = Newcomer();
    r.responseSamples = 2;
    r.responseVarianceMs2 = 0.0;
    
    Score s = engine.Evaluate(Accepted(ChallengeClass::HighDifficulty, 0), r);
    EXPECT_TRUE(s.capped);
    EXPECT_DOUBLE_EQ(s.final, config_.capTotal);
    EXPECT_GT(s.base + s.BonusTotal(), config_.capTotal);
}

TEST_F(ScoringEngineTest, Deterministic) {
    ScoringEngine engine(config_);
    MinerRecord r = Veteran();
    ChallengeOutcome o = Accepted(ChallengeClass::EfficiencyTest, 1234);
    Score a = engine.Evaluate(o, r);
    Score b = engine.Evaluate(o, r);
    EXPECT_EQ(a.ToJSON().ToJSON(), b.ToJSON().ToJSON());
    EXPECT_EQ(a.final, b.final);
}

TEST_F(ScoringEngineTest, JsonBreakdown) {
    ScoringEngine engine(config_);
    Score s = engine.Evaluate(Accepted(ChallengeClass::HighDifficulty, 1000), Newcomer());
    util::JSONValue json = s.ToJSON();
    EXPECT_EQ(json["result"].GetString(), "accepted");
    EXPECT_DOUBLE_EQ(json["bonuses"]["high_difficulty"].GetDouble(), config_.highDifficultyBonus);
    EXPECT_DOUBLE_EQ(json["final"].GetDouble(), s.final);
}

} // namespace test
} // namespace validator
} // namespace zeus
