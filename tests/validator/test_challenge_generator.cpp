// ZEUS - Challenge Generator Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>
#include "zeus/validator/challenge_generator.h"

#include <map>
#include <set>

namespace zeus {
namespace validator {
namespace test {

using protocol::ChallengeClass;

class ChallengeGeneratorTest : public ::testing::Test {
protected:
    ChallengeGeneratorTest() : rng_(20240101) {
        config_.algorithm = protocol::PowAlgorithm::Sha256d;
    }

    ValidatorConfig config_;
    SeededRandom rng_;
};

TEST_F(ChallengeGeneratorTest, GenerateFillsEveryField) {
    ChallengeGenerator gen(config_, rng_);
    auto c = gen.Generate(ChallengeClass::HighDifficulty, 0x1000, 1700000000000);
    
    EXPECT_EQ(c.challengeClass, ChallengeClass::HighDifficulty);
    EXPECT_EQ(c.difficultyTarget, 0x400u);
    EXPECT_EQ(c.timeoutSec, 20u);
    EXPECT_EQ(c.issuedAt, 1700000000000);
    EXPECT_EQ(c.algorithm, protocol::PowAlgorithm::Sha256d);
    EXPECT_EQ(c.payload.size(), protocol::HEADER_TEMPLATE_SIZE);
    EXPECT_TRUE(c.IsWellFormed());
}

TEST_F(ChallengeGeneratorTest, TargetIsClamped) {
    ChallengeGenerator gen(config_, rng_);
    auto hard = gen.Generate(ChallengeClass::HighDifficulty, config_.minDifficulty, 0);
    EXPECT_EQ(hard.difficultyTarget, config_.minDifficulty);
    auto easy = gen.Generate(ChallengeClass::TimePressure, config_.maxDifficulty, 0);
    EXPECT_EQ(easy.difficultyTarget, config_.maxDifficulty);
}

TEST_F(ChallengeGeneratorTest, ChallengesAreUnique) {
    ChallengeGenerator gen(config_, rng_);
    std::set<std::string> ids;
    std::set<Bytes> payloads;
    for (int i = 0; i < 200; ++i) {
        // Same timestamp and target: only the random payload differs
        auto c = gen.Generate(ChallengeClass::Standard, 0xffff, 1000);
        ids.insert(c.id);
        payloads.insert(c.payload);
    }
    EXPECT_EQ(ids.size(), 200u);
    EXPECT_EQ(payloads.size(), 200u);
}

TEST_F(ChallengeGeneratorTest, SeededRunsReplay) {
    SeededRandom a(9);
    SeededRandom b(9);
    ChallengeGenerator ga(config_, a);
    ChallengeGenerator gb(config_, b);
    for (int i = 0; i < 5; ++i) {
        auto ca = ga.Generate(0xffff, 1000 + i);
        auto cb = gb.Generate(0xffff, 1000 + i);
        EXPECT_EQ(ca.id, cb.id);
        EXPECT_EQ(ca.challengeClass, cb.challengeClass);
    }
}

TEST_F(ChallengeGeneratorTest, DrawTableIsCumulative) {
    ChallengeGenerator gen(config_, rng_);
    auto table = gen.GetDrawTable();
    EXPECT_NEAR(table[0], 0.4, 1e-12);
    EXPECT_NEAR(table[1], 0.6, 1e-12);
    EXPECT_NEAR(table[2], 0.8, 1e-12);
    EXPECT_DOUBLE_EQ(table[3], 1.0);
}

TEST_F(ChallengeGeneratorTest, DrawFollowsDistribution) {
    ChallengeGenerator gen(config_, rng_);
    std::map<ChallengeClass, int> counts;
    const int draws = 20000;
    for (int i = 0; i < draws; ++i) {
        ++counts[gen.DrawClass()];
    }
    EXPECT_NEAR(counts[ChallengeClass::Standard] / double(draws), 0.4, 0.02);
    EXPECT_NEAR(counts[ChallengeClass::HighDifficulty] / double(draws), 0.2, 0.02);
    EXPECT_NEAR(counts[ChallengeClass::TimePressure] / double(draws), 0.2, 0.02);
    EXPECT_NEAR(counts[ChallengeClass::EfficiencyTest] / double(draws), 0.2, 0.02);
}

TEST_F(ChallengeGeneratorTest, ZeroWeightClassNeverDrawn) {
    ChallengeGenerator gen(config_, rng_);
    gen.SetClassWeights({{2.0, 0.0, 2.0, 0.0}});
    for (int i = 0; i < 2000; ++i) {
        ChallengeClass cls = gen.DrawClass();
        EXPECT_TRUE(cls == ChallengeClass::Standard || cls == ChallengeClass::TimePressure);
    }
}

TEST_F(ChallengeGeneratorTest, AllZeroWeightsFallBackToUniform) {
    ChallengeGenerator gen(config_, rng_);
    gen.SetClassWeights({{0.0, 0.0, 0.0, 0.0}});
    auto table = gen.GetDrawTable();
    EXPECT_NEAR(table[0], 0.25, 1e-12);
    EXPECT_NEAR(table[2], 0.75, 1e-12);
}

} // namespace test
} // namespace validator
} // namespace zeus
