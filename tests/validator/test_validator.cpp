// ZEUS - Validator Orchestration Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>
#include "zeus/validator/validator.h"
#include "zeus/protocol/pow.h"

#include <atomic>
#include <filesystem>
#include <map>

namespace zeus {
namespace validator {
namespace test {

namespace {

enum class Behavior { Honest, Silent, Down, Cheater, Garbled };

/// In-process miners that answer according to a fixed behavior
class FakeTransport : public IMinerTransport {
public:
    void Set(const MinerId& id, Behavior b) {
        std::lock_guard<std::mutex> lock(mutex_);
        behaviors_[id] = b;
    }

    TransportResult Exchange(const MinerEndpoint& endpoint,
                             const protocol::Challenge& challenge) override {
        ++exchanges;
        Behavior behavior;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            behavior = behaviors_[endpoint.id];
        }

        TransportResult tr;
        tr.receivedAt = challenge.issuedAt + 100;
        switch (behavior) {
            case Behavior::Honest:
            case Behavior::Cheater: {
                protocol::Proof p;
                p.challengeId = challenge.id;
                p.nonce = Search(challenge, behavior == Behavior::Honest);
                p.elapsedMs = 100;
                p.deviceId = "zeus-0";
                tr.status = TransportResult::Status::Reply;
                tr.reply = protocol::MinerReply::FromProof(p);
                break;
            }
            case Behavior::Silent:
                tr.status = TransportResult::Status::Reply;
                tr.reply = protocol::MinerReply::NoSolution(challenge.id);
                break;
            case Behavior::Down:
                tr.status = TransportResult::Status::ConnectionFailed;
                tr.error = "connection refused";
                break;
            case Behavior::Garbled:
                tr.status = TransportResult::Status::ProtocolError;
                tr.error = "malformed-json";
                break;
        }
        return tr;
    }

    std::atomic<int> exchanges{0};

private:
    static uint32_t Search(const protocol::Challenge& c, bool valid) {
        for (uint32_t nonce = 0;; ++nonce) {
            if (protocol::CheckProofOfWork(c.payload, nonce, c.difficultyTarget, c.algorithm) == valid) {
                return nonce;
            }
        }
    }

    std::mutex mutex_;
    std::map<MinerId, Behavior> behaviors_;
};

MinerEndpoint Endpoint(const MinerId& id) {
    MinerEndpoint ep;
    ep.id = id;
    ep.host = "127.0.0.1";
    ep.port = 8091;
    return ep;
}

} // namespace

class ValidatorTest : public ::testing::Test {
protected:
    ValidatorTest() : pool_(4), rng_(1234) {
        config_.algorithm = protocol::PowAlgorithm::Sha256d;
        // Easy targets keep the in-process search short
        config_.baseDifficulty = 0x00ffffff;
        config_.epochRounds = 0;
    }

    std::unique_ptr<Validator> Make(CheckpointStore* store = nullptr, std::string dataDir = "") {
        return std::make_unique<Validator>(config_, transport_, pool_, rng_, store, dataDir);
    }

    void AddMiner(Validator& v, const MinerId& id, Behavior b) {
        transport_.Set(id, b);
        ASSERT_TRUE(v.AddMiner(Endpoint(id)));
    }

    ValidatorConfig config_;
    util::ThreadPool pool_;
    SeededRandom rng_;
    FakeTransport transport_;
};

TEST_F(ValidatorTest, HonestMinerIsAccepted) {
    auto v = Make();
    AddMiner(*v, "alice", Behavior::Honest);
    
    RoundStats stats = v->RunRound();
    EXPECT_EQ(stats.round, 1u);
    EXPECT_EQ(stats.dispatched, 1u);
    EXPECT_EQ(stats.accepted, 1u);
    
    v->Registry().DrainAll();
    auto record = v->Registry().Snapshot("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->challengeCount, 1u);
    EXPECT_EQ(record->acceptedCount, 1u);
    EXPECT_EQ(record->epochScoreCount, 1u);
    EXPECT_GE(record->epochScoreSum, 1.0);
    EXPECT_EQ(v->Ledger().CountInState(ChallengeState::Accepted), 1u);
}

TEST_F(ValidatorTest, MixedRoundOutcomes) {
    auto v = Make();
    AddMiner(*v, "honest", Behavior::Honest);
    AddMiner(*v, "silent", Behavior::Silent);
    AddMiner(*v, "down", Behavior::Down);
    AddMiner(*v, "cheater", Behavior::Cheater);
    AddMiner(*v, "garbled", Behavior::Garbled);
    
    RoundStats stats = v->RunRound();
    EXPECT_EQ(stats.dispatched, 5u);
    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_EQ(stats.expired, 3u);
    
    v->Registry().DrainAll();
    auto silent = v->Registry().Snapshot("silent");
    ASSERT_TRUE(silent.has_value());
    EXPECT_EQ(silent->challengeCount, 1u);
    EXPECT_EQ(silent->acceptedCount, 0u);
    EXPECT_EQ(silent->submittedCount, 0u);
    
    auto cheater = v->Registry().Snapshot("cheater");
    ASSERT_TRUE(cheater.has_value());
    EXPECT_EQ(cheater->submittedCount, 1u);
    EXPECT_GT(cheater->errorRate, 0.0);
    
    // Every challenge reached a terminal state
    EXPECT_EQ(v->Ledger().CountInState(ChallengeState::AwaitingProof), 0u);
    EXPECT_EQ(v->Ledger().CountInState(ChallengeState::Expired), 3u);
    EXPECT_EQ(v->Ledger().CountInState(ChallengeState::RejectedInvalid), 1u);
}

TEST_F(ValidatorTest, ScoreObserverSeesEveryOutcome) {
    auto v = Make();
    AddMiner(*v, "alice", Behavior::Honest);
    AddMiner(*v, "bob", Behavior::Silent);
    
    std::mutex m;
    std::map<MinerId, double> scores;
    v->SetScoreObserver([&](const Score& s) {
        std::lock_guard<std::mutex> lock(m);
        scores[s.minerId] = s.final;
    });
    v->RunRound();
    v->Registry().DrainAll();
    
    std::lock_guard<std::mutex> lock(m);
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_GE(scores["alice"], 1.0);
    EXPECT_DOUBLE_EQ(scores["bob"], 0.0);
}

TEST_F(ValidatorTest, EpochExportsNormalizedWeights) {
    auto dir = std::filesystem::temp_directory_path() / "zeus_validator_test";
    std::filesystem::create_directories(dir);
    config_.epochRounds = 3;
    
    auto v = Make(nullptr, dir.string());
    AddMiner(*v, "alice", Behavior::Honest);
    AddMiner(*v, "bob", Behavior::Silent);
    
    v->RunRound();
    v->RunRound();
    EXPECT_EQ(v->Epoch(), 0u);
    EXPECT_FALSE(v->LastWeights().has_value());
    v->RunRound();
    EXPECT_EQ(v->Epoch(), 1u);
    
    auto weights = v->LastWeights();
    ASSERT_TRUE(weights.has_value());
    EXPECT_EQ(weights->epoch, 1u);
    EXPECT_NEAR(weights->Total(), 1.0, 1e-9);
    EXPECT_NEAR(weights->WeightOf("alice"), 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(weights->WeightOf("bob"), 0.0);
    EXPECT_TRUE(std::filesystem::exists(dir / "weights.json"));
    
    std::filesystem::remove_all(dir);
}

TEST_F(ValidatorTest, CheckpointAndRestore) {
    db::MemoryDatabase db;
    CheckpointStore store(db);
    {
        auto v = Make(&store);
        AddMiner(*v, "alice", Behavior::Honest);
        v->RunRound();
        v->RunRound();
        v->RunEpoch();
        EXPECT_TRUE(v->Checkpoint());
    }
    
    auto restored = Make(&store);
    EXPECT_EQ(restored->Restore(), 1u);
    EXPECT_EQ(restored->Epoch(), 1u);
    AddMiner(*restored, "alice", Behavior::Honest);
    
    auto record = restored->Registry().Snapshot("alice");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->challengeCount, 2u);
    EXPECT_EQ(record->acceptedCount, 2u);
    EXPECT_NEAR(record->consensusWeight, 1.0, 1e-9);
}

TEST_F(ValidatorTest, RestoredTargetsAreClamped) {
    db::MemoryDatabase db;
    CheckpointStore store(db);
    MinerRecord loose = MinerRecord::Create("alice", 0xffffffff, 0);
    MinerRecord tight = MinerRecord::Create("bob", 0, 0);
    MinerRecord inRange = MinerRecord::Create("carol", 0x00123456, 0);
    ASSERT_TRUE(store.Save({loose, tight, inRange}, 3).ok());
    
    auto v = Make(&store);
    AddMiner(*v, "bob", Behavior::Honest);
    EXPECT_EQ(v->Restore(), 3u);
    AddMiner(*v, "alice", Behavior::Honest);
    AddMiner(*v, "carol", Behavior::Honest);
    
    EXPECT_EQ(v->Registry().Snapshot("alice")->difficulty.target, config_.maxDifficulty);
    EXPECT_EQ(v->Registry().Snapshot("bob")->difficulty.target, config_.minDifficulty);
    EXPECT_EQ(v->Registry().Snapshot("carol")->difficulty.target, 0x00123456u);
}

TEST_F(ValidatorTest, CheckpointWithoutStore) {
    auto v = Make();
    EXPECT_FALSE(v->Checkpoint());
    EXPECT_EQ(v->Restore(), 0u);
}

TEST_F(ValidatorTest, DuplicateMinerRejected) {
    auto v = Make();
    AddMiner(*v, "alice", Behavior::Honest);
    EXPECT_FALSE(v->AddMiner(Endpoint("alice")));
    EXPECT_EQ(v->Registry().Size(), 1u);
}

TEST_F(ValidatorTest, StartStop) {
    auto v = Make();
    AddMiner(*v, "alice", Behavior::Honest);
    v->Start();
    v->RunRound();
    v->Stop();
    EXPECT_EQ(transport_.exchanges.load(), 1);
}

// ============================================================================
// Endpoints
// ============================================================================

TEST(MinerEndpointTest, Parse) {
    auto ep = MinerEndpoint::Parse("alice@10.0.0.1:8091");
    ASSERT_TRUE(ep.has_value());
    EXPECT_EQ(ep->id, "alice");
    EXPECT_EQ(ep->host, "10.0.0.1");
    EXPECT_EQ(ep->port, 8091);
    EXPECT_EQ(ep->ToString(), "alice@10.0.0.1:8091");
    
    EXPECT_FALSE(MinerEndpoint::Parse("10.0.0.1:8091").has_value());
    EXPECT_FALSE(MinerEndpoint::Parse("@host:1").has_value());
    EXPECT_FALSE(MinerEndpoint::Parse("bob@host").has_value());
    EXPECT_FALSE(MinerEndpoint::Parse("bob@host:0").has_value());
}

} // namespace test
} // namespace validator
} // namespace zeus
