// ZEUS - Miner Server Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>

#include "zeus/miner/server.h"
#include "zeus/miner/simulated_device.h"
#include "zeus/core/random.h"
#include "zeus/util/threadpool.h"

namespace zeus {
namespace miner {
namespace test {

class MinerServerTest : public ::testing::Test {
protected:
    MinerServerTest()
        : link_(1), responder_(link_, ResponderConfig{}), pool_(2),
          server_(responder_, outbox_, pool_) {}

    void SetUp() override {
        outbox_.Start();
        std::string error;
        ASSERT_TRUE(server_.Start("127.0.0.1", 0, error)) << error;
        ASSERT_NE(server_.Port(), 0);
    }

    void TearDown() override {
        server_.Stop();
        pool_.Wait();
        outbox_.Stop();
    }

    util::TcpStream Connect() {
        std::string error;
        util::TcpStream stream = util::TcpStream::Connect("127.0.0.1", server_.Port(), 2000, error);
        EXPECT_TRUE(stream.IsOpen()) << error;
        EXPECT_TRUE(stream.SetTimeout(10000));
        return stream;
    }

    protocol::Challenge MakeChallenge() {
        protocol::Challenge c;
        c.challengeClass = protocol::ChallengeClass::TimePressure;
        c.difficultyTarget = 0x0fffffff;
        c.timeoutSec = 6;
        c.issuedAt = GetTimeMillis();
        c.algorithm = protocol::PowAlgorithm::Sha256d;
        c.payload = protocol::BuildHeaderTemplate(c.difficultyTarget, c.issuedAt / 1000, rng_);
        c.id = protocol::ComputeChallengeId(c.payload, c.difficultyTarget, c.issuedAt);
        return c;
    }

    SeededRandom rng_{7};
    SimulatedDeviceLink link_;
    MinerResponder responder_;
    util::ThreadPool pool_;
    ProofOutbox outbox_;
    MinerServer server_;
};

TEST_F(MinerServerTest, AnswersChallengeWithProof) {
    protocol::Challenge c = MakeChallenge();
    util::TcpStream stream = Connect();
    ASSERT_TRUE(stream.SendAll(protocol::EncodeChallenge(c) + "\n"));

    std::string line;
    ASSERT_TRUE(stream.ReadLine(line));
    auto reply = protocol::DecodeMinerReply(line);
    ASSERT_TRUE(reply) << reply.Error().ToString();
    ASSERT_EQ(reply.Value().kind, protocol::MinerReply::Kind::Proof);
    EXPECT_EQ(reply.Value().challengeId, c.id);
    EXPECT_EQ(reply.Value().proof.deviceId, "sim0");
    EXPECT_TRUE(protocol::CheckProofOfWork(c.payload, reply.Value().proof.nonce,
                                           c.difficultyTarget, c.algorithm));
    EXPECT_EQ(server_.Answered(), 1u);
}

TEST_F(MinerServerTest, MalformedChallengeClosesConnection) {
    util::TcpStream stream = Connect();
    ASSERT_TRUE(stream.SendAll("{\"type\":\"challenge\",\"challenge_id\":\"x\"}\n"));

    std::string line;
    EXPECT_FALSE(stream.ReadLine(line));
    EXPECT_EQ(server_.Malformed(), 1u);
    EXPECT_EQ(server_.Answered(), 0u);
}

} // namespace test
} // namespace miner
} // namespace zeus
