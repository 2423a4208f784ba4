// ZEUS - Proof Outbox Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>

#include "zeus/miner/proof_outbox.h"

#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

namespace zeus {
namespace miner {
namespace test {

class ProofOutboxTest : public ::testing::Test {
protected:
    ProofOutbox::SendFunction Recorder() {
        return [this](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(line);
            return true;
        };
    }

    std::vector<std::string> Lines() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    std::mutex mutex_;
    std::vector<std::string> lines_;
};

TEST_F(ProofOutboxTest, SendsInOrder) {
    ProofOutbox outbox;
    outbox.Start();
    EXPECT_TRUE(outbox.IsRunning());

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(outbox.Enqueue("c" + std::to_string(i), "line" + std::to_string(i), Recorder()));
    }
    outbox.Flush();

    std::vector<std::string> lines = Lines();
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "line0");
    EXPECT_EQ(lines[4], "line4");
    EXPECT_EQ(outbox.Sent(), 5u);
    EXPECT_EQ(outbox.Pending(), 0u);
    outbox.Stop();
    EXPECT_FALSE(outbox.IsRunning());
}

TEST_F(ProofOutboxTest, RejectsWhenStopped) {
    ProofOutbox outbox;
    EXPECT_FALSE(outbox.Enqueue("c0", "line", Recorder()));
    EXPECT_EQ(outbox.Dropped(), 1u);
    EXPECT_TRUE(Lines().empty());
}

TEST_F(ProofOutboxTest, DropsWhenFull) {
    ProofOutbox outbox(2);
    outbox.Start();

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> entered;
    std::future<void> enteredFuture = entered.get_future();
    bool first = true;

    // The first send blocks so the queue fills behind it
    auto blocking = [&, gate](const std::string& line) {
        if (first) {
            first = false;
            entered.set_value();
            gate.wait();
        }
        return true;
    };

    EXPECT_TRUE(outbox.Enqueue("c0", "a", blocking));
    enteredFuture.wait();
    EXPECT_TRUE(outbox.Enqueue("c1", "b", blocking));
    EXPECT_TRUE(outbox.Enqueue("c2", "c", blocking));
    EXPECT_FALSE(outbox.Enqueue("c3", "d", blocking));
    EXPECT_EQ(outbox.Dropped(), 1u);
    EXPECT_EQ(outbox.Pending(), 2u);

    release.set_value();
    outbox.Flush();
    EXPECT_EQ(outbox.Sent(), 3u);
    outbox.Stop();
}

TEST_F(ProofOutboxTest, FailedSendsAreCountedAndDropped) {
    ProofOutbox outbox;
    outbox.Start();
    EXPECT_TRUE(outbox.Enqueue("c0", "x", [](const std::string&) { return false; }));
    EXPECT_TRUE(outbox.Enqueue("c1", "y", [](const std::string&) -> bool {
        throw std::runtime_error("connection reset");
    }));
    EXPECT_TRUE(outbox.Enqueue("c2", "z", Recorder()));
    outbox.Flush();

    EXPECT_EQ(outbox.Failed(), 2u);
    EXPECT_EQ(outbox.Sent(), 1u);
    EXPECT_EQ(Lines().size(), 1u);
    outbox.Stop();
}

TEST_F(ProofOutboxTest, StopDrainsQueue) {
    ProofOutbox outbox;
    outbox.Start();
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(outbox.Enqueue("c", "line", Recorder()));
    }
    outbox.Stop();
    EXPECT_EQ(Lines().size(), 10u);
    EXPECT_EQ(outbox.Pending(), 0u);
}

TEST_F(ProofOutboxTest, RestartAfterStop) {
    ProofOutbox outbox;
    outbox.Start();
    outbox.Stop();
    outbox.Start();
    EXPECT_TRUE(outbox.Enqueue("c", "again", Recorder()));
    outbox.Flush();
    EXPECT_EQ(Lines().size(), 1u);
}

} // namespace test
} // namespace miner
} // namespace zeus
