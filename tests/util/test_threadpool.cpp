// ZEUS - Thread Pool Tests
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include <gtest/gtest.h>

#include "zeus/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace zeus {
namespace util {
namespace {

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<ThreadPool>(4);
    }
    
    void TearDown() override {
        pool_.reset();
    }
    
    std::unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, Construction) {
    EXPECT_TRUE(pool_->IsRunning());
    EXPECT_EQ(pool_->ThreadCount(), 4u);
}

TEST_F(ThreadPoolTest, SubmitAndWait) {
    auto future = pool_->Submit([]() { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST_F(ThreadPoolTest, SubmitPropagatesException) {
    auto future = pool_->Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadPoolTest, TrySubmitOnFullQueue) {
    ThreadPool::Config config;
    config.maxQueueSize = 1;
    config.numThreads = 1;
    ThreadPool smallPool(config);
    
    std::atomic<bool> started{false};
    std::atomic<bool> block{true};
    smallPool.Execute([&]() {
        started = true;
        while (block.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    
    EXPECT_TRUE(smallPool.TrySubmit([]() {}));
    EXPECT_FALSE(smallPool.TrySubmit([]() {}));
    block = false;
    smallPool.Wait();
}

TEST_F(ThreadPoolTest, HigherPriorityRunsFirst) {
    ThreadPool single(1);
    std::atomic<bool> block{true};
    single.Execute([&block]() {
        while (block.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    
    std::mutex mutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(name);
    };
    ASSERT_TRUE(single.TryExecuteWithPriority(TaskPriority::Low, record, "checkpoint"));
    single.Execute(record, "miner-1");
    single.Execute(record, "miner-2");
    auto sweep = single.SubmitWithPriority(TaskPriority::High, record, "sweep");
    
    block = false;
    sweep.get();
    single.Wait();
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], "sweep");
    EXPECT_EQ(order[1], "miner-1");
    EXPECT_EQ(order[2], "miner-2");
    EXPECT_EQ(order[3], "checkpoint");
}

TEST_F(ThreadPoolTest, Shutdown) {
    pool_->Shutdown();
    EXPECT_FALSE(pool_->IsRunning());
    EXPECT_FALSE(pool_->TrySubmit([]() {}));
}

// ============================================================================
// TaskGroup
// ============================================================================

TEST_F(ThreadPoolTest, TaskGroup) {
    std::atomic<int> counter{0};
    TaskGroup group(*pool_);
    for (int i = 0; i < 10; ++i) {
        group.Add([&counter]() { counter++; });
    }
    group.Wait();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(group.PendingCount(), 0u);
}

TEST_F(ThreadPoolTest, TaskGroupRethrowsFirstException) {
    std::atomic<int> counter{0};
    TaskGroup group(*pool_);
    group.Add([]() { throw std::runtime_error("miner task failed"); });
    for (int i = 0; i < 5; ++i) {
        group.Add([&counter]() { counter++; });
    }
    EXPECT_THROW(group.Wait(), std::runtime_error);
    EXPECT_EQ(counter.load(), 5);
}

TEST_F(ThreadPoolTest, TaskGroupWaitFor) {
    std::atomic<bool> release{false};
    TaskGroup group(*pool_);
    group.Add([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    EXPECT_FALSE(group.WaitFor(std::chrono::milliseconds(20)));
    release = true;
    EXPECT_TRUE(group.WaitFor(std::chrono::milliseconds(5000)));
}

// ============================================================================
// SerialQueue
// ============================================================================

TEST_F(ThreadPoolTest, SerialQueueRunsInOrder) {
    SerialQueue queue(*pool_, "alice");
    std::vector<int> order;
    for (int i = 0; i < 100; ++i) {
        queue.Post([&order, i]() { order.push_back(i); });
    }
    queue.Drain();
    
    ASSERT_EQ(order.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(order[i], i);
    }
    EXPECT_EQ(queue.Pending(), 0u);
}

TEST_F(ThreadPoolTest, SerialQueueNeverOverlaps) {
    SerialQueue queue(*pool_, "bob");
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    
    for (int i = 0; i < 50; ++i) {
        queue.Post([&]() {
            int now = ++inside;
            int seen = maxInside.load();
            while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            --inside;
        });
    }
    queue.Drain();
    EXPECT_EQ(maxInside.load(), 1);
}

TEST_F(ThreadPoolTest, SerialQueuesRunConcurrently) {
    SerialQueue a(*pool_, "a");
    SerialQueue b(*pool_, "b");
    std::atomic<bool> aRunning{false};
    std::atomic<bool> sawOverlap{false};
    
    a.Post([&]() {
        aRunning = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        aRunning = false;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    b.Post([&]() { sawOverlap = aRunning.load(); });
    
    a.Drain();
    b.Drain();
    EXPECT_TRUE(sawOverlap.load());
}

TEST_F(ThreadPoolTest, SerialQueueSubmitReturnsResult) {
    SerialQueue queue(*pool_, "carol");
    int state = 0;
    queue.Post([&state]() { state = 7; });
    auto result = queue.Submit([&state]() { return state * 2; });
    EXPECT_EQ(result.get(), 14);
}

TEST_F(ThreadPoolTest, SerialQueueSurvivesThrowingTask) {
    SerialQueue queue(*pool_, "dave");
    std::atomic<int> after{0};
    queue.Post([]() { throw std::runtime_error("bad record"); });
    queue.Post([&after]() { after++; });
    queue.Drain();
    EXPECT_EQ(after.load(), 1);
}

// ============================================================================
// Scheduler
// ============================================================================

TEST_F(ThreadPoolTest, SchedulerRunsDelayedAndPeriodic) {
    Scheduler scheduler(*pool_);
    scheduler.Start();
    
    std::atomic<int> once{0};
    std::atomic<int> periodic{0};
    scheduler.ScheduleAfter(std::chrono::milliseconds(10), [&once]() { once++; });
    uint64_t id = scheduler.SchedulePeriodic(std::chrono::milliseconds(5),
                                             std::chrono::milliseconds(5),
                                             [&periodic]() { periodic++; });
    
    for (int i = 0; i < 400 && (once.load() == 0 || periodic.load() < 3); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(once.load(), 1);
    EXPECT_GE(periodic.load(), 3);
    
    EXPECT_TRUE(scheduler.Cancel(id));
    scheduler.Stop();
    EXPECT_FALSE(scheduler.IsRunning());
}

TEST_F(ThreadPoolTest, SchedulerDispatchesAtTaskPriority) {
    ThreadPool single(1);
    Scheduler scheduler(single);
    scheduler.Start();
    
    std::atomic<bool> block{true};
    single.Execute([&block]() {
        while (block.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    
    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 3; ++i) {
        single.Execute([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    scheduler.ScheduleAfter(std::chrono::milliseconds(0), [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(-1);
    }, TaskPriority::High);
    
    for (int i = 0; i < 400 && single.PendingTasks() < 4; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    size_t pending = single.PendingTasks();
    block = false;
    single.Wait();
    ASSERT_EQ(pending, 4u);
    scheduler.Stop();
    
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], -1);
    EXPECT_EQ(order[3], 2);
}

} // namespace
} // namespace util
} // namespace zeus
