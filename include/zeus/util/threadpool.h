// ZEUS - Thread Pool
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Concurrency primitives for the validator and miner daemons:
// - ThreadPool with task priorities and futures
// - TaskGroup for fork/join over a pool
// - SerialQueue: a FIFO strand that runs one task at a time on a pool
// - Scheduler for delayed and periodic tasks

#ifndef ZEUS_UTIL_THREADPOOL_H
#define ZEUS_UTIL_THREADPOOL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace zeus {
namespace util {

// ============================================================================
// Task Priority
// ============================================================================

/// Queued tasks run highest priority first, FIFO within a priority
enum class TaskPriority {
    Low = 0,
    Normal = 1,
    High = 2
};

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * Fixed set of worker threads draining a bounded priority queue.
 * 
 * Submit() returns a future that carries the task's result or exception.
 * Execute() is fire-and-forget; exceptions escaping such a task are logged.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{10000};
        std::string name{"pool"};
        bool startImmediately{true};
    };
    
    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);
    
    /// Joins workers; tasks still queued are dropped
    ~ThreadPool();
    
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    
    void Start();
    
    /// Block until the queue is empty and no task is executing
    void Wait();
    
    /// Stop workers and drop pending tasks
    void Shutdown();
    
    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return activeTasks_.load(); }
    const std::string& Name() const { return config_.name; }
    
    // ========================================================================
    // Task Submission
    // ========================================================================
    
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        return SubmitWithPriority(TaskPriority::Normal,
                                  std::forward<F>(f),
                                  std::forward<Args>(args)...);
    }
    
    /// Throws std::runtime_error if the pool is stopped or full
    template<typename F, typename... Args>
    auto SubmitWithPriority(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;
        
        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();
        
        Enqueue(priority, [task]() { (*task)(); }, true);
        return result;
    }
    
    template<typename F, typename... Args>
    void Execute(F&& f, Args&&... args) {
        Enqueue(TaskPriority::Normal,
                std::bind(std::forward<F>(f), std::forward<Args>(args)...), true);
    }
    
    /// Returns false instead of throwing when stopped or full
    template<typename F, typename... Args>
    bool TrySubmit(F&& f, Args&&... args) {
        return TryExecuteWithPriority(TaskPriority::Normal,
                                      std::forward<F>(f), std::forward<Args>(args)...);
    }
    
    template<typename F, typename... Args>
    bool TryExecuteWithPriority(TaskPriority priority, F&& f, Args&&... args) {
        return Enqueue(priority,
                       std::bind(std::forward<F>(f), std::forward<Args>(args)...),
                       false);
    }

private:
    struct PrioritizedTask {
        TaskPriority priority;
        uint64_t sequence;
        std::function<void()> task;
        
        /// Higher priority first, then FIFO
        bool operator<(const PrioritizedTask& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };
    
    bool Enqueue(TaskPriority priority, std::function<void()> task, bool throwOnFailure);
    void WorkerLoop();
    
    Config config_;
    std::vector<std::thread> workers_;
    std::priority_queue<PrioritizedTask> tasks_;
    uint64_t nextSequence_{0};
    
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;
    
    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};
};

// ============================================================================
// Task Group
// ============================================================================

/// Group multiple tasks and wait for all to complete
class TaskGroup {
public:
    explicit TaskGroup(ThreadPool& pool);
    ~TaskGroup();
    
    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    
    template<typename F, typename... Args>
    void Add(F&& f, Args&&... args) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++pendingCount_;
        }
        auto func = std::bind(std::forward<F>(f), std::forward<Args>(args)...);
        try {
            pool_.Execute([this, func]() mutable { RunOne(func); });
        } catch (...) {
            Finish(nullptr);
            throw;
        }
    }
    
    /// Wait for all tasks; rethrows the first exception raised by a task
    void Wait();
    
    /// Returns false on timeout
    bool WaitFor(std::chrono::milliseconds timeout);
    
    size_t PendingCount() const;

private:
    template<typename Fn>
    void RunOne(Fn& func) {
        try {
            func();
            Finish(nullptr);
        } catch (...) {
            Finish(std::current_exception());
        }
    }
    
    void Finish(std::exception_ptr error);
    
    ThreadPool& pool_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    size_t pendingCount_{0};
    std::exception_ptr exception_;
};

// ============================================================================
// Serial Queue
// ============================================================================

/**
 * Strand bound to a ThreadPool: posted tasks run one at a time in FIFO order,
 * never concurrently with each other, on whichever pool worker is free.
 * 
 * Used as the single owner of mutable per-miner state.
 */
class SerialQueue {
public:
    SerialQueue(ThreadPool& pool, std::string name);
    
    /// Drains remaining tasks before returning
    ~SerialQueue();
    
    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;
    
    /// Append a task
    void Post(std::function<void()> task);
    
    /// Append a task and obtain its result
    template<typename F>
    auto Submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
        using ReturnType = typename std::invoke_result<F>::type;
        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        Post([task]() { (*task)(); });
        return result;
    }
    
    /// Block until every task posted so far has run
    void Drain();
    
    size_t Pending() const;
    const std::string& Name() const { return name_; }

private:
    void RunNext();
    void RunTask(std::function<void()>& task);
    
    ThreadPool& pool_;
    std::string name_;
    std::deque<std::function<void()>> queue_;
    bool scheduled_{false};
    mutable std::mutex mutex_;
    std::condition_variable idle_;
};

// ============================================================================
// Scheduler
// ============================================================================

/// Runs delayed and periodic tasks on a ThreadPool, at the priority given
/// when the task was scheduled
class Scheduler {
public:
    explicit Scheduler(ThreadPool& pool);
    ~Scheduler();
    
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    
    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }
    
    /// @return Task ID for cancellation
    uint64_t ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> func,
                           TaskPriority priority = TaskPriority::Normal);
    
    /// First run after initialDelay, then every period
    uint64_t SchedulePeriodic(std::chrono::milliseconds initialDelay,
                              std::chrono::milliseconds period,
                              std::function<void()> func,
                              TaskPriority priority = TaskPriority::Normal);
    
    bool Cancel(uint64_t taskId);
    void CancelAll();
    size_t TaskCount() const;

private:
    struct ScheduledTask {
        uint64_t id;
        std::chrono::steady_clock::time_point nextRun;
        std::chrono::milliseconds period;
        TaskPriority priority;
        std::shared_ptr<std::function<void()>> task;
        
        bool operator>(const ScheduledTask& other) const {
            return nextRun > other.nextRun;
        }
    };
    
    uint64_t ScheduleTask(std::chrono::steady_clock::time_point time,
                          std::chrono::milliseconds period,
                          TaskPriority priority,
                          std::function<void()> func);
    void SchedulerLoop();
    
    ThreadPool& pool_;
    std::thread schedulerThread_;
    
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>,
                        std::greater<ScheduledTask>> tasks_;
    std::set<uint64_t> cancelled_;
    
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> nextId_{1};
};

} // namespace util
} // namespace zeus

#endif // ZEUS_UTIL_THREADPOOL_H
