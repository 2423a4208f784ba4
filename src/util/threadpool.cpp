// ZEUS - Thread Pool Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/util/threadpool.h"
#include "zeus/util/logging.h"

#include <algorithm>

namespace zeus {
namespace util {

// ============================================================================
// ThreadPool
// ============================================================================

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) {
    config_.numThreads = numThreads;
    Start();
}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    if (config_.startImmediately) {
        Start();
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    if (running_.exchange(true)) {
        return;
    }
    
    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::max<size_t>(2, std::thread::hardware_concurrency());
    }
    
    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    waitCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (!tasks_.empty()) {
        LOG_DEBUG(LogCategory::DEFAULT) << "Pool " << config_.name << " dropped "
                                        << tasks_.size() << " pending tasks";
    }
    std::priority_queue<PrioritizedTask> empty;
    std::swap(tasks_, empty);
    waitCondition_.notify_all();
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

bool ThreadPool::Enqueue(TaskPriority priority, std::function<void()> task,
                         bool throwOnFailure) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            if (throwOnFailure) {
                throw std::runtime_error("ThreadPool " + config_.name + " not running");
            }
            return false;
        }
        if (tasks_.size() >= config_.maxQueueSize) {
            if (throwOnFailure) {
                throw std::runtime_error("ThreadPool " + config_.name + " queue full");
            }
            return false;
        }
        tasks_.push(PrioritizedTask{priority, nextSequence_++, std::move(task)});
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });
            if (!running_.load()) {
                return;
            }
            task = std::move(const_cast<PrioritizedTask&>(tasks_.top()).task);
            tasks_.pop();
            activeTasks_.fetch_add(1);
        }
        
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "Unhandled exception in pool "
                                            << config_.name << ": " << e.what();
        }
        
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        waitCondition_.notify_all();
    }
}

// ============================================================================
// TaskGroup
// ============================================================================

TaskGroup::TaskGroup(ThreadPool& pool) : pool_(pool) {}

TaskGroup::~TaskGroup() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return pendingCount_ == 0; });
}

void TaskGroup::Finish(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error && !exception_) {
            exception_ = error;
        }
        --pendingCount_;
    }
    condition_.notify_all();
}

void TaskGroup::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return pendingCount_ == 0; });
    if (exception_) {
        std::exception_ptr ex = exception_;
        exception_ = nullptr;
        std::rethrow_exception(ex);
    }
}

bool TaskGroup::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!condition_.wait_for(lock, timeout, [this] { return pendingCount_ == 0; })) {
        return false;
    }
    if (exception_) {
        std::exception_ptr ex = exception_;
        exception_ = nullptr;
        std::rethrow_exception(ex);
    }
    return true;
}

size_t TaskGroup::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingCount_;
}

// ============================================================================
// SerialQueue
// ============================================================================

SerialQueue::SerialQueue(ThreadPool& pool, std::string name)
    : pool_(pool), name_(std::move(name)) {}

SerialQueue::~SerialQueue() {
    Drain();
}

void SerialQueue::Post(std::function<void()> task) {
    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
        if (!scheduled_) {
            scheduled_ = true;
            schedule = true;
        }
    }
    if (schedule && !pool_.TrySubmit([this]() { RunNext(); })) {
        // Pool is stopped or saturated: run on the caller's thread
        RunNext();
    }
}

void SerialQueue::RunTask(std::function<void()>& task) {
    try {
        task();
    } catch (const std::exception& e) {
        LOG_ERROR(LogCategory::DEFAULT) << "Task on queue " << name_
                                        << " failed: " << e.what();
    }
}

void SerialQueue::RunNext() {
    while (true) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                scheduled_ = false;
                idle_.notify_all();
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        
        RunTask(task);
        
        // Yield the worker between tasks so one busy queue cannot starve others
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                scheduled_ = false;
                idle_.notify_all();
                return;
            }
        }
        if (pool_.TrySubmit([this]() { RunNext(); })) {
            return;
        }
    }
}

void SerialQueue::Drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !scheduled_; });
}

size_t SerialQueue::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// Scheduler
// ============================================================================

Scheduler::Scheduler(ThreadPool& pool) : pool_(pool) {}

Scheduler::~Scheduler() {
    Stop();
}

void Scheduler::Start() {
    if (running_.exchange(true)) {
        return;
    }
    schedulerThread_ = std::thread(&Scheduler::SchedulerLoop, this);
}

void Scheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
    CancelAll();
}

uint64_t Scheduler::ScheduleAfter(std::chrono::milliseconds delay,
                                  std::function<void()> func,
                                  TaskPriority priority) {
    return ScheduleTask(std::chrono::steady_clock::now() + delay,
                        std::chrono::milliseconds(0), priority, std::move(func));
}

uint64_t Scheduler::SchedulePeriodic(std::chrono::milliseconds initialDelay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> func,
                                     TaskPriority priority) {
    return ScheduleTask(std::chrono::steady_clock::now() + initialDelay,
                        period, priority, std::move(func));
}

bool Scheduler::Cancel(uint64_t taskId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (taskId == 0 || taskId >= nextId_.load()) {
        return false;
    }
    return cancelled_.insert(taskId).second;
}

void Scheduler::CancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!tasks_.empty()) {
        tasks_.pop();
    }
    cancelled_.clear();
}

size_t Scheduler::TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() - std::min(tasks_.size(), cancelled_.size());
}

uint64_t Scheduler::ScheduleTask(std::chrono::steady_clock::time_point time,
                                 std::chrono::milliseconds period,
                                 TaskPriority priority,
                                 std::function<void()> func) {
    uint64_t id = nextId_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(ScheduledTask{id, time, period, priority,
                                  std::make_shared<std::function<void()>>(std::move(func))});
    }
    condition_.notify_one();
    return id;
}

void Scheduler::SchedulerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (tasks_.empty()) {
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });
            continue;
        }
        
        auto now = std::chrono::steady_clock::now();
        if (tasks_.top().nextRun > now) {
            condition_.wait_until(lock, tasks_.top().nextRun);
            continue;
        }
        
        ScheduledTask task = tasks_.top();
        tasks_.pop();
        
        auto cancelledIt = cancelled_.find(task.id);
        if (cancelledIt != cancelled_.end()) {
            cancelled_.erase(cancelledIt);
            continue;
        }
        
        if (!pool_.TryExecuteWithPriority(task.priority, [fn = task.task]() { (*fn)(); })) {
            LOG_WARN(LogCategory::DEFAULT) << "Scheduler could not dispatch task "
                                           << task.id;
        }
        
        if (task.period.count() > 0) {
            task.nextRun = now + task.period;
            tasks_.push(std::move(task));
        }
    }
}

} // namespace util
} // namespace zeus
