// CHAINSYNC - Thread Pool
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Worker pool, task groups and a delayed/periodic scheduler. The provider
// dispatches node events and reconnect attempts through these; the sync
// engine fans out history fetches with TaskGroup.

#ifndef CHAINSYNC_UTIL_THREADPOOL_H
#define CHAINSYNC_UTIL_THREADPOOL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace chainsync {
namespace util {

// ============================================================================
// Task Priority
// ============================================================================

enum class TaskPriority {
    Low = 0,
    Normal = 1,
    High = 2
};

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * A fixed-size pool of worker threads fed from a priority queue.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};       // 0 = hardware concurrency
        size_t maxQueueSize{10000}; // Maximum pending tasks
        std::string name{"pool"};   // Pool name for logging
    };

    /// Starts the workers
    explicit ThreadPool(const Config& config);

    /// Destructor (drops pending tasks, joins workers)
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Stop workers; pending tasks are discarded
    void Shutdown();

    bool IsRunning() const { return running_.load(); }

    // ========================================================================
    // Task Submission
    // ========================================================================

    /**
     * Submit a task without caring about the result.
     */
    template<typename F, typename... Args>
    void Execute(F&& f, Args&&... args) {
        ExecuteWithPriority(TaskPriority::Normal,
                            std::forward<F>(f),
                            std::forward<Args>(args)...);
    }

    template<typename F, typename... Args>
    void ExecuteWithPriority(TaskPriority priority, F&& f, Args&&... args) {
        Enqueue(priority, std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    }

private:
    struct PrioritizedTask {
        TaskPriority priority;
        uint64_t sequence;
        std::function<void()> task;

        PrioritizedTask(TaskPriority p, uint64_t seq, std::function<void()> t)
            : priority(p), sequence(seq), task(std::move(t)) {}

        /// Higher priority first, then FIFO within a priority
        bool operator<(const PrioritizedTask& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };

    Config config_;
    std::vector<std::thread> workers_;
    std::priority_queue<PrioritizedTask> tasks_;
    uint64_t nextSequence_{0};

    std::mutex queueMutex_;
    std::condition_variable condition_;

    std::atomic<bool> running_{false};

    void Start();
    void Enqueue(TaskPriority priority, std::function<void()> func);
    void WorkerLoop();
};

// ============================================================================
// Task Group
// ============================================================================

/**
 * Group multiple tasks and wait for all to complete.
 * Wait() rethrows the first exception raised by any task.
 */
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

        try {
            pool_.Execute([this, func = std::bind(std::forward<F>(f),
                                                   std::forward<Args>(args)...)]() mutable {
                try {
                    func();
                } catch (...) {
                    CaptureException(std::current_exception());
                }
                Complete();
            });
        } catch (...) {
            Complete();
            throw;
        }
    }

    /// Wait for all tasks to complete
    void Wait();

private:
    ThreadPool& pool_;
    std::mutex mutex_;
    std::condition_variable condition_;
    size_t pendingCount_{0};
    std::exception_ptr exception_;

    void CaptureException(std::exception_ptr ex);
    void Complete();
    void WaitIdle();
};

// ============================================================================
// Scheduled Tasks
// ============================================================================

/**
 * Scheduler for delayed and periodic tasks. Due tasks run on the pool.
 */
class Scheduler {
public:
    explicit Scheduler(ThreadPool& pool);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void Start();

    /// Stop the scheduler thread and drop all scheduled tasks
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /**
     * Schedule a task to run after delay.
     * @return Task ID for cancellation
     */
    template<typename F, typename... Args>
    uint64_t ScheduleAfter(std::chrono::milliseconds delay, F&& f, Args&&... args) {
        auto func = std::bind(std::forward<F>(f), std::forward<Args>(args)...);
        return ScheduleTask(std::chrono::steady_clock::now() + delay,
                            std::chrono::milliseconds(0),
                            std::move(func));
    }

    /**
     * Schedule a periodic task.
     * @param initialDelay Delay before first execution
     * @param period Time between executions
     */
    template<typename F, typename... Args>
    uint64_t SchedulePeriodic(std::chrono::milliseconds initialDelay,
                              std::chrono::milliseconds period,
                              F&& f, Args&&... args) {
        auto func = std::bind(std::forward<F>(f), std::forward<Args>(args)...);
        return ScheduleTask(std::chrono::steady_clock::now() + initialDelay,
                            period, std::move(func));
    }

    /// Cancel a scheduled task
    bool Cancel(uint64_t taskId);

    /// Get number of scheduled tasks
    size_t TaskCount() const;

private:
    struct ScheduledTask {
        uint64_t id;
        std::chrono::steady_clock::time_point nextRun;
        std::chrono::milliseconds period;
        std::function<void()> task;

        bool operator>(const ScheduledTask& other) const {
            return nextRun > other.nextRun;
        }
    };

    ThreadPool& pool_;
    std::thread schedulerThread_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>,
                        std::greater<ScheduledTask>> tasks_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> nextId_{1};

    uint64_t ScheduleTask(std::chrono::steady_clock::time_point time,
                          std::chrono::milliseconds period,
                          std::function<void()> func);

    void SchedulerLoop();
};

} // namespace util
} // namespace chainsync

#endif // CHAINSYNC_UTIL_THREADPOOL_H
