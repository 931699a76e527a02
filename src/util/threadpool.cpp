// CHAINSYNC - Thread Pool Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/util/threadpool.h>
#include <chainsync/util/logging.h>

namespace chainsync {
namespace util {

// ============================================================================
// ThreadPool Implementation
// ============================================================================

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    Start();
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
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
        std::priority_queue<PrioritizedTask> empty;
        std::swap(tasks_, empty);
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void ThreadPool::Enqueue(TaskPriority priority, std::function<void()> func) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);

        if (!running_.load()) {
            throw std::runtime_error("ThreadPool not running");
        }

        if (tasks_.size() >= config_.maxQueueSize) {
            throw std::runtime_error("ThreadPool queue full");
        }

        tasks_.emplace(priority, nextSequence_++, std::move(func));
    }

    condition_.notify_one();
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
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << config_.name << ": task failed: " << e.what();
        }
    }
}

// ============================================================================
// TaskGroup Implementation
// ============================================================================

TaskGroup::TaskGroup(ThreadPool& pool) : pool_(pool) {}

TaskGroup::~TaskGroup() {
    WaitIdle();
}

void TaskGroup::CaptureException(std::exception_ptr ex) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exception_) {
        exception_ = ex;
    }
}

void TaskGroup::Complete() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --pendingCount_;
    }
    condition_.notify_all();
}

void TaskGroup::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] {
        return pendingCount_ == 0;
    });
}

void TaskGroup::Wait() {
    WaitIdle();

    std::exception_ptr ex;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(ex, exception_);
    }
    if (ex) {
        std::rethrow_exception(ex);
    }
}

// ============================================================================
// Scheduler Implementation
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

    std::lock_guard<std::mutex> lock(mutex_);
    while (!tasks_.empty()) {
        tasks_.pop();
    }
}

bool Scheduler::Cancel(uint64_t taskId) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Rebuild queue without the cancelled task
    std::vector<ScheduledTask> remaining;
    bool found = false;

    while (!tasks_.empty()) {
        auto task = std::move(const_cast<ScheduledTask&>(tasks_.top()));
        tasks_.pop();

        if (task.id == taskId) {
            found = true;
        } else {
            remaining.push_back(std::move(task));
        }
    }

    for (auto& task : remaining) {
        tasks_.push(std::move(task));
    }

    return found;
}

size_t Scheduler::TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

uint64_t Scheduler::ScheduleTask(std::chrono::steady_clock::time_point time,
                                 std::chrono::milliseconds period,
                                 std::function<void()> func) {
    uint64_t id = nextId_.fetch_add(1);

    ScheduledTask task;
    task.id = id;
    task.nextRun = time;
    task.period = period;
    task.task = std::move(func);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
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
        auto nextRun = tasks_.top().nextRun;

        if (nextRun > now) {
            condition_.wait_until(lock, nextRun);
            continue;
        }

        ScheduledTask task = std::move(const_cast<ScheduledTask&>(tasks_.top()));
        tasks_.pop();

        try {
            pool_.Execute(task.task);
        } catch (const std::runtime_error& e) {
            LOG_WARN(LogCategory::DEFAULT) << "Scheduler dropped task " << task.id
                                           << ": " << e.what();
        }

        if (task.period.count() > 0) {
            task.nextRun = std::chrono::steady_clock::now() + task.period;
            tasks_.push(std::move(task));
        }
    }
}

} // namespace util
} // namespace chainsync
