#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <thread>
#include <vector>
#include <atomic>
#include <memory>
#include <future>
#include <string>
#include <cstdint>
#include <stdexcept>

namespace clinscribe {
namespace core {

/**
 * Priority levels for tasks in the queue
 */
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3
};

/**
 * Base task interface
 */
class Task {
public:
    explicit Task(TaskPriority priority = TaskPriority::NORMAL, std::string name = "")
        : priority_(priority), name_(std::move(name)), sequence_(0) {}

    virtual ~Task() = default;
    virtual void execute() = 0;

    TaskPriority getPriority() const { return priority_; }
    const std::string& getName() const { return name_; }

    // Assigned by TaskQueue on enqueue; orders tasks of equal priority
    uint64_t getSequence() const { return sequence_; }
    void setSequence(uint64_t sequence) { sequence_ = sequence; }

private:
    TaskPriority priority_;
    std::string name_;
    uint64_t sequence_;
};

/**
 * Function-based task implementation
 */
class FunctionTask : public Task {
public:
    FunctionTask(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL,
                 std::string name = "")
        : Task(priority, std::move(name)), func_(std::move(func)) {}

    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Higher priority first, FIFO within a priority
 */
struct TaskComparator {
    bool operator()(const std::shared_ptr<Task>& a, const std::shared_ptr<Task>& b) const {
        if (a->getPriority() != b->getPriority()) {
            return static_cast<int>(a->getPriority()) < static_cast<int>(b->getPriority());
        }
        return a->getSequence() > b->getSequence();
    }
};

/**
 * Thread-safe task queue with priority support
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    /**
     * Add a task to the queue. Returns false if the queue is shutting down.
     */
    bool enqueue(std::shared_ptr<Task> task);

    bool enqueue(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL);

    /**
     * Add a task whose result (or exception) is delivered through a future.
     * If the queue is shutting down the future holds a std::runtime_error.
     */
    template<typename F, typename... Args>
    auto enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    /**
     * Get the next task from the queue (blocks if empty).
     * Returns nullptr if queue is shutting down.
     */
    std::shared_ptr<Task> dequeue();

    /**
     * Get the next task without blocking; nullptr if empty
     */
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;
    void clear();

    /**
     * Stop accepting tasks and wake every waiting thread. Tasks already
     * queued are still handed out until the queue drains.
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator> queue_;
    std::atomic<bool> shutdown_;
    uint64_t next_sequence_;
};

/**
 * Thread pool for executing tasks from TaskQueue
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Shut the queue down and join every worker
     */
    void stop();

    size_t getNumThreads() const { return num_threads_; }
    size_t getActiveThreads() const;
    size_t getFailedTaskCount() const { return failed_tasks_; }
    bool isRunning() const { return running_; }

private:
    void workerLoop();

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_threads_;
    std::atomic<size_t> failed_tasks_;
};

template<typename F, typename... Args>
auto TaskQueue::enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {

    using return_type = typename std::result_of<F(Args...)>::type;

    auto task_ptr = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task_ptr->get_future();

    auto wrapper_task = std::make_shared<FunctionTask>(
        [task_ptr]() { (*task_ptr)(); },
        priority
    );

    if (!enqueue(wrapper_task)) {
        std::promise<return_type> rejected;
        rejected.set_exception(std::make_exception_ptr(
            std::runtime_error("Task queue is shutting down")));
        return rejected.get_future();
    }

    return result;
}

} // namespace core
} // namespace clinscribe
