// ============= include/database/thread_pool.hpp =============
/*
 * Background Task Pool
 *
 * Runs persistence work spawned by sessions (history append, compaction,
 * person / memory / zone writes) off the session loop.
 *
 * - post(): fire-and-forget, never awaited by the caller
 * - exceptions are logged with the task name and dropped
 * - priorities: high (identity writes) > normal (history, memories) > low (compaction)
 * - stop() drains the queue before joining, so closing a session never
 *   cancels work it already scheduled
 */

#pragma once
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

class ThreadPool {
public:
    enum class Priority { Low = -10, Normal = 0, High = 10 };

    explicit ThreadPool(size_t num_threads = 2);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit task (returns future)
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))>;

    // Fire-and-forget; returns false (and logs) if the pool is stopped
    bool post(const std::string& name, std::function<void()> task,
              Priority priority = Priority::Normal);

    // Stats
    size_t pending_tasks() const;
    size_t active_threads() const { return workers.size(); }
    size_t failed_tasks() const { return failed_count.load(); }

    // Control
    void wait_all();
    void stop();

private:
    struct Task {
        std::string name;
        std::function<void()> func;
        int priority = 0;  // Higher = more urgent
        uint64_t seq = 0;  // FIFO within one priority

        bool operator<(const Task& other) const {
            if (priority != other.priority) return priority < other.priority;
            return seq > other.seq;
        }
    };

    std::vector<std::thread> workers;
    std::priority_queue<Task> tasks;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::atomic<bool> stop_flag{false};
    std::atomic<size_t> active_count{0};
    std::atomic<size_t> failed_count{0};
    uint64_t next_seq = 0;

    void worker_thread();
};

// ==================== IMPLEMENTATION ====================

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
    using return_type = decltype(f(args...));

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            throw std::runtime_error("ThreadPool is stopped");
        }

        tasks.push({"submit", [task]() { (*task)(); }, 0, next_seq++});
    }

    condition.notify_one();
    return result;
}
