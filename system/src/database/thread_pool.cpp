// ============= src/database/thread_pool.cpp =============
#include "database/thread_pool.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;
    spdlog::info("🔧 Background pool: {} threads", num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::worker_thread, this);
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::worker_thread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);

            condition.wait(lock, [this] {
                return stop_flag || !tasks.empty();
            });

            if (stop_flag && tasks.empty()) {
                return;
            }

            task = tasks.top();
            tasks.pop();
            active_count++;
        }

        try {
            task.func();
        } catch (const std::exception& e) {
            failed_count++;
            spdlog::warn("Task '{}' failed: {}", task.name, e.what());
        }

        active_count--;
    }
}

bool ThreadPool::post(const std::string& name, std::function<void()> task, Priority priority) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            spdlog::warn("Task '{}' dropped: pool stopped", name);
            return false;
        }
        tasks.push({name, std::move(task), static_cast<int>(priority), next_seq++});
    }
    condition.notify_one();
    return true;
}

size_t ThreadPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return tasks.size();
}

void ThreadPool::wait_all() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (tasks.empty() && active_count == 0) return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void ThreadPool::stop() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag && workers.empty()) return;
        stop_flag = true;
    }

    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers.clear();
}
