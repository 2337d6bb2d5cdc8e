/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used by the reference backend.
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

class ThreadPool {
  public:
    /// Zero selects std::thread::hardware_concurrency()
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    /// Enqueue a task. Exceptions it throws are rethrown by the future.
    auto enqueue(std::function<void()> task) -> std::future<void>;

    auto size() const -> size_t {
        return workers.size();
    }

  private:
    std::vector<std::thread> workers;
    std::queue<std::packaged_task<void()>> tasks;

    std::mutex queue_mutex;
    std::condition_variable condition;
    std::atomic<bool> stop;
};
