#include "thread_pool.hpp"

#include <algorithm>

ThreadPool::ThreadPool(size_t num_threads) : stop(false) {
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back([this] {
            while (true) {
                std::packaged_task<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this] { return stop || !tasks.empty(); });
                    if (stop && tasks.empty()) return;
                    task = std::move(tasks.front());
                    tasks.pop();
                }
                task();
            }
        });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        stop = true;
    }
    condition.notify_all();
    for (auto &worker : workers) {
        worker.join();
    }
}

auto ThreadPool::enqueue(std::function<void()> task) -> std::future<void> {
    std::packaged_task<void()> packaged(std::move(task));
    auto result = packaged.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        tasks.push(std::move(packaged));
    }
    condition.notify_one();
    return result;
}
