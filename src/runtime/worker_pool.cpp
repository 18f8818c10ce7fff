#include "runtime/worker_pool.hpp"

#include <utility>

namespace wfproc::runtime {

std::thread WorkerPool::spawn_thread(std::function<void()> body) {
    return std::thread(std::move(body));
}

WorkerPool::WorkerPool(const std::size_t concurrency, const Spawner& spawner) {
    const std::size_t count = concurrency == 0 ? 1 : concurrency;
    threads_.reserve(count);
    try {
        for (std::size_t i = 0; i < count; ++i) {
            threads_.push_back(spawner([this]() { run(); }));
        }
    } catch (...) {
        shutdown();
        throw;
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(task));
    }
    cv_.notify_one();
}

void WorkerPool::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (stop_ && queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop();
        }
        task();
    }
}

}  // namespace wfproc::runtime
