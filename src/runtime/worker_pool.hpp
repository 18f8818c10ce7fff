#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace wfproc::runtime {

// Fixed set of threads draining a FIFO task queue. The destructor finishes
// every queued task before joining. Tasks must not throw; callers wrap their
// work and report failures through their own state.
class WorkerPool {
public:
    using Task = std::function<void()>;
    using Spawner = std::function<std::thread(std::function<void()>)>;

    // If a thread cannot be started, the threads already running are stopped
    // and joined and the spawn error is rethrown.
    explicit WorkerPool(std::size_t concurrency, const Spawner& spawner = spawn_thread);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Task task);

    std::size_t size() const { return threads_.size(); }

    static std::thread spawn_thread(std::function<void()> body);

private:
    void run();
    void shutdown();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Task> queue_;
    bool stop_ = false;
    std::vector<std::thread> threads_;
};

}  // namespace wfproc::runtime
