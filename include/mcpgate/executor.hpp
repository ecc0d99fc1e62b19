#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mcpgate {

/// Fixed-size worker pool with an unbounded FIFO queue. The worker count is
/// the upper bound on concurrently running handlers.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue a task. Returns false once shutdown() has begun.
    bool post(std::function<void()> task);

    /// Run every queued task, then join the workers. Idempotent; must not be
    /// called from a task.
    void shutdown();

    [[nodiscard]] size_t size() const { return threads_.size(); }
    [[nodiscard]] size_t pending() const;

private:
    void run();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
};

} // namespace mcpgate
