#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mcp {

/**
 * Fixed set of worker threads draining a FIFO task queue.
 *
 * With a size of 0 no threads are started and submit() runs the task on
 * the calling thread. A non-zero max_queued caps the number of tasks
 * waiting for a worker; submit() blocks while the queue is full.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t thread_count, size_t max_queued = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Returns false once shutdown() has started, including while blocked on a full queue.
    bool submit(Task task);

    /// Runs every queued task, then joins the workers.
    void shutdown();

    size_t size() const { return thread_count_; }
    size_t queued() const;

private:
    size_t thread_count_;
    size_t max_queued_;
    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable space_cv_;
    bool running_ = true;

    void worker_thread_func();
};

} // namespace mcp
