#include "worker_pool.hpp"

#include "logger.hpp"

#include <exception>

#include <log4cplus/loggingmacros.h>

namespace mcp {

WorkerPool::WorkerPool(size_t thread_count, size_t max_queued)
    : thread_count_(thread_count), max_queued_(max_queued) {
    for (size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back(&WorkerPool::worker_thread_func, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    if (thread_count_ == 0) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return false;
            }
        }
        task();
        return true;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (max_queued_ > 0 && running_ && tasks_.size() >= max_queued_) {
            LOG4CPLUS_DEBUG(core_logger(), "Task queue full (" << tasks_.size() << "), waiting for a worker");
            space_cv_.wait(lock, [this] { return tasks_.size() < max_queued_ || !running_; });
        }
        if (!running_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && workers_.empty()) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    space_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
}

void WorkerPool::worker_thread_func() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !tasks_.empty() || !running_; });

            if (!running_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }
        space_cv_.notify_one();

        try {
            task();
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(core_logger(), "Worker task error: " << e.what());
        }
    }
}

} // namespace mcp
