/**
 * @file threadpool.cpp
 * @brief Worker pool internals
 */

#include "cbt/threadpool.hpp"
#include "cbt/errors.hpp"
#include "cbt/log.hpp"

namespace cbt {

ThreadPool::ThreadPool(Size numThreads) {
    Size count = numThreads;
    if (count == 0) {
        count = static_cast<Size>(std::thread::hardware_concurrency());
    }
    if (count == 0) {
        count = 1;
    }

    workers_.reserve(count);
    for (Size i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
    CBT_LOG_DEBUG("thread pool started with " << count << " workers");
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();

    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::post(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw BacktestError("thread pool is shutting down");
        }
        queue_.push_back(std::move(job));
    }
    wake_.notify_one();
}

void ThreadPool::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;  // stopping and drained
        }

        std::function<void()> job = std::move(queue_.front());
        queue_.pop_front();
        ++running_;

        lock.unlock();
        job();  // packaged_task stores any exception in the future
        lock.lock();

        --running_;
        if (queue_.empty() && running_ == 0) {
            idle_.notify_all();
        }
    }
}

void ThreadPool::waitAll() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

Size ThreadPool::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

Size ThreadPool::activeJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

} // namespace cbt
