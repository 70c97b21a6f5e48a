/**
 * @file threadpool.hpp
 * @brief Fixed-size worker pool for independent backtest runs
 *
 * Runs share nothing mutable, so the pool only spreads them over workers.
 * Tasks are started in FIFO order; a task's result or exception travels back
 * through its future.
 */

#pragma once

#include "cbt/common.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace cbt {

class ThreadPool {
public:
    /**
     * @param numThreads worker count, hardware concurrency when 0
     */
    explicit ThreadPool(Size numThreads = 0);

    /**
     * @brief Drains the queue, then joins the workers
     */
    ~ThreadPool();

    CBT_DISABLE_COPY(ThreadPool)

    /**
     * @brief Queue a nullary task
     * @throws BacktestError once the pool is shutting down
     */
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> future = task->get_future();
        post([task] { (*task)(); });
        return future;
    }

    /**
     * @brief f(item) for every item, results in input order
     *
     * Every task runs to completion before the first exception (in input
     * order) is rethrown, so nothing still references f or items on return.
     */
    template<typename F, typename Container>
    auto map(const F& f, const Container& items)
        -> std::vector<std::invoke_result_t<const F&, const typename Container::value_type&>> {
        using Result = std::invoke_result_t<const F&, const typename Container::value_type&>;

        std::vector<std::future<Result>> futures;
        futures.reserve(items.size());
        for (const auto& item : items) {
            futures.push_back(submit([&f, &item] { return f(item); }));
        }

        for (auto& future : futures) {
            future.wait();
        }

        std::vector<Result> results;
        results.reserve(futures.size());
        for (auto& future : futures) {
            results.push_back(future.get());
        }
        return results;
    }

    /**
     * @brief Block until the queue is empty and no task is running
     */
    void waitAll();

    Size size() const { return workers_.size(); }

    Size pendingTasks() const;

    Size activeJobs() const;

private:
    void post(std::function<void()> job);
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    Size running_ = 0;
    bool stopping_ = false;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
};

} // namespace cbt
