/**
 * @file log_task_pool.hpp
 * @brief Worker pool running asynchronous sink deliveries
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Tasks are fire-and-forget: submit() enqueues and returns, there is no
 * future to wait on and no ordering between tasks. Workers block on a
 * moodycamel queue with a timeout so they notice shutdown even when idle.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <exception>
#include <functional>
#include <thread>
#include <vector>

#include <moodycamel/blockingconcurrentqueue.h>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"

namespace tierlog
{

class task_pool
{
  public:
    using task = std::function<void()>;

    explicit task_pool(size_t workers = DEFAULT_ASYNC_WORKERS)
    {
        if (workers == 0) workers = 1;
        workers_.reserve(workers);
        for (size_t i = 0; i < workers; ++i) { workers_.emplace_back(&task_pool::worker_thread_func, this); }
    }

    task_pool(const task_pool &)            = delete;
    task_pool &operator=(const task_pool &) = delete;

    ~task_pool() { shutdown(); }

    /**
     * @brief Queue a task for a worker
     * @return false if the pool is shut down or the queue refused the task
     */
    bool submit(task t)
    {
        if (!t || stopping_.load(std::memory_order_acquire)) return false;

        pending_.fetch_add(1, std::memory_order_relaxed);
        if (!queue_.enqueue(std::move(t)))
        {
            pending_.fetch_sub(1, std::memory_order_relaxed);
            return false;
        }
        return true;
    }

    /**
     * @brief Stop the workers; tasks still queued are discarded
     *
     * Tasks already running are allowed to finish. Safe to call more than
     * once and from the destructor.
     */
    void shutdown()
    {
        bool expected = false;
        if (!stopping_.compare_exchange_strong(expected, true)) return;

        for (auto &worker : workers_)
        {
            if (worker.joinable()) worker.join();
        }

        task t;
        while (queue_.try_dequeue(t))
        {
            discarded_.fetch_add(1, std::memory_order_relaxed);
            pending_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    /**
     * @brief Wait until every submitted task has run
     * @return false on timeout
     */
    template <typename Rep, typename Period> bool wait_idle(std::chrono::duration<Rep, Period> timeout) const
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (pending_.load(std::memory_order_acquire) > 0)
        {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    size_t workers() const noexcept { return workers_.size(); }
    size_t pending() const noexcept { return pending_.load(std::memory_order_relaxed); }
    size_t discarded() const noexcept { return discarded_.load(std::memory_order_relaxed); }
    bool is_shutdown() const noexcept { return stopping_.load(std::memory_order_relaxed); }

  private:
    void worker_thread_func()
    {
        moodycamel::ConsumerToken token(queue_);
        task t;

        while (!stopping_.load(std::memory_order_acquire))
        {
            if (!queue_.wait_dequeue_timed(token, t, TASK_POOL_POLL_INTERVAL)) continue;

            try
            {
                t();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "tierlog: async task failed: {}\n", e.what());
            }
            catch (...)
            {
                fmt::print(stderr, "tierlog: async task failed: unknown exception\n");
            }
            t = nullptr;
            pending_.fetch_sub(1, std::memory_order_release);
        }
    }

    moodycamel::BlockingConcurrentQueue<task> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopping_{false};
    std::atomic<size_t> pending_{0};
    std::atomic<size_t> discarded_{0};
};

} // namespace tierlog
