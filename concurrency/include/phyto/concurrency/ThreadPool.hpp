/**
 * @file ThreadPool.hpp
 * @brief Fixed-size worker pool used to spread a batch of datapoints.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PHYTO_CONCURRENCY_THREADPOOL_HPP
    #define PHYTO_CONCURRENCY_THREADPOOL_HPP

#include <phyto/core/Types.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace phyto::concurrency {

/**
 * @class ThreadPool
 * @brief Workers pulling tasks from one FIFO queue.
 *
 * Tasks submitted after shutdown() run on the calling thread, so a future
 * returned by enqueue() always becomes ready.
 */
class ThreadPool final
{
public:
    /**
     * @param threadCount Number of workers; zero means one per hardware thread.
     */
    explicit ThreadPool(core::u32 threadCount = 0);

    /** @brief Runs what is still queued, then joins the workers. */
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    template <typename F, typename... Args>
    [[nodiscard]] auto enqueue(F&& func, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /**
     * @brief Calls @p func(i) for every i in [0, count) across the workers.
     *
     * Blocks until all calls finished.
     *
     * @return The results, indexed like the inputs.
     */
    template <typename F>
    [[nodiscard]] auto map(core::usize count, F&& func)
        -> std::vector<std::invoke_result_t<F&, core::usize>>;

    void shutdown();

    [[nodiscard]] core::u32 threadCount() const noexcept;

private:
    void workerLoop();

    std::vector<std::thread>            _workers;
    std::deque<std::function<void()>>   _tasks;
    std::mutex                          _mutex;
    std::condition_variable             _cv;
    std::atomic<bool>                   _stopping{false};
};

// /////////////////////////////////////////////////////////////////////////////
//  Template implementations                                                  //
// /////////////////////////////////////////////////////////////////////////////

template <typename F, typename... Args>
auto ThreadPool::enqueue(F&& func, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using ReturnType = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(func), std::forward<Args>(args)...)
    );
    std::future<ReturnType> future = task->get_future();

    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (!_stopping.load(std::memory_order_relaxed))
        {
            _tasks.emplace_back([task]() { (*task)(); });
            _cv.notify_one();
            return future;
        }
    }

    (*task)();
    return future;
}

template <typename F>
auto ThreadPool::map(core::usize count, F&& func)
    -> std::vector<std::invoke_result_t<F&, core::usize>>
{
    using Result = std::invoke_result_t<F&, core::usize>;

    std::vector<std::future<Result>> pending;
    pending.reserve(count);
    for (core::usize i = 0; i < count; ++i)
    {
        pending.push_back(enqueue([&func, i]() { return func(i); }));
    }

    std::vector<Result> results;
    results.reserve(count);
    for (auto& future : pending)
    {
        results.push_back(future.get());
    }
    return results;
}

} // namespace phyto::concurrency

#endif // PHYTO_CONCURRENCY_THREADPOOL_HPP
