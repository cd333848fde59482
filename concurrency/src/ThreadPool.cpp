/**
 * @file ThreadPool.cpp
 * @brief Worker lifecycle of the batch thread pool.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <phyto/concurrency/ThreadPool.hpp>

#include <algorithm>

namespace phyto::concurrency {

ThreadPool::ThreadPool(core::u32 threadCount)
{
    if (threadCount == 0)
    {
        // hardware_concurrency() may report 0
        threadCount = std::max(1u, static_cast<core::u32>(std::thread::hardware_concurrency()));
    }

    _workers.reserve(threadCount);
    for (core::u32 i = 0; i < threadCount; ++i)
    {
        _workers.emplace_back([this] { workerLoop(); });
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_stopping.exchange(true))
        {
            return;
        }
    }
    _cv.notify_all();

    for (auto& worker : _workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

core::u32 ThreadPool::threadCount() const noexcept
{
    return static_cast<core::u32>(_workers.size());
}

void ThreadPool::workerLoop()
{
    std::unique_lock<std::mutex> lock{_mutex};
    for (;;)
    {
        _cv.wait(lock, [this] { return _stopping.load() || !_tasks.empty(); });

        // stopping with an empty queue: every submitted task has run
        if (_tasks.empty())
        {
            return;
        }

        auto task = std::move(_tasks.front());
        _tasks.pop_front();

        lock.unlock();
        task();
        lock.lock();
    }
}

} // namespace phyto::concurrency
