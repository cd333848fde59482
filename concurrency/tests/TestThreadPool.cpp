/**
 * @file TestThreadPool.cpp
 * @brief Unit tests for concurrency::ThreadPool.
 */

#include <catch2/catch_test_macros.hpp>

#include "phyto/concurrency/ThreadPool.hpp"

#include <atomic>
#include <future>
#include <thread>
#include <vector>

namespace phyto::concurrency {

TEST_CASE("ThreadPool runs tasks and returns their results", "[concurrency][pool]")
{
    ThreadPool pool(4);
    REQUIRE(pool.threadCount() == 4);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 32; ++i)
        results.push_back(pool.enqueue([](int x) { return x * x; }, i));

    for (int i = 0; i < 32; ++i)
        REQUIRE(results[static_cast<std::size_t>(i)].get() == i * i);
}

TEST_CASE("ThreadPool::shutdown drains queued tasks", "[concurrency][pool]")
{
    std::atomic<int> done{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 100; ++i) {
            auto f = pool.enqueue([&done] { done.fetch_add(1); });
            (void)f;
        }
        pool.shutdown();
    }
    REQUIRE(done.load() == 100);
}

TEST_CASE("ThreadPool::map keeps results in input order", "[concurrency][pool]")
{
    ThreadPool pool(3);
    const std::vector<int> inputs{5, 1, 4, 1, 5, 9, 2, 6};

    auto doubled = pool.map(inputs.size(), [&inputs](std::size_t i) { return inputs[i] * 2; });
    REQUIRE(doubled == std::vector<int>{10, 2, 8, 2, 10, 18, 4, 12});

    REQUIRE(pool.map(0, [](std::size_t) { return 0; }).empty());
}

TEST_CASE("ThreadPool runs late tasks on the caller after shutdown", "[concurrency][pool]")
{
    ThreadPool pool(2);
    pool.shutdown();

    const auto caller = std::this_thread::get_id();
    auto f = pool.enqueue([] { return std::this_thread::get_id(); });
    REQUIRE(f.get() == caller);
}

TEST_CASE("ThreadPool defaults to the hardware concurrency", "[concurrency][pool]")
{
    ThreadPool pool;
    REQUIRE(pool.threadCount() >= 1);
}

} // namespace phyto::concurrency
