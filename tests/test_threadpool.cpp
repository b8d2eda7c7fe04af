#include <catch2/catch_test_macros.hpp>

#include "idreg/threadpool.hpp"

#include <chrono>
#include <future>
#include <thread>

using idreg::ThreadPool;

TEST_CASE("ThreadPool::submit runs the task on a pool thread")
{
    ThreadPool pool(1);

    auto caller = std::this_thread::get_id();
    auto res = pool.submit([] { return std::this_thread::get_id(); });

    REQUIRE(res.has_value());
    CHECK(*res != caller);
}

TEST_CASE("ThreadPool::submit returns the task result")
{
    ThreadPool pool(2);

    auto res = pool.submit([] { return 6 * 7; });

    REQUIRE(res.has_value());
    CHECK(*res == 42);
}

TEST_CASE("ThreadPool::submit reports a stopped pool")
{
    ThreadPool pool(1);
    pool.stop();

    auto res = pool.submit([] { return 1; });

    CHECK(!pool.is_running());
    REQUIRE(!res.has_value());
    CHECK(res.error() == "ThreadPool stopped");
}

TEST_CASE("ThreadPool::stop releases a caller whose task is still queued")
{
    using namespace std::chrono_literals;
    ThreadPool pool(1);

    auto busy = std::async(std::launch::async, [&] {
        return pool.submit([] { std::this_thread::sleep_for(300ms); return 1; });
    });
    std::this_thread::sleep_for(50ms);
    auto queued = std::async(std::launch::async, [&] {
        return pool.submit([] { return 2; });
    });
    std::this_thread::sleep_for(50ms);

    pool.stop();

    REQUIRE(queued.wait_for(2s) == std::future_status::ready);
    auto res = queued.get();
    REQUIRE(!res.has_value());
    CHECK(res.error() == "ThreadPool stopped");
    CHECK(busy.get().value_or(0) == 1);
}

TEST_CASE("ThreadPool never starts with zero workers")
{
    ThreadPool pool(0);

    CHECK(pool.size() == 1);
    CHECK(pool.submit([] { return true; }).value_or(false));
}
