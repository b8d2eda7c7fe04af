#pragma once

#include <utility> // must precede boost/asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <thread>
#include <vector>
#include <expected>
#include <future>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <functional>
#include <type_traits>

namespace net = boost::asio;

namespace idreg
{

class ThreadPool
{
public:
    explicit ThreadPool(size_t n_threads);
    ~ThreadPool();
    
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;
    
    // Runs fn on a pool thread and blocks the caller until it finishes.
    // Must not be called from a pool thread.
    template<class Fn>
    auto submit(Fn&& fn) -> std::expected<std::invoke_result_t<Fn>, std::string>
    {
        using Ret = std::invoke_result_t<Fn>;
        
        auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Fn>(fn));
        auto fut = task->get_future();
        
        {
            std::lock_guard<std::mutex> lock(post_mtx);
            if (!running)
            {
                return std::unexpected("ThreadPool stopped");
            }
            // Skipped tasks are destroyed unrun, which breaks the promise.
            net::post(pool_exec, [this, task = std::move(task)] {
                if (running)
                {
                    std::invoke(*task);
                }
            });
        }
        
        try
        {
            if constexpr (std::is_void_v<Ret>)
            {
                fut.get();
                return {};
            }
            else
            {
                return fut.get();
            }
        }
        catch (const std::future_error&)
        {
            // stop() discarded the task before it ran.
            return std::unexpected("ThreadPool stopped");
        }
    }
    
    [[nodiscard]] net::any_io_executor get_executor() const { return pool_exec; }
    [[nodiscard]] size_t size() const { return workers.size(); }
    [[nodiscard]] bool is_running() const { return running; }
    void stop();

private:
    net::io_context pool_ctx;
    net::executor_work_guard<net::io_context::executor_type> work_guard;
    std::vector<std::jthread> workers;
    std::atomic<bool> running{true};
    std::mutex post_mtx;
    
    net::any_io_executor pool_exec{pool_ctx.get_executor()};
};

} // namespace idreg
