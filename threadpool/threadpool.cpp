#include "idreg/threadpool.hpp"

#include <algorithm>

namespace idreg
{

ThreadPool::ThreadPool(size_t n_threads)
    : work_guard(net::make_work_guard(pool_ctx))
    , workers(std::max<size_t>(n_threads, 1))
{
    for (auto& t : workers)
    {
        t = std::jthread([this] { pool_ctx.run(); });
    }
}

ThreadPool::~ThreadPool()
{
    stop();
}

void ThreadPool::stop()
{
    {
        std::lock_guard<std::mutex> lock(post_mtx);
        if (bool was_running = running.exchange(false); !was_running)
        {
            return;
        }
    }
    
    work_guard.reset();
    pool_ctx.stop();
    
    for (auto& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
    
    // Nothing can be posted any more; drain what is still queued so every
    // waiting submit() sees its promise broken instead of blocking forever.
    pool_ctx.restart();
    pool_ctx.poll();
}

} // namespace idreg
