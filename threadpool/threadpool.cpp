#include "threadpool/threadpool.hpp"

ThreadPool::ThreadPool(size_t n_threads, size_t max_queued)
    : work_guard(net::make_work_guard(pool_ctx))
    , workers(n_threads == 0 ? 1 : n_threads)
    , max_queued(max_queued)
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
    if (bool was_running = running.exchange(false); !was_running)
    {
        return;
    }
    
    // Every admitted job is posted and run before the workers are released,
    // including one admitted just ahead of the flag flip.
    for (size_t n = pending.load(); n != 0; n = pending.load())
    {
        pending.wait(n);
    }
    
    // Callers past their deadline no longer wait on their jobs.
    work_guard.reset();
    
    for (auto& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}
