#pragma once

#include "auth/errc.hpp"
#include "logger.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <expected>
#include <future>
#include <memory>
#include <thread>
#include <vector>

namespace net = boost::asio;

/**
 * Fixed set of workers for CPU/memory-bound jobs (password hashing).
 * At most size() jobs run at once and at most max_queued more wait; anything
 * beyond is refused with hash_capacity instead of piling up.
 */
class ThreadPool
{
public:
    ThreadPool(size_t n_threads, size_t max_queued);
    ~ThreadPool();
    
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;
    
    // Waits up to `timeout` for the result. On timeout the job keeps running
    // detached, so `fn` must own everything it touches.
    template<class Fn>
    auto run(Fn&& fn, std::chrono::milliseconds timeout) -> std::expected<std::invoke_result_t<Fn>, auth::errc>
    {
        using Ret = std::invoke_result_t<Fn>;
        
        if (!running)
        {
            return std::unexpected(auth::errc::hash_capacity);
        }
        
        size_t cur = pending.load();
        do
        {
            if (cur >= capacity())
            {
                return std::unexpected(auth::errc::hash_capacity);
            }
        } while (!pending.compare_exchange_weak(cur, cur + 1));
        
        // stop() may have begun between the first check and the increment
        if (!running)
        {
            release_slot();
            return std::unexpected(auth::errc::hash_capacity);
        }
        
        auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Fn>(fn));
        auto fut = task->get_future();
        
        net::post(pool_exec, [this, task] {
            std::invoke(*task);
            release_slot();
        });
        
        if (fut.wait_for(timeout) != std::future_status::ready)
        {
            return std::unexpected(auth::errc::hash_timeout);
        }
        
        try
        {
            return fut.get();
        }
        catch (const std::future_error&)
        {
            // pool stopped before the job ran
            return std::unexpected(auth::errc::hash_capacity);
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("Pool job failed: {}", e.what());
            return std::unexpected(auth::errc::hash_capacity);
        }
    }
    
    net::any_io_executor get_executor() const { return pool_exec; }
    size_t size() const { return workers.size(); }
    size_t capacity() const { return workers.size() + max_queued; }
    size_t in_flight() const { return pending.load(); }
    void stop();

private:
    void release_slot()
    {
        pending.fetch_sub(1);
        pending.notify_all();
    }
    
    net::io_context pool_ctx;
    net::executor_work_guard<net::io_context::executor_type> work_guard;
    std::vector<std::jthread> workers;
    size_t max_queued;
    std::atomic<size_t> pending{0};
    std::atomic<bool> running{true};
    
    net::any_io_executor pool_exec{pool_ctx.get_executor()};
};
