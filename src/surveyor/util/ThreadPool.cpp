#include "ThreadPool.hpp"

#include <plog/Log.h>

#include <exception>

namespace surveyor {

ThreadPool::ThreadPool(std::string name, std::size_t threads)
    : name_(std::move(name))
{
    if (threads == 0)
        threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i)
        workers_.emplace_back([this]() { workerLoop(); });
}

ThreadPool::~ThreadPool() { Shutdown(); }

bool ThreadPool::Submit(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire))
            return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void ThreadPool::Shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel) && workers_.empty())
            return;
    }
    cv_.notify_all();

    for (auto& t : workers_)
    {
        if (t.joinable())
            t.join();
    }
    workers_.clear();
}

std::size_t ThreadPool::Pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ThreadPool::workerLoop()
{
    for (;;)
    {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !queue_.empty() || !running_.load(std::memory_order_acquire); });
            if (queue_.empty())
                return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            PLOG_ERROR << "[" << name_ << "] task threw: " << e.what();
        }
    }
}

} // namespace surveyor
