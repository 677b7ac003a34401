#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace surveyor {

/**
 * @brief Fixed set of worker threads draining a FIFO task queue
 *
 * Shutdown() stops accepting work, runs what is already queued and joins.
 */
class ThreadPool
{
public:
    using Task = std::function<void()>;

    ThreadPool(std::string name, std::size_t threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // false once the pool is shutting down
    bool Submit(Task task);

    void Shutdown();

    std::size_t Pending() const;
    std::size_t Threads() const { return workers_.size(); }
    bool IsRunning() const { return running_.load(std::memory_order_acquire); }

private:
    void workerLoop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{ true };
};

} // namespace surveyor
