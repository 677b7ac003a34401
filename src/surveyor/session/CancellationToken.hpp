#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace surveyor {

/**
 * @brief One-shot broadcast flag observed by every blocking wait of a session
 *
 * Cancel() is idempotent and wakes all WaitFor() callers. Once set the flag
 * never clears.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Returns true for the call that actually flipped the flag
    bool Cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.load(std::memory_order_relaxed))
                return false;
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
        return true;
    }

    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /**
     * @brief Sleep for up to `timeout`, waking early on cancellation
     * @return true if cancelled
     */
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(std::memory_order_acquire); });
    }

    bool WaitUntil(std::chrono::steady_clock::time_point deadline) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [this] { return cancelled_.load(std::memory_order_acquire); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{ false };
};

} // namespace surveyor
