#pragma once

#include "../session/CancellationToken.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace surveyor {

/**
 * @brief Bounds concurrent invocations of one handler
 *
 * Acquire() blocks while every slot is taken. Waiters re-check the session's
 * cancellation token every few milliseconds, so a cancelled session never
 * stays parked on a busy handler.
 */
class HandlerSlots
{
public:
    explicit HandlerSlots(int max)
        : max_(max > 0 ? max : 1)
    {
    }

    HandlerSlots(const HandlerSlots&) = delete;
    HandlerSlots& operator=(const HandlerSlots&) = delete;

    // false if cancelled before a slot was free
    bool Acquire(const CancellationToken* token = nullptr)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (in_use_ >= max_)
        {
            if (token && token->IsCancelled())
                return false;
            cv_.wait_for(lock, std::chrono::milliseconds(10));
        }
        if (token && token->IsCancelled())
            return false;
        ++in_use_;
        return true;
    }

    void Release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_use_ > 0)
                --in_use_;
        }
        cv_.notify_one();
    }

    int InUse() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_;
    }

    int Max() const { return max_; }

private:
    const int max_;
    int in_use_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace surveyor
