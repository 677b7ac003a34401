#pragma once

#include <chrono>
#include <mutex>

namespace surveyor {

class CancellationToken;

/**
 * @brief Evenly spaced token source without burst slack
 *
 * Consecutive Take() calls are released at least 1/rate apart. A rate of zero
 * or less disables limiting. Shared by every handler of a source.
 */
class RateLimiter
{
public:
    explicit RateLimiter(double rate_per_second);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Block until the next token is due
     * @return false if the token was cancelled while waiting
     */
    bool Take(const CancellationToken* token = nullptr);

    std::chrono::nanoseconds Interval() const { return interval_; }

private:
    using SteadyClock = std::chrono::steady_clock;

    const std::chrono::nanoseconds interval_;
    std::mutex mutex_;
    SteadyClock::time_point next_{};
};

} // namespace surveyor
