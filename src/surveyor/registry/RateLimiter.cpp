#include "RateLimiter.hpp"
#include "../session/CancellationToken.hpp"

#include <thread>

namespace surveyor {

namespace {

std::chrono::nanoseconds IntervalFor(double rate)
{
    if (rate <= 0.0)
        return std::chrono::nanoseconds::zero();
    return std::chrono::nanoseconds(static_cast<std::chrono::nanoseconds::rep>(1e9 / rate));
}

} // namespace

RateLimiter::RateLimiter(double rate_per_second)
    : interval_(IntervalFor(rate_per_second))
{
}

bool RateLimiter::Take(const CancellationToken* token)
{
    if (token && token->IsCancelled())
        return false;
    if (interval_.count() == 0)
        return true;

    SteadyClock::time_point due;
    {
        // Reserve a slot; waiters queue up one interval apart
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = SteadyClock::now();
        due = next_ > now ? next_ : now;
        next_ = due + interval_;
    }

    if (token)
        return !token->WaitUntil(due);

    std::this_thread::sleep_until(due);
    return true;
}

} // namespace surveyor
