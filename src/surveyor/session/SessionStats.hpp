#pragma once

#include <cstdint>
#include <mutex>

#include <nlohmann/json.hpp>

namespace surveyor {

struct StatsSnapshot
{
    std::uint64_t work_items_total = 0;
    std::uint64_t work_items_completed = 0;
    std::uint64_t callback_failures = 0;

    bool Quiescent() const { return work_items_completed >= work_items_total; }
};

/**
 * @brief Work-item counters of one session
 *
 * total grows when handler invocations are scheduled, completed when each one
 * finishes or is skipped. The session is quiescent when the two are equal.
 */
class SessionStats
{
public:
    SessionStats() = default;

    SessionStats(const SessionStats&) = delete;
    SessionStats& operator=(const SessionStats&) = delete;

    void AddTotal(std::uint64_t n)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap_.work_items_total += n;
    }

    void AddCompleted(std::uint64_t n = 1)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap_.work_items_completed += n;
    }

    void AddFailure()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++snap_.callback_failures;
    }

    StatsSnapshot Snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return snap_;
    }

    nlohmann::json ToJSON() const
    {
        const StatsSnapshot s = Snapshot();
        return nlohmann::json{ { "work_items_total", s.work_items_total },
                               { "work_items_completed", s.work_items_completed },
                               { "callback_failures", s.callback_failures } };
    }

private:
    mutable std::mutex mutex_;
    StatsSnapshot snap_;
};

} // namespace surveyor
