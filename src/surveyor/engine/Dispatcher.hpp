#pragma once

#include "../registry/Handler.hpp"
#include "../registry/Registry.hpp"
#include "../util/ErrorContext.hpp"
#include "../util/ThreadPool.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace surveyor {

class Session;

/**
 * @brief Routes session events to the handlers registered for their type
 *
 * DispatchEvent() only validates, de-duplicates and enqueues. Event workers
 * take jobs FIFO and initiate the job's handlers one at a time in priority
 * order: each invocation waits for a free handler slot and a rate token,
 * then goes to the callback pool. The worker moves to the next handler as
 * soon as the previous callback has started, so initiation follows priority
 * while completion order is left to the callbacks.
 *
 * Usage:
 *   Dispatcher dispatcher(registry, 4, 16);
 *   dispatcher.Start();
 *   dispatcher.DispatchEvent({entity, session, &dispatcher});
 *   ...
 *   dispatcher.Shutdown();
 */
class Dispatcher
{
public:
    // `errors` (optional) receives every failed callback
    Dispatcher(Registry& registry, std::size_t event_workers = 4, std::size_t callback_threads = 16,
               const ErrorContext* errors = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void Start();

    /**
     * @brief Submit an entity of a session for processing
     *
     * @return true when the event was queued (or had no handlers to run).
     *         false with err set for cancelled sessions and a dispatcher
     *         that is not running (Cancelled) and malformed events
     *         (InvalidEvent); false with err untouched for
     *         events dropped by the scope gate or already dispatched.
     */
    bool DispatchEvent(Event event, ErrorInfo* err = nullptr);

    // Stops accepting events, drains the queue, joins every worker
    void Shutdown();

    bool IsRunning() const { return running_.load(std::memory_order_acquire); }
    std::size_t QueueDepth() const;

    std::uint64_t Dispatched() const { return dispatched_.load(std::memory_order_relaxed); }
    std::uint64_t Dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    struct Job
    {
        Event event;
        std::vector<HandlerEntryPtr> handlers;
    };

    void eventLoop();
    void RunJob(Job& job);
    void Invoke(const HandlerEntryPtr& entry, Event event);
    static bool PassesScope(Session& session, const Asset& asset);

    Registry& registry_;
    const ErrorContext* errors_;
    std::size_t event_workers_;
    std::size_t callback_threads_;

    std::deque<Job> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    std::unique_ptr<ThreadPool> callbacks_;

    std::atomic<bool> accepting_{ true };
    std::atomic<bool> running_{ false };
    std::atomic<std::uint64_t> dispatched_{ 0 };
    std::atomic<std::uint64_t> dropped_{ 0 };
};

} // namespace surveyor
