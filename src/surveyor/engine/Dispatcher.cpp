#include "Dispatcher.hpp"
#include "../registry/RateLimiter.hpp"
#include "../session/Session.hpp"

#include <plog/Log.h>

#include <exception>
#include <future>

namespace surveyor {

Dispatcher::Dispatcher(Registry& registry, std::size_t event_workers, std::size_t callback_threads,
                       const ErrorContext* errors)
    : registry_(registry)
    , errors_(errors)
    , event_workers_(event_workers > 0 ? event_workers : 1)
    , callback_threads_(callback_threads > 0 ? callback_threads : 1)
{
}

Dispatcher::~Dispatcher() { Shutdown(); }

void Dispatcher::Start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire) || !accepting_.load(std::memory_order_acquire))
        return;

    callbacks_ = std::make_unique<ThreadPool>("CallbackPool", callback_threads_);
    running_.store(true, std::memory_order_release);
    workers_.reserve(event_workers_);
    for (std::size_t i = 0; i < event_workers_; ++i)
        workers_.emplace_back([this]() { eventLoop(); });

    PLOG_INFO << "[Dispatcher] started with " << event_workers_ << " event workers and " << callback_threads_
              << " callback threads";
}

bool Dispatcher::PassesScope(Session& session, const Asset& asset)
{
    const Scope& scope = session.GetScope();
    switch (asset.type)
    {
    case AssetType::FQDN:
        return scope.IsAssetInScope(asset, session.GetConfig().scope_confidence).confidence > 0;
    case AssetType::IPAddress:
    case AssetType::Netblock:
        return !scope.HasAddressConstraints() || scope.IsAssetInScope(asset, 0).confidence > 0;
    case AssetType::AutonomousSystem:
        return !scope.HasASNConstraints() || scope.IsAssetInScope(asset, 0).confidence > 0;
    default:
        return true;
    }
}

bool Dispatcher::DispatchEvent(Event event, ErrorInfo* err)
{
    if (!event.session)
        return Fail(err, ErrorKind::InvalidEvent, "event has no session");
    if (event.entity.id == 0)
        return Fail(err, ErrorKind::InvalidEvent, "event has no entity", event.session->ID());

    Session& session = *event.session;
    if (session.Done() || session.State() != SessionState::Active)
        return Fail(err, ErrorKind::Cancelled, "session is cancelled", session.ID());

    if (!accepting_.load(std::memory_order_acquire))
        return Fail(err, ErrorKind::Cancelled, "dispatcher is shut down", event.Name());
    // Nothing would ever drain the job, and CancelSession would wait on it forever
    if (!running_.load(std::memory_order_acquire))
        return Fail(err, ErrorKind::Cancelled, "dispatcher is not running", event.Name());

    if (!PassesScope(session, event.entity.asset))
    {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        PLOG_DEBUG << "[Dispatcher] out of scope: " << event.Name();
        return false;
    }

    if (!session.MarkDispatched(event.entity.id))
        return false;

    std::vector<HandlerEntryPtr> handlers;
    for (auto& entry : registry_.HandlersFor(event.entity.asset.type))
    {
        const auto& transforms = entry->handler.transforms;
        bool allowed = transforms.empty();
        for (const auto& to : transforms)
        {
            if (session.GetConfig().TransformationAllowed(event.entity.asset.type, to))
            {
                allowed = true;
                break;
            }
        }
        if (allowed)
            handlers.push_back(std::move(entry));
    }

    if (handlers.empty())
        return true;

    if (!event.dispatcher)
        event.dispatcher = this;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_.load(std::memory_order_acquire))
            return Fail(err, ErrorKind::Cancelled, "dispatcher is shut down", event.Name());

        session.Stats().AddTotal(handlers.size());
        queue_.push_back(Job{ std::move(event), std::move(handlers) });
    }
    cv_.notify_one();
    dispatched_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void Dispatcher::eventLoop()
{
    for (;;)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !queue_.empty() || !accepting_.load(std::memory_order_acquire); });
            if (queue_.empty())
                return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        RunJob(job);
    }
}

void Dispatcher::RunJob(Job& job)
{
    Session& session = *job.event.session;
    const CancellationToken* token = &session.Token();

    for (const auto& entry : job.handlers)
    {
        if (session.Done())
        {
            session.Stats().AddCompleted();
            continue;
        }

        if (!entry->slots->Acquire(token))
        {
            session.Stats().AddCompleted();
            continue;
        }

        if (entry->handler.rate_limiter && !entry->handler.rate_limiter->Take(token))
        {
            entry->slots->Release();
            session.Stats().AddCompleted();
            continue;
        }

        Invoke(entry, job.event);
    }
}

void Dispatcher::Invoke(const HandlerEntryPtr& entry, Event event)
{
    auto started = std::make_shared<std::promise<void>>();
    std::future<void> started_future = started->get_future();

    const SessionPtr owner = event.session;
    const ErrorContext* errors = errors_;
    auto task = [entry, event = std::move(event), started, errors]() mutable {
        Session& session = *event.session;
        const Handler& h = entry->handler;

        // Queued behind a busy pool while the session was killed
        if (session.Done())
        {
            started->set_value();
            entry->slots->Release();
            session.Stats().AddCompleted();
            return;
        }

        ErrorInfo err;
        bool ok = false;
        started->set_value();
        try
        {
            ok = h.callback(event, &err);
        }
        catch (const std::exception& e)
        {
            err = ErrorInfo(ErrorKind::HandlerFailure, std::string("handler threw: ") + e.what());
        }
        catch (...)
        {
            err = ErrorInfo(ErrorKind::HandlerFailure, "handler threw a non-standard exception");
        }

        if (!ok)
        {
            session.Stats().AddFailure();
            PLOG_ERROR << "[Dispatcher] handler '" << h.name << "' (plugin '" << h.PluginName() << "') failed on "
                       << event.Name() << ": " << (err.message.empty() ? "callback returned false" : err.message)
                       << (err.details.empty() ? "" : " (" + err.details + ")");
            if (errors)
            {
                if (err.kind == ErrorKind::None)
                    err = ErrorInfo(ErrorKind::HandlerFailure, "callback returned false", err.details);
                err.details = h.PluginName() + "/" + h.name + " on " + event.Name() +
                              (err.details.empty() ? "" : ": " + err.details);
                errors->Report(err);
            }
        }

        entry->slots->Release();
        session.Stats().AddCompleted();
    };

    if (!callbacks_ || !callbacks_->Submit(std::move(task)))
    {
        entry->slots->Release();
        owner->Stats().AddCompleted();
        return;
    }

    started_future.wait();
}

void Dispatcher::Shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_.exchange(false, std::memory_order_acq_rel) && workers_.empty() && !callbacks_)
            return;
    }
    cv_.notify_all();

    for (auto& t : workers_)
    {
        if (t.joinable())
            t.join();
    }
    workers_.clear();

    if (callbacks_)
    {
        callbacks_->Shutdown();
        callbacks_.reset();
    }

    // Never started: nothing will run what is still queued
    std::deque<Job> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftover.swap(queue_);
    }
    for (auto& job : leftover)
        job.event.session->Stats().AddCompleted(job.handlers.size());

    if (running_.exchange(false, std::memory_order_acq_rel))
        PLOG_INFO << "[Dispatcher] stopped";
}

std::size_t Dispatcher::QueueDepth() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace surveyor
