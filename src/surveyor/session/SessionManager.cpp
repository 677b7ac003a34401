#include "SessionManager.hpp"

#include <plog/Log.h>

#include <mutex>
#include <thread>

namespace surveyor {

SessionManager::SessionManager(std::chrono::milliseconds poll_interval, GraphStoreFactory factory)
    : poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds(500))
    , factory_(factory ? std::move(factory) : GraphStoreFactory(createGraphStore))
{
}

SessionManager::~SessionManager() { Shutdown(); }

SessionPtr SessionManager::NewSession(std::shared_ptr<const Config> config, ErrorInfo* err)
{
    auto session = Session::Create(std::move(config), factory_, err);
    if (!session)
        return nullptr;

    if (!AddSession(session, err))
    {
        ErrorInfo ignored;
        if (!session->Delete(&ignored))
            PLOG_WARNING << "[SessionManager] cleanup of rejected session failed: " << ignored.message;
        return nullptr;
    }
    return session;
}

bool SessionManager::AddSession(SessionPtr session, ErrorInfo* err)
{
    if (!session)
        return Fail(err, ErrorKind::InvalidEvent, "cannot add a null session");

    std::unique_lock lock(mutex_);
    if (!sessions_.emplace(session->ID(), session).second)
        return Fail(err, ErrorKind::Configuration, "session id already registered", session->ID());
    return true;
}

SessionPtr SessionManager::GetSession(const std::string& id, ErrorInfo* err) const
{
    {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(id);
        if (it != sessions_.end())
            return it->second;
    }

    PLOG_WARNING << "[SessionManager] session not found: " << id;
    Fail(err, ErrorKind::SessionNotFound, "session not found", id);
    return nullptr;
}

bool SessionManager::CancelSession(const std::string& id, ErrorInfo* err)
{
    auto session = GetSession(id, err);
    if (!session)
        return false;

    session->Kill();

    for (;;)
    {
        const auto snap = session->Stats().Snapshot();
        if (snap.Quiescent())
            break;
        PLOG_DEBUG << "[SessionManager] waiting on " << id << ": " << snap.work_items_completed << "/"
                   << snap.work_items_total;
        std::this_thread::sleep_for(poll_interval_);
    }

    ErrorInfo del_err;
    const bool deleted = session->Delete(&del_err);

    {
        std::unique_lock lock(mutex_);
        sessions_.erase(id);
    }

    if (!deleted)
    {
        if (err)
            *err = del_err;
        return false;
    }
    return true;
}

void SessionManager::Shutdown()
{
    for (const auto& id : SessionIds())
    {
        ErrorInfo err;
        if (!CancelSession(id, &err) && err.kind != ErrorKind::SessionNotFound)
            PLOG_ERROR << "[SessionManager] shutdown of session " << id << " failed: " << err.message;
    }
}

std::vector<std::string> SessionManager::SessionIds() const
{
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_)
        ids.push_back(id);
    return ids;
}

std::size_t SessionManager::Size() const
{
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

} // namespace surveyor
