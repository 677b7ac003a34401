#include "Session.hpp"
#include "../graph/Traversal.hpp"

#include <plog/Log.h>

#include <cstdio>
#include <random>
#include <system_error>

namespace surveyor {

const char* SessionStateToString(SessionState state)
{
    switch (state)
    {
    case SessionState::Active:
        return "Active";
    case SessionState::Cancelling:
        return "Cancelling";
    case SessionState::Terminated:
        return "Terminated";
    }
    return "Unknown";
}

std::string GenerateSessionId()
{
    thread_local std::mt19937_64 rng{ std::random_device{}() };
    std::uniform_int_distribution<std::uint64_t> dist;

    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 10xx

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF), static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

Session::Session(std::string id, std::shared_ptr<const Config> config)
    : id_(std::move(id))
    , config_(std::move(config))
    , scope_(Scope::FromConfig(*config_))
{
}

Session::~Session()
{
    if (State() != SessionState::Terminated)
    {
        ErrorInfo err;
        if (!Delete(&err))
            PLOG_WARNING << "[Session " << id_ << "] cleanup on destruction failed: " << err.message;
    }
}

std::shared_ptr<Session> Session::Create(std::shared_ptr<const Config> config, const GraphStoreFactory& factory,
                                         ErrorInfo* err)
{
    if (!config)
    {
        Fail(err, ErrorKind::Configuration, "session created without a configuration");
        return nullptr;
    }

    auto selection = config->SelectPrimaryDatabase(err);
    if (!selection)
    {
        PLOG_ERROR << "[Session] database selection failed: " << (err ? err->message : std::string());
        return nullptr;
    }

    std::shared_ptr<Session> session(new Session(GenerateSessionId(), config));
    session->database_ = *selection;

    ErrorInfo local;
    session->store_ = factory ? factory(*selection, &local) : createGraphStore(*selection, &local);
    if (!session->store_)
    {
        PLOG_ERROR << "[Session " << session->id_ << "] " << local.message << ": " << local.details;
        if (err)
            *err = local.kind == ErrorKind::None
                       ? ErrorInfo(ErrorKind::Configuration, "failed to initialize database store", selection->system)
                       : local;
        session->state_.store(SessionState::Terminated, std::memory_order_release);
        return nullptr;
    }

    session->cache_ = std::make_unique<AssetCache>(session->store_.get());

    std::error_code ec;
    session->tmp_dir_ = std::filesystem::temp_directory_path(ec) / ("surveyor-" + session->id_);
    if (ec || !std::filesystem::create_directories(session->tmp_dir_, ec) || ec)
    {
        Fail(err, ErrorKind::Configuration, "failed to create the session temp directory",
             session->tmp_dir_.string() + ": " + ec.message());
        PLOG_ERROR << "[Session " << session->id_ << "] cannot create " << session->tmp_dir_.string() << ": "
                   << ec.message();
        session->tmp_dir_.clear();
        ErrorInfo ignored;
        if (!session->Delete(&ignored))
            PLOG_WARNING << "[Session " << session->id_ << "] rollback failed: " << ignored.message;
        return nullptr;
    }

    PLOG_INFO << "[Session " << session->id_ << "] created with " << selection->system << " store";
    return session;
}

void Session::Kill()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!token_.Cancel())
        return;

    SessionState expected = SessionState::Active;
    state_.compare_exchange_strong(expected, SessionState::Cancelling, std::memory_order_acq_rel);
    PLOG_INFO << "[Session " << id_ << "] cancellation requested";
}

bool Session::Delete(ErrorInfo* err)
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_.load(std::memory_order_acquire) == SessionState::Terminated)
        return true;

    token_.Cancel();

    if (cache_)
        cache_->Close();

    if (!tmp_dir_.empty())
    {
        std::error_code ec;
        std::filesystem::remove_all(tmp_dir_, ec);
        if (ec)
            PLOG_WARNING << "[Session " << id_ << "] failed to remove " << tmp_dir_.string() << ": " << ec.message();
    }

    bool ok = true;
    if (store_ && !store_->IsClosed())
    {
        ErrorInfo close_err;
        if (!store_->Close(&close_err))
        {
            PLOG_ERROR << "[Session " << id_ << "] failed to close the " << store_->Name()
                       << " store: " << close_err.message;
            if (err)
                *err = close_err;
            ok = false;
        }
    }

    state_.store(SessionState::Terminated, std::memory_order_release);
    PLOG_INFO << "[Session " << id_ << "] terminated";
    return ok;
}

bool Session::MarkDispatched(EntityId id)
{
    std::lock_guard<std::mutex> lock(dispatched_mutex_);
    return dispatched_.insert(id).second;
}

graph::ASNCache& Session::ASNs()
{
    std::call_once(asns_filled_, [this]() {
        if (store_ && !store_->IsClosed())
            graph::FillCache(asns_, *store_, kAnyTime);
    });
    return asns_;
}

} // namespace surveyor
