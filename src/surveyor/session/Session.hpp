#pragma once

#include "CancellationToken.hpp"
#include "SessionStats.hpp"
#include "../api/Config.hpp"
#include "../cache/AssetCache.hpp"
#include "../graph/ASNCache.hpp"
#include "../scope/Scope.hpp"
#include "../store/GraphStoreFactory.hpp"
#include "../store/IGraphStore.hpp"
#include "../util/ErrorContext.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace surveyor {

enum class SessionState
{
    Active,
    Cancelling,
    Terminated
};

const char* SessionStateToString(SessionState state);

/**
 * @brief Isolated context of one enumeration run
 *
 * Owns the run's graph store, asset cache, scope, ASN cache, statistics and
 * cancellation token. Sessions are always held by shared_ptr since queued
 * events keep them alive until they have been drained.
 *
 * Lifecycle: Active -> (Kill) -> Cancelling -> (Delete) -> Terminated.
 */
class Session
{
public:
    /**
     * @brief Build a ready-to-use session
     *
     * Selects the primary database from the configuration, opens the store
     * through `factory`, and creates the temp directory. Any failure aborts
     * creation and is returned through err.
     */
    static std::shared_ptr<Session> Create(std::shared_ptr<const Config> config, const GraphStoreFactory& factory,
                                           ErrorInfo* err = nullptr);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& ID() const { return id_; }

    // Signals cancellation once; later calls are no-ops
    void Kill();

    /**
     * @brief Release every resource of the session
     *
     * Closes the cache, removes the temp directory and closes the store.
     * A store close failure is logged and returned, the session still ends
     * up Terminated. Idempotent.
     */
    bool Delete(ErrorInfo* err = nullptr);

    bool Done() const { return token_.IsCancelled(); }
    SessionState State() const { return state_.load(std::memory_order_acquire); }

    // true the first time an entity is seen in this session
    bool MarkDispatched(EntityId id);

    SessionStats& Stats() { return stats_; }
    const SessionStats& Stats() const { return stats_; }

    Scope& GetScope() { return scope_; }
    const Scope& GetScope() const { return scope_; }

    AssetCache& Cache() { return *cache_; }
    IGraphStore& Store() { return *store_; }

    const Config& GetConfig() const { return *config_; }
    std::shared_ptr<const Config> ConfigPtr() const { return config_; }

    const CancellationToken& Token() const { return token_; }
    const std::filesystem::path& TmpDir() const { return tmp_dir_; }
    const DatabaseSelection& Database() const { return database_; }

    // ASN cache, filled from the graph on first use
    graph::ASNCache& ASNs();

private:
    Session(std::string id, std::shared_ptr<const Config> config);

    std::string id_;
    std::shared_ptr<const Config> config_;
    DatabaseSelection database_;

    Scope scope_;
    std::unique_ptr<IGraphStore> store_;
    std::unique_ptr<AssetCache> cache_;
    graph::ASNCache asns_;
    std::once_flag asns_filled_;

    SessionStats stats_;
    CancellationToken token_;
    std::filesystem::path tmp_dir_;

    std::mutex dispatched_mutex_;
    std::unordered_set<EntityId> dispatched_;

    std::mutex lifecycle_mutex_;
    std::atomic<SessionState> state_{ SessionState::Active };
};

using SessionPtr = std::shared_ptr<Session>;

// Random RFC 4122 version 4 identifier
std::string GenerateSessionId();

} // namespace surveyor
