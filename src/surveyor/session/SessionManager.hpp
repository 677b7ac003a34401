#pragma once

#include "Session.hpp"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace surveyor {

/**
 * @brief Registry of live sessions
 *
 * Lookups take a shared lock; adding and removing sessions are exclusive.
 * Owned by the Engine; one instance per process is typical but not required.
 */
class SessionManager
{
public:
    explicit SessionManager(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500),
                            GraphStoreFactory factory = createGraphStore);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Create a session from config and register it
    SessionPtr NewSession(std::shared_ptr<const Config> config, ErrorInfo* err = nullptr);

    // Register an externally created session; rejects null and duplicate ids
    bool AddSession(SessionPtr session, ErrorInfo* err = nullptr);

    // nullptr when the id is unknown
    SessionPtr GetSession(const std::string& id, ErrorInfo* err = nullptr) const;

    /**
     * @brief Cancel a session and wait for its in-flight work to drain
     *
     * Kills the session, polls its statistics every poll interval until every
     * scheduled work item has completed, then deletes and unregisters it.
     * Blocks the caller for the whole drain.
     */
    bool CancelSession(const std::string& id, ErrorInfo* err = nullptr);

    // Cancels and deletes every session
    void Shutdown();

    std::vector<std::string> SessionIds() const;
    std::size_t Size() const;

    std::chrono::milliseconds PollInterval() const { return poll_interval_; }

private:
    std::chrono::milliseconds poll_interval_;
    GraphStoreFactory factory_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;
};

} // namespace surveyor
