#pragma once

#include "Dispatcher.hpp"
#include "../api/Config.hpp"
#include "../registry/Registry.hpp"
#include "../session/SessionManager.hpp"
#include "../store/GraphStoreFactory.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace surveyor {

/**
 * @brief Top-level owner of the discovery machinery
 *
 * Holds the handler registry, the dispatcher and the session manager, and
 * turns a session's configured seeds into its first events.
 */
class Engine
{
public:
    // Worker counts and the quiescence poll interval are taken from `tuning`
    explicit Engine(const Config& tuning, GraphStoreFactory factory = createGraphStore);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    void AddPlugin(std::shared_ptr<IPlugin> plugin);

    // Receives session, seeding and callback failures; set before Start()
    void SetErrorCallback(ErrorCallback callback) { errors_.SetCallback(std::move(callback)); }

    // Starts plugins, then the dispatcher; returns the number of plugins running
    std::size_t Start();

    SessionPtr NewSession(std::shared_ptr<const Config> config, ErrorInfo* err = nullptr);

    /**
     * @brief Create the seed assets of a session and dispatch them
     *
     * Seeds are the configured domains, addresses, netblocks and ASNs.
     *
     * @return Number of seed events queued
     */
    std::size_t StartEnumeration(const SessionPtr& session, ErrorInfo* err = nullptr);

    /**
     * @brief Block until every scheduled work item of the session completed
     * @return false on timeout or when the session was cancelled first
     */
    bool WaitForQuiescence(const SessionPtr& session, std::chrono::milliseconds timeout);

    // Sessions first so their queued work drains through the live dispatcher
    void Shutdown();

    Registry& GetRegistry() { return registry_; }
    Dispatcher& GetDispatcher() { return dispatcher_; }
    SessionManager& Sessions() { return sessions_; }

private:
    ErrorContext errors_;
    Registry registry_;
    Dispatcher dispatcher_;
    SessionManager sessions_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> shut_down_{ false };
};

} // namespace surveyor
