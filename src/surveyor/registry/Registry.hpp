#pragma once

#include "Handler.hpp"
#include "HandlerSlots.hpp"
#include "RateLimiter.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace surveyor {

/**
 * @brief A registered handler together with its concurrency slots
 */
struct HandlerEntry
{
    Handler handler;
    std::uint64_t sequence = 0;
    std::shared_ptr<HandlerSlots> slots;
};

using HandlerEntryPtr = std::shared_ptr<const HandlerEntry>;

/**
 * @brief Event type -> handlers, ordered by (priority, registration order)
 *
 * Also owns the plugin list and drives plugin start/stop. Handler lists are
 * handed out as snapshots, so registration never blocks a running dispatch.
 */
class Registry
{
public:
    Registry() = default;
    ~Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @brief Register a handler
     *
     * Fails with DuplicateHandler when (plugin, event type, name) is already
     * present, and with InvalidEvent when the handler has no callback.
     */
    bool RegisterHandler(Handler handler, ErrorInfo* err = nullptr);

    std::vector<HandlerEntryPtr> HandlersFor(AssetType type) const;
    std::size_t HandlerCount() const;

    // Handlers of `source` registered afterwards without a limiter of their own share this one
    void SetSourceRate(const std::string& source, double rate_per_second);
    std::shared_ptr<RateLimiter> SourceLimiter(const std::string& source) const;

    void AddPlugin(std::shared_ptr<IPlugin> plugin);

    /**
     * @brief Start every added plugin
     *
     * A plugin whose Start() fails, or one of whose handler registrations
     * was rejected during Start(), has the handlers it registered removed and
     * is reported; the others keep running. A plugin that returned true
     * despite a rejected registration is stopped again.
     *
     * @return Number of plugins started
     */
    std::size_t StartPlugins();
    void StopPlugins();

    std::vector<std::string> StartedPlugins() const;

private:
    void RemovePluginHandlers(const IPlugin* plugin);
    // Caller holds mutex_
    void RecordRegistrationFailure(const IPlugin* plugin, const ErrorInfo& err);

    mutable std::shared_mutex mutex_;
    std::map<AssetType, std::vector<HandlerEntryPtr>> handlers_;
    std::vector<std::shared_ptr<IPlugin>> plugins_;
    std::vector<std::shared_ptr<IPlugin>> started_;
    std::map<std::string, std::shared_ptr<RateLimiter>> limiters_;
    std::map<const IPlugin*, ErrorInfo> registration_failures_;
    std::uint64_t next_sequence_ = 0;
};

} // namespace surveyor
