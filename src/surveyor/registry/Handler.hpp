#pragma once

#include "../model/Asset.hpp"
#include "../util/ErrorContext.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace surveyor {

class Session;
class Dispatcher;
class Registry;
class RateLimiter;

/**
 * @brief One unit of work: an entity arriving in a session
 *
 * Events are ephemeral. Handlers feed new findings back through
 * `dispatcher`, never by recursing into other handlers.
 */
struct Event
{
    Entity entity;
    std::shared_ptr<Session> session;
    Dispatcher* dispatcher = nullptr;

    // Human-readable identity for logs
    std::string Name() const { return entity.asset.Key(); }
};

/**
 * @brief A data source contributing handlers
 *
 * Start() registers the plugin's handlers; a false return (or a failed
 * registration) rolls the plugin back without affecting other plugins.
 */
class IPlugin
{
public:
    virtual ~IPlugin() = default;

    virtual std::string Name() const = 0;
    virtual bool Start(Registry& registry, ErrorInfo* err) = 0;
    virtual void Stop() = 0;
};

// Returns false (with err filled) when the invocation failed
using HandlerCallback = std::function<bool(Event&, ErrorInfo*)>;

struct Handler
{
    IPlugin* plugin = nullptr;
    std::string name;
    int priority = 5; // lower runs first
    AssetType event_type = AssetType::FQDN;
    std::vector<std::string> transforms; // output asset types, by name
    int max_instances = 0;               // 0 means 1
    std::shared_ptr<RateLimiter> rate_limiter;
    HandlerCallback callback;

    std::string PluginName() const { return plugin ? plugin->Name() : std::string(); }
    int Instances() const { return max_instances > 0 ? max_instances : 1; }
};

} // namespace surveyor
