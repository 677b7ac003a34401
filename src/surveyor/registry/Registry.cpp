#include "Registry.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <mutex>

namespace surveyor {

void Registry::RecordRegistrationFailure(const IPlugin* plugin, const ErrorInfo& err)
{
    if (!plugin)
        return;
    // First failure wins; it is the one the plugin is rolled back for
    registration_failures_.emplace(plugin, err);
}

bool Registry::RegisterHandler(Handler handler, ErrorInfo* err)
{
    if (!handler.callback)
    {
        const ErrorInfo invalid(ErrorKind::InvalidEvent, "handler has no callback", handler.name);
        {
            std::unique_lock lock(mutex_);
            RecordRegistrationFailure(handler.plugin, invalid);
        }
        return Fail(err, invalid.kind, invalid.message, invalid.details);
    }

    std::unique_lock lock(mutex_);
    auto& list = handlers_[handler.event_type];

    const std::string plugin_name = handler.PluginName();
    for (const auto& entry : list)
    {
        if (entry->handler.name == handler.name && entry->handler.PluginName() == plugin_name)
        {
            PLOG_WARNING << "[Registry] duplicate handler '" << handler.name << "' for plugin '" << plugin_name
                         << "' on " << AssetTypeToString(handler.event_type);
            const ErrorInfo duplicate(ErrorKind::DuplicateHandler, "handler already registered",
                                      plugin_name + "/" + AssetTypeToString(handler.event_type) + "/" +
                                          handler.name);
            RecordRegistrationFailure(handler.plugin, duplicate);
            return Fail(err, duplicate.kind, duplicate.message, duplicate.details);
        }
    }

    if (!handler.rate_limiter)
    {
        auto limiter = limiters_.find(plugin_name);
        if (limiter != limiters_.end())
            handler.rate_limiter = limiter->second;
    }

    auto entry = std::make_shared<HandlerEntry>();
    entry->slots = std::make_shared<HandlerSlots>(handler.Instances());
    entry->sequence = next_sequence_++;
    entry->handler = std::move(handler);

    // Stable position: after every handler of equal or lower priority value
    auto pos = std::upper_bound(list.begin(), list.end(), entry->handler.priority,
                                [](int prio, const HandlerEntryPtr& e) { return prio < e->handler.priority; });
    list.insert(pos, std::move(entry));
    return true;
}

std::vector<HandlerEntryPtr> Registry::HandlersFor(AssetType type) const
{
    std::shared_lock lock(mutex_);
    auto it = handlers_.find(type);
    if (it == handlers_.end())
        return {};
    return it->second;
}

std::size_t Registry::HandlerCount() const
{
    std::shared_lock lock(mutex_);
    std::size_t n = 0;
    for (const auto& [type, list] : handlers_)
        n += list.size();
    return n;
}

void Registry::SetSourceRate(const std::string& source, double rate_per_second)
{
    std::unique_lock lock(mutex_);
    if (rate_per_second <= 0.0)
    {
        limiters_.erase(source);
        return;
    }
    limiters_[source] = std::make_shared<RateLimiter>(rate_per_second);
}

std::shared_ptr<RateLimiter> Registry::SourceLimiter(const std::string& source) const
{
    std::shared_lock lock(mutex_);
    auto it = limiters_.find(source);
    return it == limiters_.end() ? nullptr : it->second;
}

void Registry::AddPlugin(std::shared_ptr<IPlugin> plugin)
{
    if (!plugin)
        return;
    std::unique_lock lock(mutex_);
    plugins_.push_back(std::move(plugin));
}

void Registry::RemovePluginHandlers(const IPlugin* plugin)
{
    std::unique_lock lock(mutex_);
    for (auto& [type, list] : handlers_)
    {
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [plugin](const HandlerEntryPtr& e) { return e->handler.plugin == plugin; }),
                   list.end());
    }
}

std::size_t Registry::StartPlugins()
{
    std::vector<std::shared_ptr<IPlugin>> pending;
    {
        std::shared_lock lock(mutex_);
        for (const auto& p : plugins_)
        {
            if (std::find(started_.begin(), started_.end(), p) == started_.end())
                pending.push_back(p);
        }
    }

    std::size_t count = 0;
    for (const auto& plugin : pending)
    {
        {
            std::unique_lock lock(mutex_);
            registration_failures_.erase(plugin.get());
        }

        // Start() calls back into RegisterHandler, so no lock is held here
        ErrorInfo err;
        const bool started = plugin->Start(*this, &err);

        std::optional<ErrorInfo> rejected;
        {
            std::unique_lock lock(mutex_);
            auto it = registration_failures_.find(plugin.get());
            if (it != registration_failures_.end())
            {
                rejected = it->second;
                registration_failures_.erase(it);
            }
        }

        if (!started || rejected)
        {
            const ErrorInfo& why = (started || !err) && rejected ? *rejected : err;
            PLOG_ERROR << "[Registry] plugin '" << plugin->Name() << "' failed to start: " << why.message
                       << (why.details.empty() ? "" : " (" + why.details + ")");
            RemovePluginHandlers(plugin.get());
            // It believes it is running and may hold resources
            if (started)
                plugin->Stop();
            continue;
        }

        PLOG_INFO << "[Registry] plugin '" << plugin->Name() << "' started";
        std::unique_lock lock(mutex_);
        started_.push_back(plugin);
        ++count;
    }
    return count;
}

void Registry::StopPlugins()
{
    std::vector<std::shared_ptr<IPlugin>> running;
    {
        std::unique_lock lock(mutex_);
        running.swap(started_);
    }

    for (auto it = running.rbegin(); it != running.rend(); ++it)
    {
        (*it)->Stop();
        RemovePluginHandlers(it->get());
        PLOG_INFO << "[Registry] plugin '" << (*it)->Name() << "' stopped";
    }
}

std::vector<std::string> Registry::StartedPlugins() const
{
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(started_.size());
    for (const auto& p : started_)
        names.push_back(p->Name());
    return names;
}

} // namespace surveyor
