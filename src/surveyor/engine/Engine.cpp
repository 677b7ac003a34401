#include "Engine.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <thread>

namespace surveyor {

Engine::Engine(const Config& tuning, GraphStoreFactory factory)
    : dispatcher_(registry_, static_cast<std::size_t>(std::max(1, tuning.event_workers)),
                  static_cast<std::size_t>(std::max(1, tuning.callback_threads)), &errors_)
    , sessions_(tuning.poll_interval, std::move(factory))
    , poll_interval_(tuning.poll_interval)
{
    for (const auto& entry : tuning.sources)
    {
        const std::string& name = entry.first;
        const double rate = tuning.SourceRate(name);
        if (rate > 0.0)
        {
            registry_.SetSourceRate(name, rate);
            PLOG_DEBUG << "[Engine] " << name << " limited to " << rate << " requests/s";
        }
    }
}

Engine::~Engine() { Shutdown(); }

void Engine::AddPlugin(std::shared_ptr<IPlugin> plugin) { registry_.AddPlugin(std::move(plugin)); }

std::size_t Engine::Start()
{
    const std::size_t started = registry_.StartPlugins();
    dispatcher_.Start();
    PLOG_INFO << "[Engine] started " << started << " plugins, " << registry_.HandlerCount() << " handlers";
    return started;
}

SessionPtr Engine::NewSession(std::shared_ptr<const Config> config, ErrorInfo* err)
{
    ErrorInfo local;
    auto session = sessions_.NewSession(std::move(config), &local);
    if (!session)
    {
        errors_.Report(local);
        if (err)
            *err = local;
    }
    return session;
}

std::size_t Engine::StartEnumeration(const SessionPtr& session, ErrorInfo* err)
{
    if (!session)
    {
        Fail(err, ErrorKind::SessionNotFound, "no session to enumerate");
        return 0;
    }

    const Config& cfg = session->GetConfig();
    std::vector<Asset> seeds;
    for (const auto& d : session->GetScope().Domains())
        seeds.push_back(Asset::FQDN(d));
    for (const auto& a : session->GetScope().Addresses())
        seeds.push_back(Asset::IPAddress(a));
    for (const auto& c : session->GetScope().CIDRs())
        seeds.push_back(Asset::Netblock(c));
    for (int asn : cfg.asns)
        seeds.push_back(Asset::AutonomousSystem(asn));

    std::size_t queued = 0;
    for (const auto& seed : seeds)
    {
        ErrorInfo local;
        auto entity = session->Cache().CreateAsset(seed, &local);
        if (!entity)
        {
            PLOG_ERROR << "[Engine] failed to store seed " << seed.Key() << ": " << local.message;
            errors_.Report(local);
            if (err)
                *err = local;
            continue;
        }

        if (dispatcher_.DispatchEvent(Event{ *entity, session, &dispatcher_ }, &local))
            ++queued;
        else if (local)
            PLOG_WARNING << "[Engine] seed " << seed.Key() << " not dispatched: " << local.message;
    }

    PLOG_INFO << "[Engine] session " << session->ID() << " seeded with " << queued << " of " << seeds.size()
              << " assets";
    return queued;
}

bool Engine::WaitForQuiescence(const SessionPtr& session, std::chrono::milliseconds timeout)
{
    if (!session)
        return false;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto step = std::clamp<std::chrono::milliseconds>(poll_interval_, std::chrono::milliseconds(1),
                                                            std::chrono::milliseconds(20));

    for (;;)
    {
        if (session->Stats().Snapshot().Quiescent())
            return true;
        if (session->Done() || std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(step);
    }
}

void Engine::Shutdown()
{
    if (shut_down_.exchange(true))
        return;

    sessions_.Shutdown();
    dispatcher_.Shutdown();
    registry_.StopPlugins();
    PLOG_INFO << "[Engine] shut down";
}

} // namespace surveyor
