#include "Support.hpp"
#include "../engine/Dispatcher.hpp"
#include "../session/Session.hpp"

#include <plog/Log.h>

#include <unordered_set>

namespace surveyor::support {

namespace {

bool HasSourceProperty(IGraphStore& store, EntityId id, const std::string& name, const std::string& source,
                       TimePoint since)
{
    std::vector<Property> props;
    if (!store.EntityProperties(id, since, props))
        return false;
    for (const auto& p : props)
    {
        if (p.name == name && p.value == source)
            return true;
    }
    return false;
}

bool Submit(const Event& parent, const Entity& entity)
{
    if (!parent.dispatcher)
        return false;

    ErrorInfo err;
    if (parent.dispatcher->DispatchEvent(Event{ entity, parent.session, parent.dispatcher }, &err))
        return true;
    if (err && err.kind != ErrorKind::Cancelled)
        PLOG_WARNING << "[Support] failed to submit " << entity.asset.Key() << ": " << err.message;
    return false;
}

} // namespace

TimePoint TTLStartTime(const Config& config, AssetType from, AssetType to, const std::string& source)
{
    return Clock::now() - config.TransformationTTL(from, to, source);
}

bool AssetMonitoredWithinTTL(Session& session, const Entity& entity, const Source& source, TimePoint since)
{
    if (session.Cache().IsClosed())
        return false;
    return HasSourceProperty(session.Store(), entity.id, kMonitoredPropertyName, source.name, since);
}

bool MarkAssetMonitored(Session& session, const Entity& entity, const Source& source, ErrorInfo* err)
{
    Property p;
    p.name = kMonitoredPropertyName;
    p.value = source.name;
    p.confidence = source.confidence;
    return session.Cache().CreateEntityProperty(entity, p, err).has_value();
}

std::vector<Entity> SourceToAssetsWithinTTL(Session& session, const std::string& name, AssetType type,
                                            const Source& source, TimePoint since)
{
    std::vector<Entity> out;
    if (session.Cache().IsClosed())
        return out;

    IGraphStore& store = session.Store();
    std::vector<Entity> candidates;
    ErrorInfo err;
    const Asset asset(type, name);
    const bool ok = type == AssetType::FQDN ? store.FindByScope({ asset }, since, candidates, &err)
                                             : store.FindEntityByContent(asset, since, candidates, &err);
    if (!ok)
    {
        PLOG_ERROR << "[Support] failed to read stored results for " << asset.Key() << ": " << err.message;
        return out;
    }

    for (const auto& e : candidates)
    {
        if (HasSourceProperty(store, e.id, kSourcePropertyName, source.name, since))
            out.push_back(e);
    }
    return out;
}

std::size_t ProcessAssetsWithSource(const Event& event, const std::vector<Entity>& entities, const Source& source)
{
    if (!event.session)
        return 0;

    std::size_t submitted = 0;
    std::unordered_set<EntityId> seen;
    for (const auto& entity : entities)
    {
        if (!seen.insert(entity.id).second)
            continue;

        ErrorInfo err;
        if (!event.session->Cache().CreateEntityProperty(entity, source.ToProperty(), &err))
            continue;

        if (Submit(event, entity))
            ++submitted;
    }
    return submitted;
}

std::optional<Entity> CreateFinding(const Event& event, const Entity& from, const Relation& relation, const Asset& to,
                                    const Source& source, ErrorInfo* err)
{
    if (!event.session)
    {
        Fail(err, ErrorKind::InvalidEvent, "event has no session");
        return std::nullopt;
    }

    AssetCache& cache = event.session->Cache();
    auto target = cache.CreateAsset(to, err);
    if (!target)
        return std::nullopt;

    Edge edge;
    edge.relation = relation;
    edge.from = from.id;
    edge.to = target->id;
    auto stored = cache.CreateEdge(edge, err);
    if (!stored)
        return std::nullopt;

    if (!cache.CreateEdgeProperty(*stored, source.ToProperty(), err))
        return std::nullopt;
    if (!cache.CreateEntityProperty(*target, source.ToProperty(), err))
        return std::nullopt;

    Submit(event, *target);
    return target;
}

} // namespace surveyor::support
