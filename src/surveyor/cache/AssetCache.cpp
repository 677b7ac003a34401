#include "AssetCache.hpp"

#include <plog/Log.h>

#include <functional>
#include <vector>

namespace surveyor {

AssetCache::AssetCache(IGraphStore* store, std::size_t capacity)
    : store_(store)
    , entities_(capacity)
    , edges_(capacity)
{
}

bool AssetCache::CheckOpen(ErrorInfo* err, const std::string& context) const
{
    if (IsClosed() || !store_)
        return Fail(err, ErrorKind::Store, "asset cache closed", context);
    return true;
}

std::mutex& AssetCache::StripeFor(const std::string& key)
{
    return stripes_[std::hash<std::string>{}(key) % kLockStripes];
}

std::string AssetCache::EdgeKey(const Edge& edge)
{
    return std::to_string(edge.from) + ">" + std::to_string(edge.to) + "|" + edge.relation.Key();
}

std::optional<Entity> AssetCache::Refresh(const std::string& key, const Entity& hit, ErrorInfo* err)
{
    ErrorInfo local;
    auto touched = store_->TouchEntity(hit.id, &local);
    if (!touched)
    {
        PLOG_ERROR << "[AssetCache] failed to refresh " << key << ": " << local.message << " " << local.details;
        if (err)
            *err = local;
        return std::nullopt;
    }
    entities_.Put(key, *touched);
    return touched;
}

std::optional<Edge> AssetCache::Refresh(const std::string& key, const Edge& hit, ErrorInfo* err)
{
    ErrorInfo local;
    auto touched = store_->TouchEdge(hit.id, &local);
    if (!touched)
    {
        PLOG_ERROR << "[AssetCache] failed to refresh edge " << key << ": " << local.message;
        if (err)
            *err = local;
        return std::nullopt;
    }
    edges_.Put(key, *touched);
    return touched;
}

std::optional<Entity> AssetCache::CreateAsset(const Asset& asset, ErrorInfo* err)
{
    const std::string key = asset.Key();
    if (!CheckOpen(err, key))
        return std::nullopt;

    if (auto hit = entities_.Get(key))
        return Refresh(key, *hit, err);

    std::lock_guard<std::mutex> lock(StripeFor(key));

    // Another creator may have finished while we waited for the stripe
    if (auto hit = entities_.Get(key))
        return Refresh(key, *hit, err);

    ErrorInfo local;
    std::vector<Entity> existing;
    if (!store_->FindEntityByContent(asset, kAnyTime, existing, &local))
    {
        PLOG_ERROR << "[AssetCache] lookup failed for " << key << ": " << local.message << " " << local.details;
        if (err)
            *err = local;
        return std::nullopt;
    }
    if (!existing.empty())
        return Refresh(key, existing.front(), err);

    auto created = store_->CreateEntity(asset, &local);
    if (!created)
    {
        PLOG_ERROR << "[AssetCache] failed to create " << key << ": " << local.message << " " << local.details;
        if (err)
            *err = local;
        return std::nullopt;
    }

    creates_.fetch_add(1, std::memory_order_relaxed);
    entities_.Put(key, *created);
    return created;
}

std::optional<Entity> AssetCache::FindAsset(const Asset& asset, TimePoint since, ErrorInfo* err)
{
    const std::string key = asset.Key();
    if (!CheckOpen(err, key))
        return std::nullopt;

    if (auto hit = entities_.Get(key); hit && hit->last_seen >= since)
        return hit;

    std::vector<Entity> found;
    if (!store_->FindEntityByContent(asset, since, found, err))
    {
        PLOG_ERROR << "[AssetCache] lookup failed for " << key;
        return std::nullopt;
    }
    if (found.empty())
        return std::nullopt;

    entities_.Put(key, found.front());
    return found.front();
}

std::optional<Edge> AssetCache::CreateEdge(const Edge& edge, ErrorInfo* err)
{
    const std::string key = EdgeKey(edge);
    if (!CheckOpen(err, key))
        return std::nullopt;

    if (auto hit = edges_.Get(key))
        return Refresh(key, *hit, err);

    std::lock_guard<std::mutex> lock(StripeFor(key));

    if (auto hit = edges_.Get(key))
        return Refresh(key, *hit, err);

    ErrorInfo local;
    std::vector<Edge> outgoing;
    if (!store_->OutgoingEdges(edge.from, kAnyTime, edge.relation.name, outgoing, &local))
    {
        PLOG_ERROR << "[AssetCache] edge lookup failed for " << key << ": " << local.message;
        if (err)
            *err = local;
        return std::nullopt;
    }

    const std::string rel_key = edge.relation.Key();
    for (const auto& e : outgoing)
    {
        if (e.to == edge.to && e.relation.Key() == rel_key)
            return Refresh(key, e, err);
    }

    auto created = store_->CreateEdge(edge.relation, edge.from, edge.to, &local);
    if (!created)
    {
        PLOG_ERROR << "[AssetCache] failed to create edge " << key << ": " << local.message << " " << local.details;
        if (err)
            *err = local;
        return std::nullopt;
    }

    edges_.Put(key, *created);
    return created;
}

std::optional<Property> AssetCache::CreateEntityProperty(const Entity& entity, const Property& prop, ErrorInfo* err)
{
    const std::string context = entity.asset.Key() + " property " + prop.name;
    if (!CheckOpen(err, context))
        return std::nullopt;

    ErrorInfo local;
    auto created = store_->CreateEntityProperty(entity.id, prop, &local);
    if (!created)
    {
        PLOG_ERROR << "[AssetCache] failed to attach " << context << ": " << local.message;
        if (err)
            *err = local;
    }
    return created;
}

std::optional<Property> AssetCache::CreateEdgeProperty(const Edge& edge, const Property& prop, ErrorInfo* err)
{
    const std::string context = EdgeKey(edge) + " property " + prop.name;
    if (!CheckOpen(err, context))
        return std::nullopt;

    ErrorInfo local;
    auto created = store_->CreateEdgeProperty(edge.id, prop, &local);
    if (!created)
    {
        PLOG_ERROR << "[AssetCache] failed to attach " << context << ": " << local.message;
        if (err)
            *err = local;
    }
    return created;
}

void AssetCache::Close()
{
    if (closed_.exchange(true, std::memory_order_acq_rel))
        return;
    entities_.Clear();
    edges_.Clear();
}

} // namespace surveyor
