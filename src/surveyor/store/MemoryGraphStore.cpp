#include "MemoryGraphStore.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace surveyor {

namespace {

bool NameUnder(const std::string& name, const std::string& root)
{
    if (name == root)
        return true;
    return name.size() > root.size() && name.compare(name.size() - root.size(), root.size(), root) == 0 &&
           name[name.size() - root.size() - 1] == '.';
}

} // namespace

bool MemoryGraphStore::CheckOpen(ErrorInfo* err) const
{
    if (IsClosed())
        return Fail(err, ErrorKind::Store, "graph store is closed", Name());
    return true;
}

std::optional<Entity> MemoryGraphStore::CreateEntity(const Asset& asset, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return std::nullopt;

    std::unique_lock lock(mutex_);
    Entity e;
    e.id = next_entity_++;
    e.asset = asset;
    e.asset.value = asset.CanonicalValue();
    e.created_at = Clock::now();
    e.last_seen = e.created_at;

    by_key_.emplace(e.asset.Key(), e.id);
    entities_.emplace(e.id, e);
    return e;
}

std::optional<Edge> MemoryGraphStore::CreateEdge(const Relation& relation, EntityId from, EntityId to,
                                                 ErrorInfo* err)
{
    if (!CheckOpen(err))
        return std::nullopt;

    std::unique_lock lock(mutex_);
    if (!entities_.count(from) || !entities_.count(to))
    {
        Fail(err, ErrorKind::Store, "edge endpoint does not exist",
             "from=" + std::to_string(from) + " to=" + std::to_string(to));
        return std::nullopt;
    }

    Edge e;
    e.id = next_edge_++;
    e.relation = relation;
    e.from = from;
    e.to = to;
    e.created_at = Clock::now();
    e.last_seen = e.created_at;

    edges_.emplace(e.id, e);
    outgoing_[from].push_back(e.id);
    incoming_[to].push_back(e.id);
    return e;
}

std::optional<Property> MemoryGraphStore::CreateEntityProperty(EntityId entity, const Property& prop,
                                                               ErrorInfo* err)
{
    if (!CheckOpen(err))
        return std::nullopt;

    std::unique_lock lock(mutex_);
    if (!entities_.count(entity))
    {
        Fail(err, ErrorKind::Store, "entity does not exist", std::to_string(entity));
        return std::nullopt;
    }

    Property p = prop;
    p.id = next_property_++;
    if (p.created_at == TimePoint{})
        p.created_at = Clock::now();
    entity_props_[entity].push_back(p);
    return p;
}

std::optional<Property> MemoryGraphStore::CreateEdgeProperty(EdgeId edge, const Property& prop, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return std::nullopt;

    std::unique_lock lock(mutex_);
    if (!edges_.count(edge))
    {
        Fail(err, ErrorKind::Store, "edge does not exist", std::to_string(edge));
        return std::nullopt;
    }

    Property p = prop;
    p.id = next_property_++;
    if (p.created_at == TimePoint{})
        p.created_at = Clock::now();
    edge_props_[edge].push_back(p);
    return p;
}

std::optional<Entity> MemoryGraphStore::TouchEntity(EntityId id, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return std::nullopt;

    std::unique_lock lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end())
    {
        Fail(err, ErrorKind::Store, "entity does not exist", std::to_string(id));
        return std::nullopt;
    }
    it->second.last_seen = std::max(it->second.last_seen, Clock::now());
    return it->second;
}

std::optional<Edge> MemoryGraphStore::TouchEdge(EdgeId id, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return std::nullopt;

    std::unique_lock lock(mutex_);
    auto it = edges_.find(id);
    if (it == edges_.end())
    {
        Fail(err, ErrorKind::Store, "edge does not exist", std::to_string(id));
        return std::nullopt;
    }
    it->second.last_seen = std::max(it->second.last_seen, Clock::now());
    return it->second;
}

bool MemoryGraphStore::FindEntityByContent(const Asset& asset, TimePoint since, std::vector<Entity>& out,
                                           ErrorInfo* err)
{
    if (!CheckOpen(err))
        return false;

    std::shared_lock lock(mutex_);
    auto [begin, end] = by_key_.equal_range(asset.Key());
    for (auto it = begin; it != end; ++it)
    {
        const Entity& e = entities_.at(it->second);
        if (e.last_seen >= since)
            out.push_back(e);
    }
    return true;
}

std::optional<Entity> MemoryGraphStore::FindEntityById(EntityId id, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return std::nullopt;

    std::shared_lock lock(mutex_);
    auto it = entities_.find(id);
    if (it == entities_.end())
    {
        Fail(err, ErrorKind::Store, "entity not found", std::to_string(id));
        return std::nullopt;
    }
    return it->second;
}

bool MemoryGraphStore::FindEntitiesByType(AssetType type, TimePoint since, std::vector<Entity>& out, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return false;

    std::shared_lock lock(mutex_);
    for (const auto& [id, e] : entities_)
    {
        if (e.asset.type == type && e.last_seen >= since)
            out.push_back(e);
    }
    return true;
}

bool MemoryGraphStore::CollectEdges(const std::unordered_map<EntityId, std::vector<EdgeId>>& index, EntityId entity,
                                    TimePoint since, const std::string& label, std::vector<Edge>& out) const
{
    auto it = index.find(entity);
    if (it == index.end())
        return true;

    for (EdgeId id : it->second)
    {
        const Edge& e = edges_.at(id);
        if (e.last_seen < since)
            continue;
        if (!label.empty() && e.relation.name != label)
            continue;
        out.push_back(e);
    }
    return true;
}

bool MemoryGraphStore::OutgoingEdges(EntityId entity, TimePoint since, const std::string& label,
                                     std::vector<Edge>& out, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return false;

    std::shared_lock lock(mutex_);
    return CollectEdges(outgoing_, entity, since, label, out);
}

bool MemoryGraphStore::IncomingEdges(EntityId entity, TimePoint since, const std::string& label,
                                     std::vector<Edge>& out, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return false;

    std::shared_lock lock(mutex_);
    return CollectEdges(incoming_, entity, since, label, out);
}

std::optional<Edge> MemoryGraphStore::FindEdgeById(EdgeId id, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return std::nullopt;

    std::shared_lock lock(mutex_);
    auto it = edges_.find(id);
    if (it == edges_.end())
    {
        Fail(err, ErrorKind::Store, "edge not found", std::to_string(id));
        return std::nullopt;
    }
    return it->second;
}

bool MemoryGraphStore::EntityProperties(EntityId entity, TimePoint since, std::vector<Property>& out,
                                        ErrorInfo* err)
{
    if (!CheckOpen(err))
        return false;

    std::shared_lock lock(mutex_);
    auto it = entity_props_.find(entity);
    if (it == entity_props_.end())
        return true;

    for (const auto& p : it->second)
    {
        if (p.created_at >= since)
            out.push_back(p);
    }
    return true;
}

bool MemoryGraphStore::EdgeProperties(EdgeId edge, TimePoint since, std::vector<Property>& out, ErrorInfo* err)
{
    if (!CheckOpen(err))
        return false;

    std::shared_lock lock(mutex_);
    auto it = edge_props_.find(edge);
    if (it == edge_props_.end())
        return true;

    for (const auto& p : it->second)
    {
        if (p.created_at >= since)
            out.push_back(p);
    }
    return true;
}

bool MemoryGraphStore::FindByScope(const std::vector<Asset>& assets, TimePoint since, std::vector<Entity>& out,
                                   ErrorInfo* err)
{
    if (!CheckOpen(err))
        return false;

    std::shared_lock lock(mutex_);
    std::unordered_set<EntityId> seen;
    for (const auto& asset : assets)
    {
        if (asset.type != AssetType::FQDN)
        {
            auto [begin, end] = by_key_.equal_range(asset.Key());
            for (auto it = begin; it != end; ++it)
            {
                const Entity& e = entities_.at(it->second);
                if (e.last_seen >= since && seen.insert(e.id).second)
                    out.push_back(e);
            }
            continue;
        }

        const std::string root = asset.CanonicalValue();
        for (const auto& [id, e] : entities_)
        {
            if (e.asset.type != AssetType::FQDN || e.last_seen < since)
                continue;
            if (NameUnder(e.asset.value, root) && seen.insert(id).second)
                out.push_back(e);
        }
    }
    return true;
}

bool MemoryGraphStore::Close(ErrorInfo* err)
{
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        return Fail(err, ErrorKind::Store, "graph store already closed", Name());
    return true;
}

std::size_t MemoryGraphStore::EntityCount() const
{
    std::shared_lock lock(mutex_);
    return entities_.size();
}

std::size_t MemoryGraphStore::EdgeCount() const
{
    std::shared_lock lock(mutex_);
    return edges_.size();
}

} // namespace surveyor
