#include "Traversal.hpp"
#include "../session/CancellationToken.hpp"

#include <plog/Log.h>

#include <charconv>
#include <unordered_set>

namespace surveyor::graph {

namespace {

bool IsAddressRecord(const Relation& rel)
{
    return rel.kind == RelationKind::BasicDNS && (rel.rr_type == rrtype::A || rel.rr_type == rrtype::AAAA);
}

std::optional<Entity> AddressNode(IGraphStore& store, EntityId id)
{
    auto entity = store.FindEntityById(id);
    if (!entity || entity->asset.type != AssetType::IPAddress)
        return std::nullopt;
    return entity;
}

// NS, MX and SRV targets are names; take one hop to their address record
std::optional<Entity> OneMoreName(IGraphStore& store, EntityId name, TimePoint since)
{
    std::vector<Edge> edges;
    if (!store.OutgoingEdges(name, since, kDNSRecordLabel, edges))
        return std::nullopt;

    for (const auto& edge : edges)
    {
        if (IsAddressRecord(edge.relation))
            return AddressNode(store, edge.to);
    }
    return std::nullopt;
}

} // namespace

std::optional<Entity> ResolveAlias(IGraphStore& store, const Entity& alias, TimePoint since,
                                   const CancellationToken* token, ErrorInfo* err)
{
    std::unordered_set<std::string> visited;
    EntityId next = alias.id;

    for (int hop = 0; hop < kMaxAliasHops; ++hop)
    {
        if (token && token->IsCancelled())
            break;

        auto node = store.FindEntityById(next);
        if (!node || !visited.insert(node->asset.Key()).second)
            break;

        std::vector<Edge> edges;
        if (!store.OutgoingEdges(node->id, since, kDNSRecordLabel, edges))
            break;

        bool advanced = false;
        for (const auto& edge : edges)
        {
            if (edge.relation.kind != RelationKind::BasicDNS)
                continue;
            if (IsAddressRecord(edge.relation))
                return AddressNode(store, edge.to);
            if (edge.relation.rr_type == rrtype::CNAME)
            {
                next = edge.to;
                advanced = true;
                break;
            }
        }
        if (!advanced)
            break;
    }

    Fail(err, ErrorKind::TraversalBound, "failed to traverse the aliases", alias.asset.Key());
    return std::nullopt;
}

std::vector<NameAddrPair> NamesToAddrs(IGraphStore& store, TimePoint since, const std::vector<std::string>& names,
                                       const CancellationToken* token)
{
    std::vector<NameAddrPair> results;

    for (const auto& name : names)
    {
        if (token && token->IsCancelled())
            break;

        std::vector<Entity> found;
        if (!store.FindEntityByContent(Asset::FQDN(name), since, found) || found.size() != 1)
            continue;
        const Entity& fqdn = found.front();

        std::vector<Edge> edges;
        if (!store.OutgoingEdges(fqdn.id, since, kDNSRecordLabel, edges))
        {
            PLOG_WARNING << "[Traversal] failed to read DNS records of " << fqdn.asset.value;
            continue;
        }

        for (const auto& edge : edges)
        {
            std::optional<Entity> addr;
            const Relation& rel = edge.relation;

            if (IsAddressRecord(rel))
            {
                addr = AddressNode(store, edge.to);
            }
            else if (rel.kind == RelationKind::BasicDNS && rel.rr_type == rrtype::CNAME)
            {
                auto target = store.FindEntityById(edge.to);
                if (target)
                {
                    ErrorInfo trace;
                    addr = ResolveAlias(store, *target, since, token, &trace);
                    if (!addr)
                        PLOG_DEBUG << "[Traversal] " << fqdn.asset.value << ": " << trace.message;
                }
            }
            else if ((rel.kind == RelationKind::PrefDNS && (rel.rr_type == rrtype::NS || rel.rr_type == rrtype::MX)) ||
                     (rel.kind == RelationKind::SRVDNS && rel.rr_type == rrtype::SRV))
            {
                addr = OneMoreName(store, edge.to, since);
            }

            if (addr)
            {
                results.push_back({ fqdn.asset.CanonicalValue(), addr->asset.CanonicalValue() });
                break;
            }
        }
    }

    return results;
}

std::vector<NameInfrastructure> NamesToInfrastructure(IGraphStore& store, const ASNCache& cache, TimePoint since,
                                                      const std::vector<std::string>& names,
                                                      const CancellationToken* token)
{
    std::vector<NameInfrastructure> results;
    for (auto& pair : NamesToAddrs(store, since, names, token))
    {
        NameInfrastructure entry;
        entry.fqdn = std::move(pair.fqdn);
        entry.addr = std::move(pair.addr);
        if (auto hit = cache.AddrSearch(entry.addr))
        {
            entry.asn = hit->asn;
            entry.netblock = hit->prefix;
            entry.description = hit->description;
        }
        results.push_back(std::move(entry));
    }
    return results;
}

std::vector<std::string> ReadASPrefixes(IGraphStore& store, int asn, TimePoint since)
{
    std::vector<std::string> prefixes;

    std::vector<Entity> found;
    if (!store.FindEntityByContent(Asset::AutonomousSystem(asn), since, found) || found.size() != 1)
        return prefixes;

    std::vector<Edge> edges;
    if (!store.OutgoingEdges(found.front().id, since, kAnnouncesLabel, edges))
        return prefixes;

    for (const auto& edge : edges)
    {
        auto node = store.FindEntityById(edge.to);
        if (node && node->asset.type == AssetType::Netblock)
            prefixes.push_back(node->asset.CanonicalValue());
    }
    return prefixes;
}

std::size_t FillCache(ASNCache& cache, IGraphStore& store, TimePoint since)
{
    std::vector<Entity> systems;
    if (!store.FindEntitiesByType(AssetType::AutonomousSystem, since, systems))
    {
        PLOG_ERROR << "[Traversal] failed to list autonomous systems";
        return 0;
    }

    std::size_t written = 0;
    for (const auto& as : systems)
    {
        const std::string number = as.asset.CanonicalValue();
        int asn = 0;
        auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), asn);
        if (ec != std::errc() || asn <= 0)
            continue;

        std::string description;
        std::vector<Edge> reg;
        if (store.OutgoingEdges(as.id, since, kRegistrationLabel, reg))
        {
            for (const auto& edge : reg)
            {
                auto record = store.FindEntityById(edge.to);
                if (record && record->asset.type == AssetType::AutnumRecord && record->asset.attributes.contains("name") &&
                    record->asset.attributes["name"].is_string())
                {
                    description = record->asset.attributes["name"].get<std::string>();
                    break;
                }
            }
        }

        for (const auto& prefix : ReadASPrefixes(store, asn, since))
        {
            if (cache.Update({ prefix, asn, description }))
                ++written;
        }
    }

    PLOG_DEBUG << "[Traversal] ASN cache filled with " << written << " prefixes";
    return written;
}

} // namespace surveyor::graph
