#pragma once

#include "../model/Asset.hpp"
#include "../util/ErrorContext.hpp"

#include <optional>
#include <string>
#include <vector>

namespace surveyor {

/**
 * @brief Repository interface over the physical asset graph
 *
 * Each call is individually atomic and consistent as of `since`; there are no
 * cross-call transactions. Writes are plain inserts: de-duplication by content
 * key is the AssetCache's job, not the store's.
 *
 * List queries return false only when the store failed; an empty result with
 * a true return means "nothing matched".
 */
class IGraphStore
{
public:
    virtual ~IGraphStore() = default;

    virtual const char* Name() const = 0;

    virtual std::optional<Entity> CreateEntity(const Asset& asset, ErrorInfo* err = nullptr) = 0;
    virtual std::optional<Edge> CreateEdge(const Relation& relation, EntityId from, EntityId to,
                                           ErrorInfo* err = nullptr) = 0;
    virtual std::optional<Property> CreateEntityProperty(EntityId entity, const Property& prop,
                                                         ErrorInfo* err = nullptr) = 0;
    virtual std::optional<Property> CreateEdgeProperty(EdgeId edge, const Property& prop,
                                                       ErrorInfo* err = nullptr) = 0;

    // Stamp last_seen with the current time and return the refreshed record
    virtual std::optional<Entity> TouchEntity(EntityId id, ErrorInfo* err = nullptr) = 0;
    virtual std::optional<Edge> TouchEdge(EdgeId id, ErrorInfo* err = nullptr) = 0;

    virtual bool FindEntityByContent(const Asset& asset, TimePoint since, std::vector<Entity>& out,
                                     ErrorInfo* err = nullptr) = 0;
    virtual std::optional<Entity> FindEntityById(EntityId id, ErrorInfo* err = nullptr) = 0;
    virtual bool FindEntitiesByType(AssetType type, TimePoint since, std::vector<Entity>& out,
                                    ErrorInfo* err = nullptr) = 0;

    // Empty label matches every relation
    virtual bool OutgoingEdges(EntityId entity, TimePoint since, const std::string& label, std::vector<Edge>& out,
                               ErrorInfo* err = nullptr) = 0;
    virtual bool IncomingEdges(EntityId entity, TimePoint since, const std::string& label, std::vector<Edge>& out,
                               ErrorInfo* err = nullptr) = 0;
    virtual std::optional<Edge> FindEdgeById(EdgeId id, ErrorInfo* err = nullptr) = 0;

    virtual bool EntityProperties(EntityId entity, TimePoint since, std::vector<Property>& out,
                                  ErrorInfo* err = nullptr) = 0;
    virtual bool EdgeProperties(EdgeId edge, TimePoint since, std::vector<Property>& out,
                                ErrorInfo* err = nullptr) = 0;

    // FQDN assets match themselves and every subdomain; other types match by content
    virtual bool FindByScope(const std::vector<Asset>& assets, TimePoint since, std::vector<Entity>& out,
                             ErrorInfo* err = nullptr) = 0;

    virtual bool Close(ErrorInfo* err = nullptr) = 0;
    virtual bool IsClosed() const = 0;
};

} // namespace surveyor
