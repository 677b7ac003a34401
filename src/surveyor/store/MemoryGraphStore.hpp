#pragma once

#include "IGraphStore.hpp"

#include <atomic>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace surveyor {

/**
 * @brief In-process graph store
 *
 * Default backend for sessions that do not name a database engine, and the
 * store used by the test suite. All state lives in hash maps guarded by one
 * reader/writer lock.
 */
class MemoryGraphStore : public IGraphStore
{
public:
    MemoryGraphStore() = default;
    ~MemoryGraphStore() override = default;

    MemoryGraphStore(const MemoryGraphStore&) = delete;
    MemoryGraphStore& operator=(const MemoryGraphStore&) = delete;

    const char* Name() const override { return "memory"; }

    std::optional<Entity> CreateEntity(const Asset& asset, ErrorInfo* err = nullptr) override;
    std::optional<Edge> CreateEdge(const Relation& relation, EntityId from, EntityId to,
                                   ErrorInfo* err = nullptr) override;
    std::optional<Property> CreateEntityProperty(EntityId entity, const Property& prop,
                                                 ErrorInfo* err = nullptr) override;
    std::optional<Property> CreateEdgeProperty(EdgeId edge, const Property& prop, ErrorInfo* err = nullptr) override;
    std::optional<Entity> TouchEntity(EntityId id, ErrorInfo* err = nullptr) override;
    std::optional<Edge> TouchEdge(EdgeId id, ErrorInfo* err = nullptr) override;

    bool FindEntityByContent(const Asset& asset, TimePoint since, std::vector<Entity>& out,
                             ErrorInfo* err = nullptr) override;
    std::optional<Entity> FindEntityById(EntityId id, ErrorInfo* err = nullptr) override;
    bool FindEntitiesByType(AssetType type, TimePoint since, std::vector<Entity>& out,
                            ErrorInfo* err = nullptr) override;

    bool OutgoingEdges(EntityId entity, TimePoint since, const std::string& label, std::vector<Edge>& out,
                       ErrorInfo* err = nullptr) override;
    bool IncomingEdges(EntityId entity, TimePoint since, const std::string& label, std::vector<Edge>& out,
                       ErrorInfo* err = nullptr) override;
    std::optional<Edge> FindEdgeById(EdgeId id, ErrorInfo* err = nullptr) override;

    bool EntityProperties(EntityId entity, TimePoint since, std::vector<Property>& out,
                          ErrorInfo* err = nullptr) override;
    bool EdgeProperties(EdgeId edge, TimePoint since, std::vector<Property>& out, ErrorInfo* err = nullptr) override;

    bool FindByScope(const std::vector<Asset>& assets, TimePoint since, std::vector<Entity>& out,
                     ErrorInfo* err = nullptr) override;

    bool Close(ErrorInfo* err = nullptr) override;
    bool IsClosed() const override { return closed_.load(std::memory_order_acquire); }

    std::size_t EntityCount() const;
    std::size_t EdgeCount() const;

private:
    bool CheckOpen(ErrorInfo* err) const;
    bool CollectEdges(const std::unordered_map<EntityId, std::vector<EdgeId>>& index, EntityId entity,
                      TimePoint since, const std::string& label, std::vector<Edge>& out) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<EntityId, Entity> entities_;
    std::unordered_multimap<std::string, EntityId> by_key_;
    std::unordered_map<EdgeId, Edge> edges_;
    std::unordered_map<EntityId, std::vector<EdgeId>> outgoing_;
    std::unordered_map<EntityId, std::vector<EdgeId>> incoming_;
    std::unordered_map<EntityId, std::vector<Property>> entity_props_;
    std::unordered_map<EdgeId, std::vector<Property>> edge_props_;

    EntityId next_entity_ = 1;
    EdgeId next_edge_ = 1;
    PropertyId next_property_ = 1;
    std::atomic<bool> closed_{ false };
};

} // namespace surveyor
