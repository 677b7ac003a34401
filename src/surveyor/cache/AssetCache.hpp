#pragma once

#include "LRUCache.hpp"
#include "../model/Asset.hpp"
#include "../store/IGraphStore.hpp"
#include "../util/ErrorContext.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace surveyor {

/**
 * @brief Write-through, de-duplicating facade over the graph store
 *
 * The cache is the single authority for "one node per content key" and "one
 * edge per (from, to, relation)". Creates for different keys run in
 * parallel; creates racing on the same key are serialised through a striped
 * lock table, so the loser observes the winner's node instead of inserting
 * a second one.
 *
 * Store failures are logged with the asset or edge they concerned and
 * returned to the caller as ErrorKind::Store.
 */
class AssetCache
{
public:
    static constexpr std::size_t kLockStripes = 64;

    explicit AssetCache(IGraphStore* store, std::size_t capacity = 100000);
    ~AssetCache() = default;

    AssetCache(const AssetCache&) = delete;
    AssetCache& operator=(const AssetCache&) = delete;

    /**
     * @brief Idempotent upsert keyed by the asset's content key
     *
     * A hit on an existing node refreshes its last_seen.
     * @return The node for this key (existing or new); nullopt on store failure
     */
    std::optional<Entity> CreateAsset(const Asset& asset, ErrorInfo* err = nullptr);

    /**
     * @brief Look up an existing node without creating one
     * @return nullopt when absent (err untouched) or on store failure (err set)
     */
    std::optional<Entity> FindAsset(const Asset& asset, TimePoint since = kAnyTime, ErrorInfo* err = nullptr);

    /**
     * @brief Idempotent on (edge.from, edge.to, edge.relation.Key())
     *
     * A hit on an existing edge refreshes its last_seen.
     */
    std::optional<Edge> CreateEdge(const Edge& edge, ErrorInfo* err = nullptr);

    std::optional<Property> CreateEntityProperty(const Entity& entity, const Property& prop,
                                                 ErrorInfo* err = nullptr);
    std::optional<Property> CreateEdgeProperty(const Edge& edge, const Property& prop, ErrorInfo* err = nullptr);

    IGraphStore* Store() const { return store_; }

    // Drops the index; every later call fails with a Store error
    void Close();
    bool IsClosed() const { return closed_.load(std::memory_order_acquire); }

    std::uint64_t Hits() const { return entities_.Hits(); }
    std::uint64_t Misses() const { return entities_.Misses(); }
    std::uint64_t Creates() const { return creates_.load(std::memory_order_relaxed); }

private:
    bool CheckOpen(ErrorInfo* err, const std::string& context) const;
    // Upsert hits stamp last_seen in the store and re-cache the fresh copy
    std::optional<Entity> Refresh(const std::string& key, const Entity& hit, ErrorInfo* err);
    std::optional<Edge> Refresh(const std::string& key, const Edge& hit, ErrorInfo* err);
    std::mutex& StripeFor(const std::string& key);
    static std::string EdgeKey(const Edge& edge);

    IGraphStore* store_;
    LRUCache<std::string, Entity> entities_;
    LRUCache<std::string, Edge> edges_;
    std::array<std::mutex, kLockStripes> stripes_;
    std::atomic<bool> closed_{ false };
    std::atomic<std::uint64_t> creates_{ 0 };
};

} // namespace surveyor
