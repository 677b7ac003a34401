#pragma once

#include "../api/Config.hpp"
#include "../model/Asset.hpp"
#include "../registry/Handler.hpp"
#include "../util/ErrorContext.hpp"

#include <optional>
#include <string>
#include <vector>

namespace surveyor {
class Session;
}

/**
 * Helpers shared by handlers: the TTL protocol that decides whether a source
 * has to be queried again, and the routines that fold findings back into the
 * graph and the event stream.
 *
 * A handler typically does:
 *   since = TTLStartTime(cfg, FQDN, FQDN, source.name);
 *   if (AssetMonitoredWithinTTL(session, entity, source, since))
 *       found = SourceToAssetsWithinTTL(session, name, FQDN, source, since);
 *   else { found = query the source...; MarkAssetMonitored(session, entity, source); }
 *   ProcessAssetsWithSource(event, found, source);
 */
namespace surveyor::support {

inline constexpr const char* kMonitoredPropertyName = "last_monitored";

// Oldest timestamp that still counts as fresh for this source and transformation
TimePoint TTLStartTime(const Config& config, AssetType from, AssetType to, const std::string& source);

// Whether `source` queried this entity at or after `since`
bool AssetMonitoredWithinTTL(Session& session, const Entity& entity, const Source& source, TimePoint since);

// Record that `source` has just queried this entity
bool MarkAssetMonitored(Session& session, const Entity& entity, const Source& source, ErrorInfo* err = nullptr);

/**
 * @brief Previously stored results of `source` for `name`
 *
 * For FQDN this covers the name and its subdomains. Only nodes carrying a
 * provenance property of `source` newer than `since` are returned.
 */
std::vector<Entity> SourceToAssetsWithinTTL(Session& session, const std::string& name, AssetType type,
                                            const Source& source, TimePoint since);

/**
 * @brief Attach provenance to each entity and submit it as a new event
 * @return Number of events accepted by the dispatcher
 */
std::size_t ProcessAssetsWithSource(const Event& event, const std::vector<Entity>& entities, const Source& source);

/**
 * @brief Store `to` linked from `from` by `relation`, with provenance, and submit it
 *
 * The target node and the edge are created through the session cache, so
 * repeating a finding never duplicates either.
 *
 * @return The target node; nullopt on store failure
 */
std::optional<Entity> CreateFinding(const Event& event, const Entity& from, const Relation& relation, const Asset& to,
                                    const Source& source, ErrorInfo* err = nullptr);

} // namespace surveyor::support
