#pragma once

#include "ASNCache.hpp"
#include "../model/Asset.hpp"
#include "../store/IGraphStore.hpp"
#include "../util/ErrorContext.hpp"

#include <optional>
#include <string>
#include <vector>

namespace surveyor {
class CancellationToken;
}

namespace surveyor::graph {

inline constexpr int kMaxAliasHops = 10;

inline constexpr const char* kDNSRecordLabel = "dns_record";
inline constexpr const char* kAnnouncesLabel = "announces";
inline constexpr const char* kRegistrationLabel = "registration";

struct NameAddrPair
{
    std::string fqdn;
    std::string addr;
};

// Where a discovered name lands: its address and the announcing AS, if known
struct NameInfrastructure
{
    std::string fqdn;
    std::string addr;
    int asn = 0; // 0 when no announced prefix covers addr
    std::string netblock;
    std::string description;
};

/**
 * @brief Resolve names already in the graph to one address each
 *
 * For every name with exactly one FQDN node the outgoing dns_record edges are
 * tried in order and the first that yields an address wins:
 *   A / AAAA      the target address
 *   CNAME         follow the alias chain (see ResolveAlias)
 *   NS / MX, SRV  one more hop from the target name to an A / AAAA record
 * Names that resolve to nothing produce no pair. Unknown names are skipped.
 */
std::vector<NameAddrPair> NamesToAddrs(IGraphStore& store, TimePoint since, const std::vector<std::string>& names,
                                       const CancellationToken* token = nullptr);

/**
 * @brief Join NamesToAddrs with the longest announced prefix of each address
 *
 * Every resolved name yields one entry. Addresses outside every cached prefix
 * keep asn 0 and an empty netblock.
 */
std::vector<NameInfrastructure> NamesToInfrastructure(IGraphStore& store, const ASNCache& cache, TimePoint since,
                                                      const std::vector<std::string>& names,
                                                      const CancellationToken* token = nullptr);

/**
 * @brief Follow CNAME edges from `alias` until an A / AAAA record is reached
 *
 * Walks at most kMaxAliasHops nodes and never revisits one. A repeated node,
 * the hop cap or cancellation stops the walk with ErrorKind::TraversalBound.
 *
 * @return The IPAddress node the chain ends at
 */
std::optional<Entity> ResolveAlias(IGraphStore& store, const Entity& alias, TimePoint since,
                                   const CancellationToken* token = nullptr, ErrorInfo* err = nullptr);

// Netblocks the AS announces, in canonical CIDR form
std::vector<std::string> ReadASPrefixes(IGraphStore& store, int asn, TimePoint since);

/**
 * @brief Load every announced prefix in the graph into the ASN cache
 *
 * The description of each entry is the `name` attribute of the AS's
 * registration record, or empty when there is none.
 *
 * @return Number of entries written
 */
std::size_t FillCache(ASNCache& cache, IGraphStore& store, TimePoint since);

} // namespace surveyor::graph
