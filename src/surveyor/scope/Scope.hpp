#pragma once

#include "../model/Asset.hpp"
#include "../net/IPAddress.hpp"

#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace surveyor {

struct Config;

struct ScopeMatch
{
    std::optional<Asset> matched; // the configured root the asset fell under
    int confidence = 0;
};

/**
 * @brief Target set of one enumeration
 *
 * Domain membership is suffix based and case-insensitive: a name is in scope
 * iff it equals a root domain or ends with "." + root. Roots can be added at
 * runtime and are never removed. Safe for concurrent queries and additions.
 */
class Scope
{
public:
    static constexpr int kExactConfidence = 100;
    static constexpr int kContainedConfidence = 90;

    Scope() = default;

    static Scope FromConfig(const Config& cfg);

    Scope(const Scope& other);
    Scope& operator=(const Scope&) = delete;

    ScopeMatch IsAssetInScope(const Asset& asset, int min_confidence) const;

    // Each returns true only when the value was not already present
    bool AddDomain(const std::string& name);
    bool AddAddress(const std::string& addr);
    bool AddCIDR(const std::string& cidr);
    bool AddASN(int asn);
    bool AddPort(int port);

    std::vector<std::string> Domains() const;
    std::vector<std::string> Addresses() const;
    std::vector<std::string> CIDRs() const;
    std::vector<int> ASNs() const;
    std::vector<int> Ports() const;

    bool HasAddressConstraints() const;
    bool HasASNConstraints() const;

private:
    ScopeMatch MatchFQDN(const std::string& name) const;
    ScopeMatch MatchAddress(const std::string& addr) const;
    ScopeMatch MatchNetblock(const std::string& cidr) const;

    mutable std::shared_mutex mutex_;
    std::set<std::string> domains_;
    std::set<std::string> addresses_;
    std::vector<net::CIDR> cidrs_;
    std::set<int> asns_;
    std::set<int> ports_;
};

// Plain string variant of the domain rule, for callers without a Scope
bool DomainNameInScope(const std::string& name, const std::vector<std::string>& domains);

} // namespace surveyor
