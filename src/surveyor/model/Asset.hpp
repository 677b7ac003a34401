#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace surveyor {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// A default-constructed TimePoint means "no lower bound" in every query.
inline constexpr TimePoint kAnyTime{};

enum class AssetType
{
    FQDN,
    IPAddress,
    Netblock,
    AutonomousSystem,
    AutnumRecord,
    IPNetRecord,
    ContactRecord,
    Organization,
    Person,
    Location,
    EmailAddress,
    Phone,
    URL
};

const char* AssetTypeToString(AssetType type);
std::optional<AssetType> AssetTypeFromString(const std::string& name);

/**
 * @brief A typed node value in the discovery graph
 *
 * Identity is the content key: type plus canonical value. Attributes carry
 * descriptive data (registration names, netblock kind) and never take part in
 * identity.
 */
struct Asset
{
    AssetType type = AssetType::FQDN;
    std::string value;
    nlohmann::json attributes = nlohmann::json::object();

    Asset() = default;
    Asset(AssetType t, std::string v)
        : type(t), value(std::move(v))
    {
    }

    static Asset FQDN(const std::string& name) { return Asset(AssetType::FQDN, name); }
    static Asset IPAddress(const std::string& addr) { return Asset(AssetType::IPAddress, addr); }
    static Asset Netblock(const std::string& cidr) { return Asset(AssetType::Netblock, cidr); }
    static Asset AutonomousSystem(int asn) { return Asset(AssetType::AutonomousSystem, std::to_string(asn)); }

    // Canonical form of value: lower-cased names, normalised addresses and prefixes
    std::string CanonicalValue() const;

    // "<Type>:<canonical value>"
    std::string Key() const;

    nlohmann::json ToJSON() const;
};

// Lower-case, trim whitespace and a trailing dot
std::string NormalizeName(const std::string& name);

using EntityId = std::uint64_t;
using EdgeId = std::uint64_t;
using PropertyId = std::uint64_t;

struct Entity
{
    EntityId id = 0;
    Asset asset;
    TimePoint created_at{};
    TimePoint last_seen{};
};

enum class RelationKind
{
    Simple,
    BasicDNS, // A, AAAA, CNAME
    PrefDNS,  // NS, MX
    SRVDNS
};

namespace rrtype {
inline constexpr int A = 1;
inline constexpr int NS = 2;
inline constexpr int CNAME = 5;
inline constexpr int MX = 15;
inline constexpr int AAAA = 28;
inline constexpr int SRV = 33;
} // namespace rrtype

struct Relation
{
    std::string name;
    RelationKind kind = RelationKind::Simple;
    int rr_type = 0;
    int preference = 0;
    int priority = 0;
    int weight = 0;
    int port = 0;

    static Relation Simple(std::string label);
    static Relation BasicDNS(int rr);
    static Relation PrefDNS(int rr, int pref);
    static Relation SRVDNS(int prio, int w, int p);

    // name + kind + record type; the idempotency key for edges
    std::string Key() const;
};

struct Edge
{
    EdgeId id = 0;
    Relation relation;
    EntityId from = 0;
    EntityId to = 0;
    TimePoint created_at{};
    TimePoint last_seen{};
};

struct Property
{
    PropertyId id = 0;
    std::string name;
    std::string value;
    int confidence = 0;
    TimePoint created_at{};
};

inline constexpr const char* kSourcePropertyName = "source";

/**
 * @brief Identity of a data source for provenance properties
 */
struct Source
{
    std::string name;
    int confidence = 100;

    Property ToProperty() const
    {
        Property p;
        p.name = kSourcePropertyName;
        p.value = name;
        p.confidence = confidence;
        return p;
    }
};

} // namespace surveyor
