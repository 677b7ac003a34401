#include "Asset.hpp"

#include "../net/IPAddress.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <utility>

namespace surveyor {

namespace {

constexpr std::array<std::pair<AssetType, const char*>, 13> kAssetTypeNames = {{
    { AssetType::FQDN, "FQDN" },
    { AssetType::IPAddress, "IPAddress" },
    { AssetType::Netblock, "Netblock" },
    { AssetType::AutonomousSystem, "AutonomousSystem" },
    { AssetType::AutnumRecord, "AutnumRecord" },
    { AssetType::IPNetRecord, "IPNetRecord" },
    { AssetType::ContactRecord, "ContactRecord" },
    { AssetType::Organization, "Organization" },
    { AssetType::Person, "Person" },
    { AssetType::Location, "Location" },
    { AssetType::EmailAddress, "EmailAddress" },
    { AssetType::Phone, "Phone" },
    { AssetType::URL, "URL" },
}};

std::string Trim(const std::string& s)
{
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

std::string ToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const char* AssetTypeToString(AssetType type)
{
    for (const auto& [t, name] : kAssetTypeNames)
    {
        if (t == type)
            return name;
    }
    return "Unknown";
}

std::optional<AssetType> AssetTypeFromString(const std::string& name)
{
    for (const auto& [t, n] : kAssetTypeNames)
    {
        if (name == n)
            return t;
    }
    return std::nullopt;
}

std::string NormalizeName(const std::string& name)
{
    std::string n = ToLower(Trim(name));
    while (!n.empty() && n.back() == '.')
        n.pop_back();
    return n;
}

std::string Asset::CanonicalValue() const
{
    switch (type)
    {
    case AssetType::FQDN:
    case AssetType::EmailAddress:
        return NormalizeName(value);
    case AssetType::IPAddress:
        if (auto addr = net::IPAddress::Parse(Trim(value)))
            return addr->ToString();
        return Trim(value);
    case AssetType::Netblock:
        if (auto cidr = net::CIDR::Parse(Trim(value)))
            return cidr->ToString();
        return Trim(value);
    case AssetType::AutonomousSystem:
    {
        std::string v = Trim(value);
        if (v.size() > 2 && (v[0] == 'A' || v[0] == 'a') && (v[1] == 'S' || v[1] == 's'))
            v = v.substr(2);
        long long asn = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), asn);
        if (ec == std::errc() && ptr == v.data() + v.size())
            return std::to_string(asn);
        return v;
    }
    case AssetType::URL:
        return Trim(value);
    default:
        return Trim(value);
    }
}

std::string Asset::Key() const
{
    return std::string(AssetTypeToString(type)) + ":" + CanonicalValue();
}

nlohmann::json Asset::ToJSON() const
{
    return nlohmann::json{
        { "type", AssetTypeToString(type) },
        { "value", CanonicalValue() },
        { "attributes", attributes },
    };
}

Relation Relation::Simple(std::string label)
{
    Relation r;
    r.name = std::move(label);
    r.kind = RelationKind::Simple;
    return r;
}

Relation Relation::BasicDNS(int rr)
{
    Relation r;
    r.name = "dns_record";
    r.kind = RelationKind::BasicDNS;
    r.rr_type = rr;
    return r;
}

Relation Relation::PrefDNS(int rr, int pref)
{
    Relation r;
    r.name = "dns_record";
    r.kind = RelationKind::PrefDNS;
    r.rr_type = rr;
    r.preference = pref;
    return r;
}

Relation Relation::SRVDNS(int prio, int w, int p)
{
    Relation r;
    r.name = "dns_record";
    r.kind = RelationKind::SRVDNS;
    r.rr_type = rrtype::SRV;
    r.priority = prio;
    r.weight = w;
    r.port = p;
    return r;
}

std::string Relation::Key() const
{
    return name + "|" + std::to_string(static_cast<int>(kind)) + "|" + std::to_string(rr_type);
}

} // namespace surveyor
