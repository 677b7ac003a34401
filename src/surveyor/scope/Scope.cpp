#include "Scope.hpp"
#include "../api/Config.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <charconv>
#include <mutex>

namespace surveyor {

namespace {

// 0 = no match, 1 = subdomain, 2 = exact
int DomainRelation(const std::string& name, const std::string& root)
{
    if (name.empty() || root.empty())
        return 0;
    if (name == root)
        return 2;
    if (name.size() > root.size() && name.compare(name.size() - root.size(), root.size(), root) == 0 &&
        name[name.size() - root.size() - 1] == '.')
        return 1;
    return 0;
}

ScopeMatch Threshold(ScopeMatch m, int min_confidence)
{
    if (m.confidence <= 0 || m.confidence < min_confidence)
        return {};
    return m;
}

} // namespace

Scope Scope::FromConfig(const Config& cfg)
{
    Scope s;
    for (const auto& d : cfg.domains)
        s.AddDomain(d);
    for (const auto& a : cfg.addresses)
    {
        if (!s.AddAddress(a) && !net::IPAddress::Parse(a))
            PLOG_WARNING << "Ignoring invalid scope address: " << a;
    }
    for (const auto& c : cfg.cidrs)
    {
        if (!s.AddCIDR(c) && !net::CIDR::Parse(c))
            PLOG_WARNING << "Ignoring invalid scope CIDR: " << c;
    }
    for (int asn : cfg.asns)
        s.AddASN(asn);
    for (int port : cfg.ports)
        s.AddPort(port);
    return s;
}

Scope::Scope(const Scope& other)
{
    std::shared_lock lock(other.mutex_);
    domains_ = other.domains_;
    addresses_ = other.addresses_;
    cidrs_ = other.cidrs_;
    asns_ = other.asns_;
    ports_ = other.ports_;
}

ScopeMatch Scope::IsAssetInScope(const Asset& asset, int min_confidence) const
{
    switch (asset.type)
    {
    case AssetType::FQDN:
        return Threshold(MatchFQDN(asset.CanonicalValue()), min_confidence);
    case AssetType::IPAddress:
        return Threshold(MatchAddress(asset.CanonicalValue()), min_confidence);
    case AssetType::Netblock:
        return Threshold(MatchNetblock(asset.CanonicalValue()), min_confidence);
    case AssetType::AutonomousSystem:
    {
        const std::string v = asset.CanonicalValue();
        int asn = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), asn);
        if (ec != std::errc() || ptr != v.data() + v.size())
            return {};

        std::shared_lock lock(mutex_);
        if (!asns_.count(asn))
            return {};
        return Threshold(ScopeMatch{ Asset::AutonomousSystem(asn), kExactConfidence }, min_confidence);
    }
    default:
        return {};
    }
}

ScopeMatch Scope::MatchFQDN(const std::string& name) const
{
    std::shared_lock lock(mutex_);
    ScopeMatch best;
    for (const auto& root : domains_)
    {
        const int rel = DomainRelation(name, root);
        if (rel == 2)
            return ScopeMatch{ Asset::FQDN(root), kExactConfidence };
        // Prefer the most specific root among suffix matches
        if (rel == 1 && (!best.matched || root.size() > best.matched->value.size()))
            best = ScopeMatch{ Asset::FQDN(root), kContainedConfidence };
    }
    return best;
}

ScopeMatch Scope::MatchAddress(const std::string& addr) const
{
    auto ip = net::IPAddress::Parse(addr);
    if (!ip)
        return {};

    std::shared_lock lock(mutex_);
    if (addresses_.count(ip->ToString()))
        return ScopeMatch{ Asset::IPAddress(ip->ToString()), kExactConfidence };

    for (const auto& cidr : cidrs_)
    {
        if (cidr.Contains(*ip))
            return ScopeMatch{ Asset::Netblock(cidr.ToString()), kContainedConfidence };
    }
    return {};
}

ScopeMatch Scope::MatchNetblock(const std::string& text) const
{
    auto block = net::CIDR::Parse(text);
    if (!block)
        return {};

    std::shared_lock lock(mutex_);
    ScopeMatch best;
    for (const auto& cidr : cidrs_)
    {
        if (cidr == *block)
            return ScopeMatch{ Asset::Netblock(cidr.ToString()), kExactConfidence };
        if (cidr.Contains(*block) && !best.matched)
            best = ScopeMatch{ Asset::Netblock(cidr.ToString()), kContainedConfidence };
    }
    return best;
}

bool Scope::AddDomain(const std::string& name)
{
    const std::string n = NormalizeName(name);
    if (n.empty())
        return false;

    std::unique_lock lock(mutex_);
    return domains_.insert(n).second;
}

bool Scope::AddAddress(const std::string& addr)
{
    auto ip = net::IPAddress::Parse(addr);
    if (!ip)
        return false;

    std::unique_lock lock(mutex_);
    return addresses_.insert(ip->ToString()).second;
}

bool Scope::AddCIDR(const std::string& text)
{
    auto cidr = net::CIDR::Parse(text);
    if (!cidr)
        return false;

    std::unique_lock lock(mutex_);
    if (std::find(cidrs_.begin(), cidrs_.end(), *cidr) != cidrs_.end())
        return false;
    cidrs_.push_back(*cidr);
    return true;
}

bool Scope::AddASN(int asn)
{
    if (asn <= 0)
        return false;

    std::unique_lock lock(mutex_);
    return asns_.insert(asn).second;
}

bool Scope::AddPort(int port)
{
    if (port <= 0 || port > 65535)
        return false;

    std::unique_lock lock(mutex_);
    return ports_.insert(port).second;
}

std::vector<std::string> Scope::Domains() const
{
    std::shared_lock lock(mutex_);
    return { domains_.begin(), domains_.end() };
}

std::vector<std::string> Scope::Addresses() const
{
    std::shared_lock lock(mutex_);
    return { addresses_.begin(), addresses_.end() };
}

std::vector<std::string> Scope::CIDRs() const
{
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(cidrs_.size());
    for (const auto& c : cidrs_)
        out.push_back(c.ToString());
    return out;
}

std::vector<int> Scope::ASNs() const
{
    std::shared_lock lock(mutex_);
    return { asns_.begin(), asns_.end() };
}

std::vector<int> Scope::Ports() const
{
    std::shared_lock lock(mutex_);
    return { ports_.begin(), ports_.end() };
}

bool Scope::HasAddressConstraints() const
{
    std::shared_lock lock(mutex_);
    return !addresses_.empty() || !cidrs_.empty();
}

bool Scope::HasASNConstraints() const
{
    std::shared_lock lock(mutex_);
    return !asns_.empty();
}

bool DomainNameInScope(const std::string& name, const std::vector<std::string>& domains)
{
    const std::string n = NormalizeName(name);
    for (const auto& d : domains)
    {
        if (DomainRelation(n, NormalizeName(d)) != 0)
            return true;
    }
    return false;
}

} // namespace surveyor
