#include "ASNCache.hpp"

#include <mutex>

namespace surveyor::graph {

ASNCache::ASNCache()
    : v4_root_(std::make_unique<Node>())
    , v6_root_(std::make_unique<Node>())
{
}

ASNCache::~ASNCache() = default;

bool ASNCache::Update(const ASNCacheEntry& entry)
{
    auto cidr = net::CIDR::Parse(entry.prefix);
    if (!cidr)
        return false;

    ASNCacheEntry stored = entry;
    stored.prefix = cidr->ToString();

    std::unique_lock lock(mutex_);
    Node* node = RootFor(cidr->network.v6);
    for (int i = 0; i < cidr->prefix_len; ++i)
    {
        auto& next = node->child[cidr->network.Bit(i) ? 1 : 0];
        if (!next)
            next = std::make_unique<Node>();
        node = next.get();
    }

    if (!node->entry)
        ++size_;
    node->entry = std::move(stored);
    return true;
}

std::optional<ASNCacheEntry> ASNCache::AddrSearch(const std::string& addr) const
{
    auto ip = net::IPAddress::Parse(addr);
    if (!ip)
        return std::nullopt;

    std::shared_lock lock(mutex_);
    const Node* node = RootFor(ip->v6);
    std::optional<ASNCacheEntry> best = node->entry;
    for (int i = 0; i < ip->BitLength(); ++i)
    {
        node = node->child[ip->Bit(i) ? 1 : 0].get();
        if (!node)
            break;
        if (node->entry)
            best = node->entry;
    }
    return best;
}

void ASNCache::Collect(const Node* node, int asn, std::vector<ASNCacheEntry>& out)
{
    if (!node)
        return;
    if (node->entry && node->entry->asn == asn)
        out.push_back(*node->entry);
    Collect(node->child[0].get(), asn, out);
    Collect(node->child[1].get(), asn, out);
}

std::vector<ASNCacheEntry> ASNCache::ASNSearch(int asn) const
{
    std::vector<ASNCacheEntry> out;
    std::shared_lock lock(mutex_);
    Collect(v4_root_.get(), asn, out);
    Collect(v6_root_.get(), asn, out);
    return out;
}

std::size_t ASNCache::Size() const
{
    std::shared_lock lock(mutex_);
    return size_;
}

} // namespace surveyor::graph
