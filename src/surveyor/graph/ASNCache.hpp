#pragma once

#include "../net/IPAddress.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace surveyor::graph {

struct ASNCacheEntry
{
    std::string prefix; // canonical CIDR text
    int asn = 0;
    std::string description;
};

/**
 * @brief Prefix -> autonomous system index with longest-prefix lookup
 *
 * One binary trie per address family, walked bit by bit from the most
 * significant bit. Update() replaces the entry stored at an identical prefix.
 */
class ASNCache
{
public:
    ASNCache();
    ~ASNCache();

    ASNCache(const ASNCache&) = delete;
    ASNCache& operator=(const ASNCache&) = delete;

    // Returns false when entry.prefix does not parse
    bool Update(const ASNCacheEntry& entry);

    // Most specific prefix containing addr
    std::optional<ASNCacheEntry> AddrSearch(const std::string& addr) const;

    // Every prefix recorded for asn, in no particular order
    std::vector<ASNCacheEntry> ASNSearch(int asn) const;

    std::size_t Size() const;

private:
    struct Node
    {
        std::array<std::unique_ptr<Node>, 2> child;
        std::optional<ASNCacheEntry> entry;
    };

    Node* RootFor(bool v6) const { return v6 ? v6_root_.get() : v4_root_.get(); }
    static void Collect(const Node* node, int asn, std::vector<ASNCacheEntry>& out);

    mutable std::shared_mutex mutex_;
    std::unique_ptr<Node> v4_root_;
    std::unique_ptr<Node> v6_root_;
    std::size_t size_ = 0;
};

} // namespace surveyor::graph
