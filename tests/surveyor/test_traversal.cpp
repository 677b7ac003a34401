#include <catch2/catch_test_macros.hpp>
#include <surveyor/graph/Traversal.hpp>
#include <surveyor/session/CancellationToken.hpp>
#include <surveyor/store/MemoryGraphStore.hpp>

#include "../utils/TestSession.hpp"

#include <algorithm>

using namespace surveyor;
using namespace surveyor::graph;

namespace {

Entity Node(MemoryGraphStore& store, const Asset& asset)
{
    auto e = store.CreateEntity(asset);
    REQUIRE(e);
    return *e;
}

void Link(MemoryGraphStore& store, const Entity& from, const Relation& rel, const Entity& to)
{
    REQUIRE(store.CreateEdge(rel, from.id, to.id));
}

Relation Record(int rr)
{
    return Relation::BasicDNS(rr);
}

// Builds name0 -CNAME-> name1 -> ... -> name<aliases>, and name<aliases> -A-> 192.0.2.1
Entity CNAMEChain(MemoryGraphStore& store, int aliases)
{
    std::vector<Entity> names;
    for (int i = 0; i <= aliases; ++i)
        names.push_back(Node(store, Asset::FQDN("n" + std::to_string(i) + ".example.com")));
    for (int i = 0; i < aliases; ++i)
        Link(store, names[i], Record(rrtype::CNAME), names[i + 1]);
    Link(store, names.back(), Record(rrtype::A), Node(store, Asset::IPAddress("192.0.2.1")));
    return names.front();
}

} // namespace

TEST_CASE("Traversal - NamesToAddrs direct records", "[traversal]")
{
    MemoryGraphStore store;
    auto www = Node(store, Asset::FQDN("www.example.com"));
    auto v6 = Node(store, Asset::FQDN("v6.example.com"));
    Link(store, www, Record(rrtype::A), Node(store, Asset::IPAddress("192.0.2.10")));
    Link(store, v6, Record(rrtype::AAAA), Node(store, Asset::IPAddress("2001:db8::10")));
    Node(store, Asset::FQDN("bare.example.com"));

    auto pairs = NamesToAddrs(store, kAnyTime, { "www.example.com", "v6.example.com", "bare.example.com",
                                                 "unknown.example.com" });
    REQUIRE(pairs.size() == 2);
    REQUIRE(pairs[0].fqdn == "www.example.com");
    REQUIRE(pairs[0].addr == "192.0.2.10");
    REQUIRE(pairs[1].fqdn == "v6.example.com");
    REQUIRE(pairs[1].addr == "2001:db8::10");
}

TEST_CASE("Traversal - NamesToAddrs follows aliases", "[traversal]")
{
    MemoryGraphStore store;
    auto www = Node(store, Asset::FQDN("www.example.com"));
    auto cdn = Node(store, Asset::FQDN("edge.cdn.example.net"));
    Link(store, www, Record(rrtype::CNAME), cdn);
    Link(store, cdn, Record(rrtype::A), Node(store, Asset::IPAddress("198.51.100.5")));

    auto pairs = NamesToAddrs(store, kAnyTime, { "www.example.com" });
    REQUIRE(pairs.size() == 1);
    REQUIRE(pairs[0].addr == "198.51.100.5");
}

TEST_CASE("Traversal - NamesToAddrs takes one hop through MX, NS and SRV", "[traversal]")
{
    MemoryGraphStore store;
    auto mail_target = Node(store, Asset::FQDN("mx1.example.com"));
    Link(store, mail_target, Record(rrtype::A), Node(store, Asset::IPAddress("192.0.2.25")));

    auto mx = Node(store, Asset::FQDN("mail.example.com"));
    Link(store, mx, Relation::PrefDNS(rrtype::MX, 10), mail_target);

    auto ns = Node(store, Asset::FQDN("zone.example.com"));
    Link(store, ns, Relation::PrefDNS(rrtype::NS, 0), mail_target);

    auto srv = Node(store, Asset::FQDN("_sip._tcp.example.com"));
    Link(store, srv, Relation::SRVDNS(10, 5, 5060), mail_target);

    auto pairs = NamesToAddrs(store, kAnyTime, { "mail.example.com", "zone.example.com", "_sip._tcp.example.com" });
    REQUIRE(pairs.size() == 3);
    for (const auto& p : pairs)
        REQUIRE(p.addr == "192.0.2.25");
}

TEST_CASE("Traversal - ResolveAlias bounds", "[traversal]")
{
    MemoryGraphStore store;

    SECTION("Chain within the hop limit resolves")
    {
        auto head = CNAMEChain(store, kMaxAliasHops - 1);
        ErrorInfo err;
        auto addr = ResolveAlias(store, head, kAnyTime, nullptr, &err);
        REQUIRE(addr);
        REQUIRE(addr->asset.value == "192.0.2.1");
        REQUIRE_FALSE(err);
    }

    SECTION("Chain longer than the hop limit fails")
    {
        auto head = CNAMEChain(store, kMaxAliasHops);
        ErrorInfo err;
        REQUIRE_FALSE(ResolveAlias(store, head, kAnyTime, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::TraversalBound);
        REQUIRE(err.message == "failed to traverse the aliases");
    }

    SECTION("Cycle terminates with an error")
    {
        auto a = Node(store, Asset::FQDN("a.example.com"));
        auto b = Node(store, Asset::FQDN("b.example.com"));
        Link(store, a, Record(rrtype::CNAME), b);
        Link(store, b, Record(rrtype::CNAME), a);

        ErrorInfo err;
        REQUIRE_FALSE(ResolveAlias(store, a, kAnyTime, nullptr, &err));
        REQUIRE(err.kind == ErrorKind::TraversalBound);

        REQUIRE(NamesToAddrs(store, kAnyTime, { "a.example.com" }).empty());
    }

    SECTION("Cancellation stops the walk")
    {
        auto head = CNAMEChain(store, 3);
        CancellationToken token;
        token.Cancel();
        ErrorInfo err;
        REQUIRE_FALSE(ResolveAlias(store, head, kAnyTime, &token, &err));
        REQUIRE(err.kind == ErrorKind::TraversalBound);
    }
}

TEST_CASE("Traversal - ReadASPrefixes and FillCache", "[traversal]")
{
    MemoryGraphStore store;
    auto as = Node(store, Asset::AutonomousSystem(64500));
    Link(store, as, Relation::Simple(kAnnouncesLabel), Node(store, Asset::Netblock("192.0.2.0/24")));
    Link(store, as, Relation::Simple(kAnnouncesLabel), Node(store, Asset::Netblock("2001:db8::/32")));

    Asset record(AssetType::AutnumRecord, "AS64500");
    record.attributes["name"] = "EXAMPLE-NET";
    Link(store, as, Relation::Simple(kRegistrationLabel), Node(store, record));

    auto lonely = Node(store, Asset::AutonomousSystem(64501));
    Link(store, lonely, Relation::Simple(kAnnouncesLabel), Node(store, Asset::Netblock("203.0.113.0/24")));

    auto prefixes = ReadASPrefixes(store, 64500, kAnyTime);
    std::sort(prefixes.begin(), prefixes.end());
    REQUIRE(prefixes == std::vector<std::string>{ "192.0.2.0/24", "2001:db8::/32" });
    REQUIRE(ReadASPrefixes(store, 65000, kAnyTime).empty());

    ASNCache cache;
    REQUIRE(FillCache(cache, store, kAnyTime) == 3);

    auto hit = cache.AddrSearch("192.0.2.77");
    REQUIRE(hit);
    REQUIRE(hit->asn == 64500);
    REQUIRE(hit->description == "EXAMPLE-NET");

    auto other = cache.AddrSearch("203.0.113.9");
    REQUIRE(other);
    REQUIRE(other->asn == 64501);
    REQUIRE(other->description.empty());
}

TEST_CASE("Traversal - Session ASN index joins names to announcing systems", "[traversal]")
{
    auto session = test_utils::makeSession(test_utils::scopedConfig({ "example.com" }));
    REQUIRE(session);
    IGraphStore& store = session->Store();

    auto add = [&store](const Asset& asset) {
        auto e = store.CreateEntity(asset);
        REQUIRE(e);
        return *e;
    };

    auto as = add(Asset::AutonomousSystem(64500));
    REQUIRE(store.CreateEdge(Relation::Simple(kAnnouncesLabel), as.id, add(Asset::Netblock("192.0.2.0/24")).id));
    REQUIRE(store.CreateEdge(Relation::Simple(kAnnouncesLabel), as.id, add(Asset::Netblock("192.0.2.128/25")).id));
    Asset record(AssetType::AutnumRecord, "AS64500");
    record.attributes["name"] = "EXAMPLE-NET";
    REQUIRE(store.CreateEdge(Relation::Simple(kRegistrationLabel), as.id, add(record).id));

    auto www = add(Asset::FQDN("www.example.com"));
    auto api = add(Asset::FQDN("api.example.com"));
    auto off = add(Asset::FQDN("off.example.com"));
    REQUIRE(store.CreateEdge(Record(rrtype::A), www.id, add(Asset::IPAddress("192.0.2.10")).id));
    REQUIRE(store.CreateEdge(Record(rrtype::A), api.id, add(Asset::IPAddress("192.0.2.200")).id));
    REQUIRE(store.CreateEdge(Record(rrtype::A), off.id, add(Asset::IPAddress("198.51.100.7")).id));

    auto& asns = session->ASNs();
    REQUIRE(asns.Size() == 2);
    REQUIRE(&session->ASNs() == &asns);

    auto hit = asns.AddrSearch("192.0.2.200");
    REQUIRE(hit);
    REQUIRE(hit->prefix == "192.0.2.128/25");

    auto entries = NamesToInfrastructure(session->Store(), session->ASNs(), kAnyTime,
                                         { "www.example.com", "api.example.com", "off.example.com" });
    REQUIRE(entries.size() == 3);

    REQUIRE(entries[0].fqdn == "www.example.com");
    REQUIRE(entries[0].addr == "192.0.2.10");
    REQUIRE(entries[0].asn == 64500);
    REQUIRE(entries[0].netblock == "192.0.2.0/24");
    REQUIRE(entries[0].description == "EXAMPLE-NET");

    REQUIRE(entries[1].netblock == "192.0.2.128/25");

    REQUIRE(entries[2].addr == "198.51.100.7");
    REQUIRE(entries[2].asn == 0);
    REQUIRE(entries[2].netblock.empty());

    ErrorInfo err;
    REQUIRE(session->Delete(&err));
}
