#include <catch2/catch_test_macros.hpp>
#include <surveyor/api/Config.hpp>
#include <surveyor/scope/Scope.hpp>

#include <thread>
#include <vector>

using namespace surveyor;

TEST_CASE("Scope - FQDN suffix matching", "[scope]")
{
    Scope scope;
    REQUIRE(scope.AddDomain("Example.com."));

    SECTION("Exact root scores 100")
    {
        auto m = scope.IsAssetInScope(Asset::FQDN("example.com"), 0);
        REQUIRE(m.confidence == 100);
        REQUIRE(m.matched);
        REQUIRE(m.matched->value == "example.com");
    }

    SECTION("Subdomain scores 90 and reports the root")
    {
        auto m = scope.IsAssetInScope(Asset::FQDN("a.b.EXAMPLE.com"), 0);
        REQUIRE(m.confidence == 90);
        REQUIRE(m.matched->value == "example.com");
    }

    SECTION("Lookalike suffix is not a subdomain")
    {
        REQUIRE(scope.IsAssetInScope(Asset::FQDN("badexample.com"), 0).confidence == 0);
        REQUIRE(scope.IsAssetInScope(Asset::FQDN("example.com.evil.org"), 0).confidence == 0);
    }

    SECTION("Score below the threshold is reported as zero")
    {
        auto m = scope.IsAssetInScope(Asset::FQDN("www.example.com"), 95);
        REQUIRE(m.confidence == 0);
        REQUIRE_FALSE(m.matched);
        REQUIRE(scope.IsAssetInScope(Asset::FQDN("example.com"), 95).confidence == 100);
    }

    SECTION("Most specific root wins")
    {
        scope.AddDomain("dev.example.com");
        auto m = scope.IsAssetInScope(Asset::FQDN("api.dev.example.com"), 0);
        REQUIRE(m.matched->value == "dev.example.com");
    }
}

TEST_CASE("Scope - AddDomain is idempotent", "[scope]")
{
    Scope scope;
    REQUIRE(scope.AddDomain("example.com"));
    REQUIRE_FALSE(scope.AddDomain("EXAMPLE.COM"));
    REQUIRE_FALSE(scope.AddDomain("example.com."));
    REQUIRE_FALSE(scope.AddDomain("   "));
    REQUIRE(scope.Domains().size() == 1);

    REQUIRE(scope.IsAssetInScope(Asset::FQDN("partner.org"), 0).confidence == 0);
    REQUIRE(scope.AddDomain("partner.org"));
    REQUIRE(scope.IsAssetInScope(Asset::FQDN("mail.partner.org"), 0).confidence == 90);
}

TEST_CASE("Scope - Addresses, netblocks and ASNs", "[scope]")
{
    Scope scope;
    REQUIRE(scope.AddAddress("192.0.2.10"));
    REQUIRE(scope.AddCIDR("198.51.100.0/24"));
    REQUIRE(scope.AddCIDR("2001:db8::/32"));
    REQUIRE(scope.AddASN(64500));
    REQUIRE_FALSE(scope.AddAddress("not-an-ip"));
    REQUIRE_FALSE(scope.AddASN(0));
    REQUIRE_FALSE(scope.AddPort(70000));
    REQUIRE(scope.AddPort(443));

    REQUIRE(scope.IsAssetInScope(Asset::IPAddress("192.0.2.10"), 0).confidence == 100);
    REQUIRE(scope.IsAssetInScope(Asset::IPAddress("198.51.100.7"), 0).confidence == 90);
    REQUIRE(scope.IsAssetInScope(Asset::IPAddress("2001:db8::1"), 0).confidence == 90);
    REQUIRE(scope.IsAssetInScope(Asset::IPAddress("203.0.113.1"), 0).confidence == 0);

    REQUIRE(scope.IsAssetInScope(Asset::Netblock("198.51.100.0/24"), 0).confidence == 100);
    REQUIRE(scope.IsAssetInScope(Asset::Netblock("198.51.100.128/25"), 0).confidence == 90);
    REQUIRE(scope.IsAssetInScope(Asset::Netblock("198.51.0.0/16"), 0).confidence == 0);

    REQUIRE(scope.IsAssetInScope(Asset::AutonomousSystem(64500), 0).confidence == 100);
    REQUIRE(scope.IsAssetInScope(Asset::AutonomousSystem(64501), 0).confidence == 0);

    REQUIRE(scope.IsAssetInScope(Asset(AssetType::Organization, "Example Inc"), 0).confidence == 0);

    REQUIRE(scope.HasAddressConstraints());
    REQUIRE(scope.HasASNConstraints());
}

TEST_CASE("Scope - Built from configuration", "[scope]")
{
    Config cfg;
    cfg.domains = {"example.com", "Example.org"};
    cfg.addresses = {"192.0.2.1", "bogus"};
    cfg.cidrs = {"10.0.0.0/8"};
    cfg.asns = {64496};

    Scope scope = Scope::FromConfig(cfg);
    REQUIRE(scope.Domains().size() == 2);
    REQUIRE(scope.Addresses().size() == 1);
    REQUIRE(scope.CIDRs() == std::vector<std::string>{"10.0.0.0/8"});
    REQUIRE(scope.IsAssetInScope(Asset::FQDN("www.example.org"), 0).confidence == 90);
}

TEST_CASE("Scope - Concurrent additions and queries", "[scope]")
{
    Scope scope;
    scope.AddDomain("example.com");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&scope, t]() {
            for (int i = 0; i < 200; ++i)
            {
                scope.AddDomain("d" + std::to_string(i % 50) + ".test");
                (void)scope.IsAssetInScope(Asset::FQDN("www.example.com"), 0);
                (void)t;
            }
        });
    }
    for (auto& th : threads)
        th.join();

    REQUIRE(scope.Domains().size() == 51);
}

TEST_CASE("Scope - DomainNameInScope on plain lists", "[scope]")
{
    std::vector<std::string> roots = {"example.com", "Partner.ORG"};
    REQUIRE(DomainNameInScope("www.example.com", roots));
    REQUIRE(DomainNameInScope("partner.org.", roots));
    REQUIRE_FALSE(DomainNameInScope("notexample.com", roots));
}
