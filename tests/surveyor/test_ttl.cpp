#include <catch2/catch_test_macros.hpp>
#include <surveyor/session/Session.hpp>
#include <surveyor/support/Support.hpp>

#include "../utils/TestSession.hpp"

#include <chrono>
#include <memory>

using namespace surveyor;
using namespace surveyor::support;
using namespace std::chrono_literals;
using test_utils::CountingGraphStore;

namespace {

SessionPtr MakeSession(std::shared_ptr<Config> cfg, CountingGraphStore** store_out = nullptr)
{
    auto session = test_utils::makeSession(std::move(cfg), store_out);
    REQUIRE(session);
    return session;
}

} // namespace

TEST_CASE("TTL - Transformation TTL precedence", "[ttl]")
{
    Config cfg;
    cfg.default_ttl_minutes = 1440;
    cfg.transformation_ttl_minutes["FQDN->IPAddress"] = 60;
    cfg.sources["CrtSh"].ttl_minutes = 15;
    cfg.sources["Slow"].rate_per_second = 1.0;

    REQUIRE(cfg.TransformationTTL(AssetType::FQDN, AssetType::IPAddress, "CrtSh") == 15min);
    REQUIRE(cfg.TransformationTTL(AssetType::FQDN, AssetType::IPAddress, "Slow") == 60min);
    REQUIRE(cfg.TransformationTTL(AssetType::FQDN, AssetType::FQDN, "Slow") == 1440min);
    REQUIRE(cfg.TransformationTTL(AssetType::FQDN, AssetType::FQDN, "Unknown") == 1440min);

    const auto before = Clock::now();
    const auto start = TTLStartTime(cfg, AssetType::FQDN, AssetType::IPAddress, "Slow");
    REQUIRE(start <= before - 60min + 1s);
    REQUIRE(start >= before - 60min - 1s);
}

TEST_CASE("TTL - Monitoring marks expire with the window", "[ttl]")
{
    auto cfg = std::make_shared<Config>();
    cfg->domains = { "example.com" };
    auto session = MakeSession(cfg);

    auto entity = session->Cache().CreateAsset(Asset::FQDN("example.com"));
    REQUIRE(entity);
    const Source crtsh{ "CrtSh", 100 };
    const Source other{ "DNS", 100 };

    const TimePoint window = Clock::now() - 1h;
    REQUIRE_FALSE(AssetMonitoredWithinTTL(*session, *entity, crtsh, window));

    REQUIRE(MarkAssetMonitored(*session, *entity, crtsh));
    REQUIRE(AssetMonitoredWithinTTL(*session, *entity, crtsh, window));

    SECTION("Other sources are unaffected")
    {
        REQUIRE_FALSE(AssetMonitoredWithinTTL(*session, *entity, other, window));
    }

    SECTION("A window starting after the mark is stale")
    {
        REQUIRE_FALSE(AssetMonitoredWithinTTL(*session, *entity, crtsh, Clock::now() + 1min));
    }

    SECTION("Closed sessions never report a fresh mark")
    {
        REQUIRE(session->Delete());
        REQUIRE_FALSE(AssetMonitoredWithinTTL(*session, *entity, crtsh, window));
        ErrorInfo err;
        REQUIRE_FALSE(MarkAssetMonitored(*session, *entity, crtsh, &err));
        REQUIRE(err.kind == ErrorKind::Store);
    }
}

TEST_CASE("TTL - Stored results are reused only from the same source", "[ttl]")
{
    auto cfg = std::make_shared<Config>();
    cfg->domains = { "example.com" };
    auto session = MakeSession(cfg);
    AssetCache& cache = session->Cache();

    const Source crtsh{ "CrtSh", 90 };
    auto www = cache.CreateAsset(Asset::FQDN("www.example.com"));
    auto api = cache.CreateAsset(Asset::FQDN("api.example.com"));
    auto foreign = cache.CreateAsset(Asset::FQDN("www.partner.org"));
    REQUIRE(cache.CreateEntityProperty(*www, crtsh.ToProperty()));
    REQUIRE(cache.CreateEntityProperty(*foreign, crtsh.ToProperty()));
    REQUIRE(cache.CreateEntityProperty(*api, Source{ "DNS", 100 }.ToProperty()));

    const TimePoint window = Clock::now() - 1h;
    auto found = SourceToAssetsWithinTTL(*session, "example.com", AssetType::FQDN, crtsh, window);
    REQUIRE(found.size() == 1);
    REQUIRE(found.front().id == www->id);

    REQUIRE(SourceToAssetsWithinTTL(*session, "example.com", AssetType::FQDN, crtsh, Clock::now() + 1min).empty());

    auto exact = SourceToAssetsWithinTTL(*session, "www.partner.org", AssetType::FQDN, crtsh, window);
    REQUIRE(exact.size() == 1);
    REQUIRE(exact.front().id == foreign->id);
}

TEST_CASE("TTL - Session store is created through the factory", "[ttl]")
{
    auto cfg = std::make_shared<Config>();
    CountingGraphStore* store = nullptr;
    auto session = MakeSession(cfg, &store);
    REQUIRE(store != nullptr);
    REQUIRE(&session->Store() == store);

    auto entity = session->Cache().CreateAsset(Asset::FQDN("example.com"));
    REQUIRE(MarkAssetMonitored(*session, *entity, Source{ "CrtSh", 100 }));
    REQUIRE(store->property_creates == 1);
}
