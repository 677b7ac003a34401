#include <catch2/catch_test_macros.hpp>
#include <surveyor/registry/Registry.hpp>

#include "../utils/RecordingPlugin.hpp"

#include <memory>

using namespace surveyor;
using test_utils::RecordingPlugin;

namespace {

Handler MakeHandler(IPlugin* plugin, const std::string& name, int priority, AssetType type = AssetType::FQDN)
{
    Handler h;
    h.plugin = plugin;
    h.name = name;
    h.priority = priority;
    h.event_type = type;
    h.callback = [](Event&, ErrorInfo*) { return true; };
    return h;
}

std::vector<std::string> Names(const std::vector<HandlerEntryPtr>& entries)
{
    std::vector<std::string> out;
    for (const auto& e : entries)
        out.push_back(e->handler.name);
    return out;
}

// Registers its handler twice and reports success regardless
class CarelessPlugin : public IPlugin
{
public:
    std::string Name() const override { return "Careless"; }

    bool Start(Registry& registry, ErrorInfo*) override
    {
        first = registry.RegisterHandler(MakeHandler(this, "lookup", 5));
        second = registry.RegisterHandler(MakeHandler(this, "lookup", 5), &second_err);
        return true;
    }

    void Stop() override { ++stops; }

    bool first = false;
    bool second = true;
    ErrorInfo second_err;
    int stops = 0;
};

} // namespace

TEST_CASE("Registry - Duplicate handlers are rejected", "[registry]")
{
    Registry registry;
    RecordingPlugin a("A");
    RecordingPlugin b("B");

    REQUIRE(registry.RegisterHandler(MakeHandler(&a, "lookup", 5)));

    ErrorInfo err;
    REQUIRE_FALSE(registry.RegisterHandler(MakeHandler(&a, "lookup", 1), &err));
    REQUIRE(err.kind == ErrorKind::DuplicateHandler);
    REQUIRE(err.details == "A/FQDN/lookup");

    // Same name is fine for another plugin or another event type
    REQUIRE(registry.RegisterHandler(MakeHandler(&b, "lookup", 5)));
    REQUIRE(registry.RegisterHandler(MakeHandler(&a, "lookup", 5, AssetType::IPAddress)));
    REQUIRE(registry.HandlerCount() == 3);
}

TEST_CASE("Registry - Handlers without a callback are invalid", "[registry]")
{
    Registry registry;
    Handler h;
    h.name = "empty";
    ErrorInfo err;
    REQUIRE_FALSE(registry.RegisterHandler(h, &err));
    REQUIRE(err.kind == ErrorKind::InvalidEvent);
    REQUIRE(registry.HandlerCount() == 0);
}

TEST_CASE("Registry - Handlers are ordered by priority then registration", "[registry]")
{
    Registry registry;
    RecordingPlugin p("P");

    registry.RegisterHandler(MakeHandler(&p, "late", 9));
    registry.RegisterHandler(MakeHandler(&p, "first-5", 5));
    registry.RegisterHandler(MakeHandler(&p, "early", 1));
    registry.RegisterHandler(MakeHandler(&p, "second-5", 5));
    registry.RegisterHandler(MakeHandler(&p, "addr", 1, AssetType::IPAddress));

    REQUIRE(Names(registry.HandlersFor(AssetType::FQDN)) ==
            std::vector<std::string>{ "early", "first-5", "second-5", "late" });
    REQUIRE(Names(registry.HandlersFor(AssetType::IPAddress)) == std::vector<std::string>{ "addr" });
    REQUIRE(registry.HandlersFor(AssetType::Organization).empty());
}

TEST_CASE("Registry - Each handler gets its own slots", "[registry]")
{
    Registry registry;
    RecordingPlugin p("P");
    Handler h = MakeHandler(&p, "bounded", 5);
    h.max_instances = 3;
    registry.RegisterHandler(h);
    registry.RegisterHandler(MakeHandler(&p, "default", 5));

    auto entries = registry.HandlersFor(AssetType::FQDN);
    REQUIRE(entries[0]->slots->Max() == 3);
    REQUIRE(entries[1]->slots->Max() == 1);
    REQUIRE(entries[0]->sequence < entries[1]->sequence);
}

TEST_CASE("Registry - Plugin lifecycle", "[registry]")
{
    Registry registry;
    auto good = std::make_shared<RecordingPlugin>("Good");
    good->addHandler({ "names", AssetType::FQDN, 3 });
    good->addHandler({ "addrs", AssetType::IPAddress, 3 });

    auto bad = std::make_shared<RecordingPlugin>("Bad");
    bad->addHandler({ "names", AssetType::FQDN, 1 });
    bad->fail_start = true;

    registry.AddPlugin(good);
    registry.AddPlugin(bad);

    SECTION("A failing plugin is rolled back without affecting others")
    {
        REQUIRE(registry.StartPlugins() == 1);
        REQUIRE(registry.StartedPlugins() == std::vector<std::string>{ "Good" });
        REQUIRE(registry.HandlerCount() == 2);
        REQUIRE(Names(registry.HandlersFor(AssetType::FQDN)) == std::vector<std::string>{ "names" });
        REQUIRE(registry.HandlersFor(AssetType::FQDN).front()->handler.PluginName() == "Good");
    }

    SECTION("Started plugins are not started twice")
    {
        registry.StartPlugins();
        bad->fail_start = false;
        REQUIRE(registry.StartPlugins() == 1);
        REQUIRE(good->starts == 1);
        REQUIRE(bad->starts == 2);
        REQUIRE(registry.HandlerCount() == 3);
    }

    SECTION("Stopping removes every handler")
    {
        registry.StartPlugins();
        registry.StopPlugins();
        REQUIRE(good->stops == 1);
        REQUIRE(bad->stops == 0);
        REQUIRE(registry.HandlerCount() == 0);
        REQUIRE(registry.StartedPlugins().empty());
    }
}

TEST_CASE("Registry - Handlers of a rate-limited source share one limiter", "[registry]")
{
    Registry registry;
    registry.SetSourceRate("CrtSh", 2.0);
    registry.SetSourceRate("Open", 0.0);

    auto crtsh = std::make_shared<RecordingPlugin>("CrtSh");
    crtsh->addHandler({ "names", AssetType::FQDN, 3 });
    crtsh->addHandler({ "addrs", AssetType::IPAddress, 3 });
    auto open = std::make_shared<RecordingPlugin>("Open");
    open->addHandler({ "names", AssetType::FQDN, 4 });

    registry.AddPlugin(crtsh);
    registry.AddPlugin(open);
    REQUIRE(registry.StartPlugins() == 2);

    auto limiter = registry.SourceLimiter("CrtSh");
    REQUIRE(limiter);
    REQUIRE(registry.SourceLimiter("Open") == nullptr);

    auto names = registry.HandlersFor(AssetType::FQDN);
    REQUIRE(names.size() == 2);
    REQUIRE(names[0]->handler.rate_limiter == limiter);
    REQUIRE(names[1]->handler.rate_limiter == nullptr);
    REQUIRE(registry.HandlersFor(AssetType::IPAddress).front()->handler.rate_limiter == limiter);
}

TEST_CASE("Registry - A rejected registration fails plugin start", "[registry]")
{
    Registry registry;
    auto careless = std::make_shared<CarelessPlugin>();
    auto good = std::make_shared<RecordingPlugin>("Good");
    good->addHandler({ "names", AssetType::FQDN, 3 });
    registry.AddPlugin(careless);
    registry.AddPlugin(good);

    REQUIRE(registry.StartPlugins() == 1);

    REQUIRE(careless->first);
    REQUIRE_FALSE(careless->second);
    REQUIRE(careless->second_err.kind == ErrorKind::DuplicateHandler);

    // Its first handler is gone too, and it was told to release what it holds
    REQUIRE(registry.StartedPlugins() == std::vector<std::string>{ "Good" });
    REQUIRE(registry.HandlerCount() == 1);
    REQUIRE(registry.HandlersFor(AssetType::FQDN).front()->handler.PluginName() == "Good");
    REQUIRE(careless->stops == 1);
}
