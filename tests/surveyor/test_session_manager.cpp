#include <catch2/catch_test_macros.hpp>
#include <surveyor/engine/Dispatcher.hpp>
#include <surveyor/session/SessionManager.hpp>

#include "../utils/RecordingPlugin.hpp"
#include "../utils/TestSession.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace surveyor;
using namespace std::chrono_literals;
using test_utils::CountingGraphStore;
using test_utils::RecordingPlugin;
using SteadyClock = std::chrono::steady_clock;

namespace {

struct StoreTracker
{
    std::atomic<CountingGraphStore*> last{ nullptr };
    std::atomic<bool> refuse{ false };

    GraphStoreFactory factory()
    {
        return [this](const DatabaseSelection&, ErrorInfo*) -> std::unique_ptr<IGraphStore> {
            if (refuse)
                return nullptr;
            auto store = std::make_unique<CountingGraphStore>();
            last = store.get();
            return store;
        };
    }
};

} // namespace

TEST_CASE("SessionManager - Session bookkeeping", "[session_manager]")
{
    StoreTracker tracker;
    SessionManager manager(10ms, tracker.factory());

    auto session = manager.NewSession(test_utils::scopedConfig({ "example.com" }));
    REQUIRE(session);
    REQUIRE(manager.Size() == 1);
    REQUIRE(manager.GetSession(session->ID()) == session);
    REQUIRE(session->State() == SessionState::Active);
    REQUIRE(std::filesystem::is_directory(session->TmpDir()));
    REQUIRE(session->GetScope().Domains() == std::vector<std::string>{ "example.com" });
    REQUIRE(session->Database().system == "memory");

    SECTION("Ids are unique")
    {
        auto second = manager.NewSession(test_utils::scopedConfig({ "example.org" }));
        REQUIRE(second);
        REQUIRE(second->ID() != session->ID());
        REQUIRE(manager.SessionIds().size() == 2);
    }

    SECTION("Re-adding a session is rejected")
    {
        ErrorInfo err;
        REQUIRE_FALSE(manager.AddSession(session, &err));
        REQUIRE(err.kind == ErrorKind::Configuration);
        REQUIRE_FALSE(manager.AddSession(nullptr, &err));
        REQUIRE(err.kind == ErrorKind::InvalidEvent);
    }

    SECTION("Unknown ids")
    {
        ErrorInfo err;
        REQUIRE(manager.GetSession("no-such-session", &err) == nullptr);
        REQUIRE(err.kind == ErrorKind::SessionNotFound);

        ErrorInfo cancel_err;
        REQUIRE_FALSE(manager.CancelSession("no-such-session", &cancel_err));
        REQUIRE(cancel_err.kind == ErrorKind::SessionNotFound);
        REQUIRE(manager.Size() == 1);
    }

    SECTION("Shutdown cancels everything")
    {
        manager.Shutdown();
        REQUIRE(manager.Size() == 0);
        REQUIRE(session->State() == SessionState::Terminated);
        REQUIRE(tracker.last.load()->close_calls == 1);
    }
}

TEST_CASE("SessionManager - Session creation failures", "[session_manager]")
{
    StoreTracker tracker;
    SessionManager manager(10ms, tracker.factory());

    SECTION("No primary database")
    {
        auto cfg = test_utils::scopedConfig({ "example.com" });
        DatabaseConfig db;
        db.system = "postgres";
        db.primary = false;
        cfg->databases.push_back(db);

        ErrorInfo err;
        REQUIRE(manager.NewSession(cfg, &err) == nullptr);
        REQUIRE(err.kind == ErrorKind::Configuration);
    }

    SECTION("Store cannot be opened")
    {
        tracker.refuse = true;
        ErrorInfo err;
        REQUIRE(manager.NewSession(test_utils::scopedConfig({ "example.com" }), &err) == nullptr);
        REQUIRE(err.kind == ErrorKind::Configuration);
        REQUIRE(err.message == "failed to initialize database store");
    }

    REQUIRE(manager.Size() == 0);
}

TEST_CASE("SessionManager - CancelSession waits for in-flight work", "[session_manager]")
{
    Registry registry;
    auto plugin = std::make_shared<RecordingPlugin>("Slow");
    std::atomic<bool> finished{ false };
    plugin->addHandler({ "slow", AssetType::FQDN, 1, 0, {}, [&finished](Event&, ErrorInfo*) {
                            std::this_thread::sleep_for(300ms);
                            finished = true;
                            return true;
                        } });
    plugin->addHandler({ "after", AssetType::FQDN, 2 });
    registry.AddPlugin(plugin);
    registry.StartPlugins();

    StoreTracker tracker;
    SessionManager manager(10ms, tracker.factory());
    auto session = manager.NewSession(test_utils::scopedConfig({ "example.com" }));
    REQUIRE(session);
    CountingGraphStore* store = tracker.last.load();
    const auto tmp = session->TmpDir();

    // One callback thread keeps "after" queued behind "slow"
    Dispatcher dispatcher(registry, 1, 1);
    dispatcher.Start();

    auto entity = session->Cache().CreateAsset(Asset::FQDN("www.example.com"));
    REQUIRE(dispatcher.DispatchEvent({ *entity, session, &dispatcher }));
    while (plugin->callCount() == 0)
        std::this_thread::sleep_for(1ms);

    const auto begin = SteadyClock::now();
    ErrorInfo err;
    REQUIRE(manager.CancelSession(session->ID(), &err));
    const auto elapsed = SteadyClock::now() - begin;

    REQUIRE(finished.load());
    REQUIRE(elapsed >= 100ms);
    REQUIRE(session->Stats().Snapshot().Quiescent());
    REQUIRE(plugin->calls() == std::vector<std::string>{ "slow:www.example.com" });

    REQUIRE(session->State() == SessionState::Terminated);
    REQUIRE(manager.GetSession(session->ID()) == nullptr);
    REQUIRE(store->close_calls == 1);
    REQUIRE_FALSE(std::filesystem::exists(tmp));

    ErrorInfo after;
    REQUIRE_FALSE(dispatcher.DispatchEvent({ *entity, session, &dispatcher }, &after));
    REQUIRE(after.kind == ErrorKind::Cancelled);
}

TEST_CASE("SessionManager - Store close failures are reported", "[session_manager]")
{
    StoreTracker tracker;
    SessionManager manager(10ms, tracker.factory());
    auto session = manager.NewSession(test_utils::scopedConfig({ "example.com" }));
    REQUIRE(session);
    tracker.last.load()->fail_close = true;

    ErrorInfo err;
    REQUIRE_FALSE(manager.CancelSession(session->ID(), &err));
    REQUIRE(err.kind == ErrorKind::Store);
    REQUIRE(err.message == "injected close failure");

    // The session is gone regardless
    REQUIRE(manager.Size() == 0);
    REQUIRE(session->State() == SessionState::Terminated);

    // A second delete is a no-op
    REQUIRE(session->Delete());
}
