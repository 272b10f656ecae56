#include <catch2/catch.hpp>

#include "fake_engine.hpp"
#include "mdns_session/session_registry.hpp"
#include "record_builders.hpp"

#include <functional>

using namespace mdns_session;

namespace {

std::vector<Record> FullAnnouncement()
{
    return {
        test::Ptr(test::kType, test::kInstance),
        test::Srv(test::kInstance, test::kHost, 7350),
        test::Txt(test::kInstance, {{"version", "1.0"}}),
        test::A(test::kHost, "192.168.1.20"),
    };
}

AdvertiseRequest GameServer(const std::string& instance = "Game Server A")
{
    AdvertiseRequest request;
    request.instance_name = instance;
    request.service_type = "_mygame._tcp.local.";
    request.port = 7350;
    request.txt = {{"version", "1.0"}};
    return request;
}

ErrorCode CodeOf(const std::function<void()>& call)
{
    try {
        call();
    } catch (const Error& e) {
        return e.code();
    }
    FAIL("expected mdns_session::Error");
    return ErrorCode::EngineUnavailable;
}

}

TEST_CASE("Registry: browse delivers resolved services", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();

    const auto handle = registry.StartBrowse(owner, "_MyGame._tcp.local.");
    REQUIRE(registry.IsBrowsing(owner));
    REQUIRE(engine->subscriptions.at(engine->last_subscription).service_type == "_mygame._tcp.local.");
    REQUIRE(registry.PollBrowse(handle).empty());

    REQUIRE(engine->Deliver(FullAnnouncement()));
    const auto events = registry.PollBrowse(handle);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].kind == ServiceEventKind::Discovered);
    REQUIRE(events[0].service.instance_name == "Game Server A");
    REQUIRE(registry.PollBrowse(handle).empty());
}

TEST_CASE("Registry: restarting a browse makes the old session stale", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();

    const auto first = registry.StartBrowse(owner, test::kType);
    const auto firstSubscription = engine->last_subscription;
    const auto second = registry.StartBrowse(owner, test::kType);

    REQUIRE(second.generation > first.generation);
    REQUIRE(engine->unsubscribed == std::vector<SubscriptionId>{firstSubscription});

    // The worker may still push for the old subscription before it sees the unsubscribe
    auto& old = engine->subscriptions.at(firstSubscription);
    REQUIRE(old.sink->Push(RecordBatch{old.generation, FullAnnouncement()}));

    REQUIRE(registry.PollBrowse(first).empty());
    REQUIRE(registry.PollBrowse(second).empty());

    REQUIRE(engine->Deliver(FullAnnouncement()));
    REQUIRE(registry.PollBrowse(second).size() == 1);
}

TEST_CASE("Registry: an invalid service type leaves the running browse alone", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();
    const auto handle = registry.StartBrowse(owner, test::kType);

    REQUIRE(CodeOf([&] { registry.StartBrowse(owner, "_mygame._tcp.local"); }) == ErrorCode::InvalidServiceType);
    REQUIRE(registry.IsBrowsing(owner));
    REQUIRE(engine->unsubscribed.empty());

    REQUIRE(engine->Deliver(FullAnnouncement()));
    REQUIRE(registry.PollBrowse(handle).size() == 1);
}

TEST_CASE("Registry: stop is idempotent and ignores stale handles", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();

    const auto first = registry.StartBrowse(owner, test::kType);
    const auto second = registry.StartBrowse(owner, test::kType);

    registry.StopBrowse(first);
    REQUIRE(registry.IsBrowsing(owner));

    registry.StopBrowse(second);
    registry.StopBrowse(second);
    REQUIRE_FALSE(registry.IsBrowsing(owner));
    REQUIRE(engine->unsubscribed.size() == 2);
    REQUIRE(registry.PollBrowse(second).empty());
}

TEST_CASE("Registry: queue overflow is reported until the browse restarts", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    RegistrySettings settings;
    settings.max_pending_batches = 2;
    SessionRegistry registry(engine, settings);
    const auto owner = registry.NewOwner();
    const auto handle = registry.StartBrowse(owner, test::kType);

    REQUIRE(engine->Deliver(FullAnnouncement()));
    REQUIRE(engine->Deliver(FullAnnouncement()));
    REQUIRE_FALSE(engine->Deliver(FullAnnouncement()));

    REQUIRE(CodeOf([&] { registry.PollBrowse(handle); }) == ErrorCode::QueueOverflow);
    REQUIRE(CodeOf([&] { registry.PollBrowse(handle); }) == ErrorCode::QueueOverflow);

    const auto restarted = registry.StartBrowse(owner, test::kType);
    REQUIRE(engine->Deliver(FullAnnouncement()));
    REQUIRE(registry.PollBrowse(restarted).size() == 1);
}

TEST_CASE("Registry: engine failures propagate and leave the slot idle", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();

    engine->fail_with = ErrorCode::MulticastBlocked;
    REQUIRE(CodeOf([&] { registry.StartBrowse(owner, test::kType); }) == ErrorCode::MulticastBlocked);
    REQUIRE_FALSE(registry.IsBrowsing(owner));
    REQUIRE(IsEngineUnavailable(ErrorCode::MulticastBlocked));

    engine->fail_with = ErrorCode::EngineUnavailable;
    REQUIRE(CodeOf([&] { registry.Advertise(owner, GameServer()); }) == ErrorCode::EngineUnavailable);
    REQUIRE_FALSE(registry.IsAdvertising(owner));
}

TEST_CASE("Registry: advertise reports the registration lifecycle", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();

    const auto handle = registry.Advertise(owner, GameServer());
    REQUIRE(registry.IsAdvertising(owner));
    REQUIRE(registry.RegisteredFullName(handle) == "Game Server A._mygame._tcp.local.");
    REQUIRE(registry.PollAdvertise(handle).state == RegistrationState::Pending);

    const auto& request = engine->registrations.at(engine->last_registration).request;
    REQUIRE(request.port == 7350);
    REQUIRE(request.txt == TxtMap{{"version", "1.0"}});

    engine->Report(RegistrationState::Registered);
    REQUIRE(registry.PollAdvertise(handle).state == RegistrationState::Registered);
    // The last known state sticks between polls
    REQUIRE(registry.PollAdvertise(handle).state == RegistrationState::Registered);

    registry.Unadvertise(handle);
    REQUIRE_FALSE(registry.IsAdvertising(owner));
    REQUIRE(registry.RegisteredFullName(handle).empty());
    REQUIRE(registry.PollAdvertise(handle).state == RegistrationState::Unregistered);
    REQUIRE(engine->unregistered.size() == 1);

    registry.Unadvertise(handle);
    REQUIRE(engine->unregistered.size() == 1);
}

TEST_CASE("Registry: a name conflict shows up as a failed registration", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();
    const auto handle = registry.Advertise(owner, GameServer());

    engine->Report(RegistrationState::Failed, ErrorCode::NameConflict);
    const auto status = registry.PollAdvertise(handle);
    REQUIRE(status.state == RegistrationState::Failed);
    REQUIRE(status.error == ErrorCode::NameConflict);
}

TEST_CASE("Registry: re-advertising replaces the previous record", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();

    const auto first = registry.Advertise(owner, GameServer("Game Server A"));
    const auto firstRegistration = engine->last_registration;
    const auto second = registry.Advertise(owner, GameServer("Game Server B"));

    REQUIRE(engine->unregistered == std::vector<RegistrationId>{firstRegistration});
    REQUIRE(registry.RegisteredFullName(first).empty());
    REQUIRE(registry.RegisteredFullName(second) == "Game Server B._mygame._tcp.local.");
}

TEST_CASE("Registry: invalid advertise requests leave the running record alone", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();
    const auto handle = registry.Advertise(owner, GameServer());

    auto badPort = GameServer();
    badPort.port = 0;
    REQUIRE(CodeOf([&] { registry.Advertise(owner, badPort); }) == ErrorCode::InvalidPort);

    auto badName = GameServer("Game.Server");
    REQUIRE(CodeOf([&] { registry.Advertise(owner, badName); }) == ErrorCode::InvalidInstanceName);

    auto badType = GameServer();
    badType.service_type = "_mygame._tcp.local";
    REQUIRE(CodeOf([&] { registry.Advertise(owner, badType); }) == ErrorCode::InvalidServiceType);

    auto badTxt = GameServer();
    badTxt.txt = {{"", "x"}};
    REQUIRE(CodeOf([&] { registry.Advertise(owner, badTxt); }) == ErrorCode::InvalidTxtKey);

    auto longTxt = GameServer();
    longTxt.txt = {{"k", std::string(300, 'v')}};
    REQUIRE(CodeOf([&] { registry.Advertise(owner, longTxt); }) == ErrorCode::EntryTooLong);

    REQUIRE(engine->unregistered.empty());
    REQUIRE(registry.RegisteredFullName(handle) == "Game Server A._mygame._tcp.local.");
}

TEST_CASE("Registry: owners have independent slots", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto host = registry.NewOwner();
    const auto client = registry.NewOwner();
    REQUIRE(host != client);

    registry.Advertise(host, GameServer());
    const auto browse = registry.StartBrowse(client, test::kType);

    REQUIRE(registry.IsAdvertising(host));
    REQUIRE_FALSE(registry.IsBrowsing(host));
    REQUIRE(registry.IsBrowsing(client));
    REQUIRE_FALSE(registry.IsAdvertising(client));

    registry.StopBrowse(browse);
    REQUIRE(registry.IsAdvertising(host));
}

TEST_CASE("Registry: StopAll stops every session and the engine", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto a = registry.NewOwner();
    const auto b = registry.NewOwner();
    registry.StartBrowse(a, test::kType);
    registry.Advertise(b, GameServer());

    registry.StopAll();

    REQUIRE_FALSE(registry.IsBrowsing(a));
    REQUIRE_FALSE(registry.IsAdvertising(b));
    REQUIRE(engine->unsubscribed.size() == 1);
    REQUIRE(engine->unregistered.size() == 1);
    REQUIRE(engine->shutdowns == 1);
}

TEST_CASE("Registry: a browse reports the engine stopping under it", "[unit][registry]") {
    auto engine = std::make_shared<test::FakeEngine>();
    SessionRegistry registry(engine);
    const auto owner = registry.NewOwner();
    const auto handle = registry.StartBrowse(owner, test::kType);
    REQUIRE(registry.PollBrowse(handle).empty());

    // The worker died, e.g. select() failed
    engine->running = false;
    REQUIRE(CodeOf([&] { registry.PollBrowse(handle); }) == ErrorCode::EngineUnavailable);
    REQUIRE(CodeOf([&] { registry.PollBrowse(handle); }) == ErrorCode::EngineUnavailable);
    REQUIRE(registry.IsBrowsing(owner));

    const auto restarted = registry.StartBrowse(owner, test::kType);
    REQUIRE(engine->Running());
    REQUIRE(engine->Deliver(FullAnnouncement()));
    REQUIRE(registry.PollBrowse(restarted).size() == 1);
}
